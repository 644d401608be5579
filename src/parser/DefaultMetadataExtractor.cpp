#include "DefaultMetadataExtractor.hpp"
#include "MetadataExtractor.hpp"

namespace LinkPreview {

Metadata DefaultMetadataExtractor::Extract(const std::string& html_content, const std::string& page_url,
                                           const std::string& content_type) {
    return MetadataExtractor::Extract(html_content, page_url, content_type);
}

}
