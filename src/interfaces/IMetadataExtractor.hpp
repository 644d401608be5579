#pragma once
#include <string>
#include "../parser/MetadataExtractor.hpp"

namespace LinkPreview {

class IMetadataExtractor {
public:
    virtual ~IMetadataExtractor() = default;
    virtual Metadata Extract(const std::string& html_content, const std::string& page_url,
                             const std::string& content_type) = 0;
};

}
