#pragma once
#include "../interfaces/IMetadataExtractor.hpp"

namespace LinkPreview {

class DefaultMetadataExtractor : public IMetadataExtractor {
public:
    Metadata Extract(const std::string& html_content, const std::string& page_url,
                     const std::string& content_type) override;
};

}
