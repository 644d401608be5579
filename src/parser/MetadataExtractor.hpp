#pragma once
#include <string>
#include <vector>
#include <optional>

namespace LinkPreview {
    // Link-preview metadata for one page. Absent values are nullopt, never "".
    // URL-valued fields (image, video_url, audio_url, canonical_url, favicon) are absolute.
    struct Metadata {
        std::string url;
        std::optional<std::string> title;
        std::optional<std::string> description;
        std::optional<std::string> image;
        std::optional<std::string> site_name;
        std::optional<std::string> type;
        std::optional<std::string> locale;
        std::optional<std::string> author;
        std::optional<std::string> publisher;
        std::optional<std::string> published_time;
        std::optional<std::string> modified_time;
        std::optional<std::string> video_url;
        std::optional<std::string> audio_url;
        std::optional<std::string> duration;
        std::optional<std::string> twitter_handle;
        std::optional<std::string> twitter_card;
        std::optional<std::string> canonical_url;
        std::optional<std::string> favicon;
        std::optional<std::string> theme_color;
        std::optional<std::vector<std::string>> keywords;
    };

    class MetadataExtractor {
    public:
        // Never fails: missing fields stay nullopt, url is always page_url verbatim.
        // content_type is the response header; its charset (or the document's
        // <meta charset>) selects the encoding the bytes are decoded from.
        static Metadata Extract(const std::string& html_content, const std::string& page_url,
                                const std::string& content_type = std::string());

        // "a, b ,, c" -> {"a", "b", "c"}; nullopt when nothing non-blank remains.
        static std::optional<std::vector<std::string>> SplitKeywords(const std::string& raw);
    };
}
