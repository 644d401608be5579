#include "MetadataExtractor.hpp"
#include "Charset.hpp"
#include "TagIndex.hpp"
#include "../utils/StringUtil.hpp"
#include "../utils/UrlUtil.hpp"
#include <initializer_list>

namespace {

using LinkPreview::TagIndex;

// First key in priority order with a non-blank value.
std::optional<std::string> first_meta(const TagIndex& index, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (auto value = index.FindMeta(key)) return value;
    }
    return std::nullopt;
}

std::optional<std::string> first_of(std::initializer_list<std::optional<std::string>> candidates) {
    for (const auto& candidate : candidates) {
        if (candidate && !candidate->empty()) return candidate;
    }
    return std::nullopt;
}

// Relative references become absolute against the page URL; anything that
// cannot be made absolute is dropped.
std::optional<std::string> resolve(const std::string& page_url, const std::optional<std::string>& candidate) {
    if (!candidate) return std::nullopt;
    auto resolved = LinkPreview::UrlUtil::ResolveAgainst(page_url, *candidate);
    if (!resolved || resolved->empty() || !LinkPreview::UrlUtil::HasScheme(*resolved)) return std::nullopt;
    return resolved;
}

} // anonymous namespace

namespace LinkPreview {

std::optional<std::vector<std::string>> MetadataExtractor::SplitKeywords(const std::string& raw) {
    std::vector<std::string> keywords;
    size_t start = 0;
    while (start <= raw.size()) {
        size_t comma = raw.find(',', start);
        if (comma == std::string::npos) comma = raw.size();
        std::string piece = StringUtil::Trim(raw.substr(start, comma - start));
        if (!piece.empty()) keywords.push_back(std::move(piece));
        start = comma + 1;
    }
    if (keywords.empty()) return std::nullopt;
    return keywords;
}

Metadata MetadataExtractor::Extract(const std::string& html_content, const std::string& page_url,
                                    const std::string& content_type) {
    Metadata meta;
    meta.url = page_url;

    const std::string utf8 = Charset::ToUtf8(html_content, Charset::Detect(html_content, content_type));
    const TagIndex index = TagIndex::Build(utf8);
    if (index.Empty()) return meta;

    meta.title = first_of({first_meta(index, {"og:title", "twitter:title"}), index.Title()});
    meta.description = first_meta(index, {"og:description", "twitter:description", "description"});
    meta.image = resolve(page_url, first_meta(index, {"og:image", "twitter:image"}));
    meta.site_name = index.FindMeta("og:site_name");
    meta.type = index.FindMeta("og:type");
    meta.locale = index.FindMeta("og:locale");

    meta.author = first_meta(index, {"article:author", "author"});
    meta.publisher = first_meta(index, {"article:publisher", "publisher"});
    meta.published_time = first_meta(index, {"article:published_time", "og:published_time", "date"});
    meta.modified_time = first_meta(index, {"article:modified_time", "og:updated_time"});

    meta.video_url = resolve(page_url, first_meta(index, {"og:video:url", "og:video", "og:video:secure_url"}));
    meta.audio_url = resolve(page_url, first_meta(index, {"og:audio:url", "og:audio"}));
    meta.duration = first_meta(index, {"og:video:duration", "video:duration"});

    meta.twitter_handle = first_meta(index, {"twitter:creator", "twitter:site"});
    meta.twitter_card = index.FindMeta("twitter:card");

    meta.canonical_url = resolve(page_url, first_of({index.FindLink("canonical"), index.FindMeta("og:url")}));
    meta.favicon = resolve(page_url, first_of({
        index.FindLink("icon"),
        index.FindLink("shortcut icon"),
        index.FindLink("apple-touch-icon"),
        index.FindLinkWithRelToken("icon")
    }));
    meta.theme_color = index.FindMeta("theme-color");

    if (auto raw_keywords = index.FindMeta("keywords")) {
        meta.keywords = SplitKeywords(*raw_keywords);
    }

    return meta;
}

}
