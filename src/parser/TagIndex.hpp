#pragma once
#include <string>
#include <vector>
#include <optional>

namespace LinkPreview {

// Read-only lookup view over the <meta>, <link> and <title> elements of one
// HTML document. The parse tree is released once the index is built.
class TagIndex {
public:
    // Never throws on malformed markup; an unparseable document yields an empty index.
    static TagIndex Build(const std::string& html);

    // Content of the first meta whose property equals key, else of the first
    // meta whose name equals key. Trimmed; nullopt when missing or blank.
    std::optional<std::string> FindMeta(const std::string& key) const;

    // href of the first link whose rel equals rel_value (token-wise, case-insensitive).
    std::optional<std::string> FindLink(const std::string& rel_value) const;

    // href of the first link whose rel token list contains token.
    std::optional<std::string> FindLinkWithRelToken(const std::string& token) const;

    std::optional<std::string> Title() const;

    bool Empty() const { return metas_.empty() && links_.empty() && title_.empty(); }
    size_t MetaCount() const { return metas_.size(); }
    size_t LinkCount() const { return links_.size(); }

private:
    struct MetaTag {
        std::string property;    // lowercased, trimmed
        std::string name;        // lowercased, trimmed
        std::string content;     // trimmed
    };

    struct LinkTag {
        std::vector<std::string> rel_tokens; // lowercased
        std::string href;                    // trimmed
    };

    std::vector<MetaTag> metas_;
    std::vector<LinkTag> links_;
    std::string title_;
};

}
