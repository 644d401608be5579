#include "TagIndex.hpp"
#include "../utils/StringUtil.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <memory>
#include <cstring>

namespace {

struct DocumentDeleter {
    void operator()(lxb_html_document_t* document) const {
        lxb_html_document_destroy(document);
    }
};
using DocumentPtr = std::unique_ptr<lxb_html_document_t, DocumentDeleter>;

struct CollectionDeleter {
    void operator()(lxb_dom_collection_t* collection) const {
        lxb_dom_collection_destroy(collection, true);
    }
};
using CollectionPtr = std::unique_ptr<lxb_dom_collection_t, CollectionDeleter>;

std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

std::string get_attribute_value(lxb_dom_element_t* element, const char* key) {
    size_t len = 0;
    const lxb_char_t* value = lxb_dom_element_get_attribute(element, reinterpret_cast<const lxb_char_t*>(key), strlen(key), &len);
    return to_std_string(value, len);
}

// Collects every element named tag below the document element, in document order.
CollectionPtr collect_elements(lxb_dom_document_t* dom_doc, const char* tag) {
    CollectionPtr col(lxb_dom_collection_make(dom_doc, 16));
    if (!col) return col;
    lxb_dom_element_t* root = lxb_dom_document_element(dom_doc);
    if (!root) return CollectionPtr();
    lxb_status_t status = lxb_dom_elements_by_tag_name(root, col.get(), reinterpret_cast<const lxb_char_t*>(tag), strlen(tag));
    if (status != LXB_STATUS_OK) return CollectionPtr();
    return col;
}

std::optional<std::string> non_blank(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

} // anonymous namespace

namespace LinkPreview {

TagIndex TagIndex::Build(const std::string& html) {
    TagIndex index;

    DocumentPtr document(lxb_html_document_create());
    if (!document) return index;

    lxb_status_t status = lxb_html_document_parse(document.get(),
        reinterpret_cast<const lxb_char_t*>(html.data()),
        html.size());
    if (status != LXB_STATUS_OK) return index;

    {
        size_t tlen = 0;
        const lxb_char_t* t = lxb_html_document_title(document.get(), &tlen);
        index.title_ = StringUtil::Trim(to_std_string(t, tlen));
    }

    lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document.get());

    if (auto metas = collect_elements(dom_doc, "meta")) {
        const size_t count = lxb_dom_collection_length(metas.get());
        index.metas_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            lxb_dom_element_t* el = lxb_dom_collection_element(metas.get(), i);
            if (!el) continue;
            MetaTag tag;
            tag.property = StringUtil::ToLowerAscii(StringUtil::Trim(get_attribute_value(el, "property")));
            tag.name = StringUtil::ToLowerAscii(StringUtil::Trim(get_attribute_value(el, "name")));
            if (tag.property.empty() && tag.name.empty()) continue;
            tag.content = StringUtil::Trim(get_attribute_value(el, "content"));
            index.metas_.push_back(std::move(tag));
        }
    }

    if (auto links = collect_elements(dom_doc, "link")) {
        const size_t count = lxb_dom_collection_length(links.get());
        index.links_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            lxb_dom_element_t* el = lxb_dom_collection_element(links.get(), i);
            if (!el) continue;
            LinkTag tag;
            tag.rel_tokens = StringUtil::SplitWhitespace(StringUtil::ToLowerAscii(get_attribute_value(el, "rel")));
            if (tag.rel_tokens.empty()) continue;
            tag.href = StringUtil::Trim(get_attribute_value(el, "href"));
            index.links_.push_back(std::move(tag));
        }
    }

    return index;
}

std::optional<std::string> TagIndex::FindMeta(const std::string& key) const {
    const std::string wanted = StringUtil::ToLowerAscii(key);

    for (const auto& tag : metas_) {
        if (tag.property == wanted) {
            if (auto content = non_blank(tag.content)) return content;
            break;
        }
    }
    for (const auto& tag : metas_) {
        if (tag.name == wanted) {
            return non_blank(tag.content);
        }
    }
    return std::nullopt;
}

std::optional<std::string> TagIndex::FindLink(const std::string& rel_value) const {
    const auto wanted = StringUtil::SplitWhitespace(StringUtil::ToLowerAscii(rel_value));
    if (wanted.empty()) return std::nullopt;

    for (const auto& link : links_) {
        if (link.rel_tokens == wanted) {
            return non_blank(link.href);
        }
    }
    return std::nullopt;
}

std::optional<std::string> TagIndex::FindLinkWithRelToken(const std::string& token) const {
    const std::string wanted = StringUtil::ToLowerAscii(token);

    for (const auto& link : links_) {
        for (const auto& t : link.rel_tokens) {
            if (t == wanted) return non_blank(link.href);
        }
    }
    return std::nullopt;
}

std::optional<std::string> TagIndex::Title() const {
    return non_blank(title_);
}

}
