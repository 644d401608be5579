#include "Charset.hpp"
#include "../utils/StringUtil.hpp"
#include <lexbor/encoding/encoding.h>
#include <lexbor/html/encoding.h>
#include <algorithm>

namespace {

constexpr size_t kPrescanBytes = 1024;

const lxb_char_t* as_lxb(const std::string& s) {
    return reinterpret_cast<const lxb_char_t*>(s.data());
}

// nullptr for unknown labels and for the replacement encoding.
const lxb_encoding_data_t* lookup(const std::string& label) {
    if (label.empty()) return nullptr;
    const lxb_encoding_data_t* data = lxb_encoding_data_by_pre_name(as_lxb(label), label.size());
    if (!data || data->encoding == LXB_ENCODING_REPLACEMENT) return nullptr;
    return data;
}

std::string name_of(const lxb_encoding_data_t* data) {
    return reinterpret_cast<const char*>(data->name);
}

const char* encoding_from_bom(const std::string& html) {
    if (html.size() >= 3 && html.compare(0, 3, "\xEF\xBB\xBF") == 0) return "UTF-8";
    if (html.size() >= 2 && html.compare(0, 2, "\xFE\xFF") == 0) return "UTF-16BE";
    if (html.size() >= 2 && html.compare(0, 2, "\xFF\xFE") == 0) return "UTF-16LE";
    return nullptr;
}

size_t bom_length(const std::string& html, lxb_encoding_t encoding) {
    switch (encoding) {
        case LXB_ENCODING_UTF_8:
            return html.compare(0, 3, "\xEF\xBB\xBF") == 0 ? 3 : 0;
        case LXB_ENCODING_UTF_16BE:
            return html.compare(0, 2, "\xFE\xFF") == 0 ? 2 : 0;
        case LXB_ENCODING_UTF_16LE:
            return html.compare(0, 2, "\xFF\xFE") == 0 ? 2 : 0;
        default:
            return 0;
    }
}

class PrescanGuard {
public:
    PrescanGuard() { ok_ = lxb_html_encoding_init(&em_) == LXB_STATUS_OK; }
    ~PrescanGuard() { lxb_html_encoding_destroy(&em_, false); }
    PrescanGuard(const PrescanGuard&) = delete;
    PrescanGuard& operator=(const PrescanGuard&) = delete;

    bool ok() const { return ok_; }
    lxb_html_encoding_t* get() { return &em_; }

private:
    lxb_html_encoding_t em_{};
    bool ok_ = false;
};

} // anonymous namespace

namespace LinkPreview {
namespace Charset {

std::string FromContentType(const std::string& content_type) {
    size_t pos = content_type.find(';');
    while (pos != std::string::npos) {
        const size_t next = content_type.find(';', pos + 1);
        const std::string param = content_type.substr(pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1);
        pos = next;

        const size_t eq = param.find('=');
        if (eq == std::string::npos) continue;
        if (!StringUtil::EqualsIgnoreCase(StringUtil::Trim(param.substr(0, eq)), "charset")) continue;

        std::string value = StringUtil::Trim(param.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        return StringUtil::Trim(value);
    }
    return "";
}

std::string PrescanMeta(const std::string& html) {
    PrescanGuard em;
    if (!em.ok()) return "";

    const lxb_char_t* begin = as_lxb(html);
    const lxb_char_t* end = begin + std::min(html.size(), kPrescanBytes);
    if (lxb_html_encoding_determine(em.get(), begin, end) != LXB_STATUS_OK) return "";

    lxb_html_encoding_entry_t* entry = lxb_html_encoding_meta_entry(em.get(), 0);
    if (!entry || !entry->name || entry->end < entry->name) return "";
    return std::string(reinterpret_cast<const char*>(entry->name), static_cast<size_t>(entry->end - entry->name));
}

std::string Detect(const std::string& html, const std::string& content_type) {
    if (const char* bom = encoding_from_bom(html)) return bom;

    if (const lxb_encoding_data_t* declared = lookup(FromContentType(content_type))) {
        return name_of(declared);
    }

    if (const lxb_encoding_data_t* meta = lookup(PrescanMeta(html))) {
        // A meta declaration cannot select UTF-16: the bytes it was read from were ASCII-compatible.
        if (meta->encoding == LXB_ENCODING_UTF_16BE || meta->encoding == LXB_ENCODING_UTF_16LE) return "UTF-8";
        if (meta->encoding == LXB_ENCODING_X_USER_DEFINED) return "windows-1252";
        return name_of(meta);
    }
    return "UTF-8";
}

std::string ToUtf8(const std::string& html, const std::string& encoding) {
    const lxb_encoding_data_t* from = lookup(encoding);
    if (!from) return html;

    const size_t skip = bom_length(html, from->encoding);
    if (from->encoding == LXB_ENCODING_UTF_8) {
        return skip ? html.substr(skip) : html;
    }

    const lxb_encoding_data_t* to = lxb_encoding_data(LXB_ENCODING_UTF_8);
    lxb_codepoint_t codepoints[1024];
    lxb_char_t bytes[4096];
    lxb_encoding_decode_t decode;
    lxb_encoding_encode_t encode;

    if (lxb_encoding_decode_init(&decode, from, codepoints, sizeof(codepoints) / sizeof(codepoints[0])) != LXB_STATUS_OK ||
        lxb_encoding_encode_init(&encode, to, bytes, sizeof(bytes)) != LXB_STATUS_OK ||
        lxb_encoding_decode_replace_set(&decode, LXB_ENCODING_REPLACEMENT_BUFFER, LXB_ENCODING_REPLACEMENT_BUFFER_LEN) != LXB_STATUS_OK) {
        return html;
    }

    std::string out;
    out.reserve(html.size() + html.size() / 2);

    // Encodes the decoded code points collected so far and empties the buffer.
    auto flush = [&]() {
        const lxb_codepoint_t* cp = codepoints;
        const lxb_codepoint_t* cp_end = codepoints + lxb_encoding_decode_buf_used(&decode);
        while (cp < cp_end) {
            const lxb_status_t status = to->encode(&encode, &cp, cp_end);
            out.append(reinterpret_cast<const char*>(bytes), lxb_encoding_encode_buf_used(&encode));
            lxb_encoding_encode_buf_used_set(&encode, 0);
            if (status != LXB_STATUS_OK && status != LXB_STATUS_SMALL_BUFFER) break;
        }
        lxb_encoding_decode_buf_used_set(&decode, 0);
    };

    const lxb_char_t* data = as_lxb(html) + skip;
    const lxb_char_t* end = as_lxb(html) + html.size();
    lxb_status_t status;
    do {
        status = from->decode(&decode, &data, end);
        if (status != LXB_STATUS_OK && status != LXB_STATUS_SMALL_BUFFER) return html;
        flush();
    } while (status == LXB_STATUS_SMALL_BUFFER);

    // A truncated trailing sequence becomes U+FFFD.
    lxb_encoding_decode_finish(&decode);
    flush();
    return out;
}

}
}
