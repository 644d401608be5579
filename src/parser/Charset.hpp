#pragma once
#include <string>

namespace LinkPreview {
namespace Charset {

// Unquoted value of the charset parameter of a Content-Type header; "" when absent.
std::string FromContentType(const std::string& content_type);

// Encoding label declared by <meta charset> or <meta http-equiv="Content-Type">
// within the first 1024 bytes; "" when none.
std::string PrescanMeta(const std::string& html);

// Canonical encoding name for a fetched document. Order: byte order mark,
// Content-Type charset, meta prescan, then UTF-8. Unknown labels are skipped.
std::string Detect(const std::string& html, const std::string& content_type);

// Transcodes html from the named encoding to UTF-8 and strips a byte order
// mark. Malformed sequences become U+FFFD. UTF-8 and unknown labels are
// returned unchanged apart from the BOM.
std::string ToUtf8(const std::string& html, const std::string& encoding);

}
}
