#include "UrlUtil.hpp"
#include "StringUtil.hpp"
#include <cctype>

namespace LinkPreview {
namespace UrlUtil {

static inline bool IsValidScheme(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    for (unsigned char c : s) {
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return true;
}

static inline bool starts_with(const std::string& s, size_t pos, const char* pfx) {
    return s.compare(pos, std::char_traits<char>::length(pfx), pfx) == 0;
}

UrlParts Split(const std::string& url) {
    UrlParts parts;
    size_t pos = 0;

    // scheme ":" only counts when it precedes any of "/?#"
    auto colon = url.find(':');
    auto first_delim = url.find_first_of("/?#");
    if (colon != std::string::npos && colon > 0 && (first_delim == std::string::npos || colon < first_delim)) {
        std::string scheme = url.substr(0, colon);
        if (IsValidScheme(scheme)) {
            parts.scheme = StringUtil::ToLowerAscii(scheme);
            pos = colon + 1;
        }
    }

    if (starts_with(url, pos, "//")) {
        parts.has_authority = true;
        pos += 2;
        auto end = url.find_first_of("/?#", pos);
        if (end == std::string::npos) end = url.size();
        parts.authority = url.substr(pos, end - pos);
        pos = end;
    }

    auto path_end = url.find_first_of("?#", pos);
    if (path_end == std::string::npos) path_end = url.size();
    parts.path = url.substr(pos, path_end - pos);
    pos = path_end;

    if (pos < url.size() && url[pos] == '?') {
        parts.has_query = true;
        auto hash = url.find('#', pos + 1);
        if (hash == std::string::npos) hash = url.size();
        parts.query = url.substr(pos + 1, hash - pos - 1);
        pos = hash;
    }

    if (pos < url.size() && url[pos] == '#') {
        parts.has_fragment = true;
        parts.fragment = url.substr(pos + 1);
    }
    return parts;
}

std::string Recompose(const UrlParts& parts) {
    std::string out;
    if (!parts.scheme.empty()) {
        out += parts.scheme;
        out += ':';
    }
    if (parts.has_authority) {
        out += "//";
        out += parts.authority;
    }
    out += parts.path;
    if (parts.has_query) {
        out += '?';
        out += parts.query;
    }
    if (parts.has_fragment) {
        out += '#';
        out += parts.fragment;
    }
    return out;
}

std::string RemoveDotSegments(const std::string& path) {
    std::string input = path;
    std::string output;
    output.reserve(path.size());

    auto drop_last_segment = [&output]() {
        auto slash = output.find_last_of('/');
        if (slash == std::string::npos) output.clear();
        else output.erase(slash);
    };

    while (!input.empty()) {
        if (starts_with(input, 0, "../")) {
            input.erase(0, 3);
        } else if (starts_with(input, 0, "./")) {
            input.erase(0, 2);
        } else if (starts_with(input, 0, "/./")) {
            input.erase(0, 2);
        } else if (input == "/.") {
            input = "/";
        } else if (starts_with(input, 0, "/../")) {
            input.erase(0, 3);
            drop_last_segment();
        } else if (input == "/..") {
            input = "/";
            drop_last_segment();
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            size_t seg_end = input.find('/', input[0] == '/' ? 1 : 0);
            if (seg_end == std::string::npos) seg_end = input.size();
            output.append(input, 0, seg_end);
            input.erase(0, seg_end);
        }
    }
    return output;
}

std::string HostOf(const std::string& authority) {
    std::string host = authority;
    auto at = host.find_last_of('@');
    if (at != std::string::npos) host.erase(0, at + 1);
    if (!host.empty() && host[0] == '[') {
        auto close = host.find(']');
        if (close == std::string::npos) return {};
        return host.substr(1, close - 1);
    }
    auto colon = host.find(':');
    if (colon != std::string::npos) host.erase(colon);
    return host;
}

static inline bool HasValidPort(const std::string& authority) {
    std::string host_port = authority;
    auto at = host_port.find_last_of('@');
    if (at != std::string::npos) host_port.erase(0, at + 1);
    size_t search_from = 0;
    if (!host_port.empty() && host_port[0] == '[') {
        auto close = host_port.find(']');
        if (close == std::string::npos) return false;
        search_from = close + 1;
        if (search_from < host_port.size() && host_port[search_from] != ':') return false;
    }
    auto colon = host_port.find(':', search_from);
    if (colon == std::string::npos) return true;
    std::string port = host_port.substr(colon + 1);
    if (port.empty()) return true; // "host:" is allowed by RFC 3986
    if (port.size() > 5) return false;
    for (unsigned char c : port) {
        if (!std::isdigit(c)) return false;
    }
    return std::stoi(port) <= 65535;
}

bool HasScheme(const std::string& url) {
    return !Split(url).scheme.empty();
}

bool IsHttpUrl(const std::string& url) {
    if (url.empty()) return false;
    for (unsigned char c : url) {
        if (c <= 0x20 || c == 0x7F) return false;
    }
    UrlParts parts = Split(url);
    if (parts.scheme != "http" && parts.scheme != "https") return false;
    if (!parts.has_authority) return false;
    if (HostOf(parts.authority).empty()) return false;
    return HasValidPort(parts.authority);
}

static std::string Merge(const UrlParts& base, const std::string& ref_path) {
    if (base.has_authority && base.path.empty()) {
        return "/" + ref_path;
    }
    auto slash = base.path.find_last_of('/');
    if (slash == std::string::npos) return ref_path;
    return base.path.substr(0, slash + 1) + ref_path;
}

std::optional<std::string> ResolveAgainst(const std::string& base_url, const std::string& candidate) {
    UrlParts ref = Split(candidate);
    if (!ref.scheme.empty()) return candidate;

    UrlParts base = Split(base_url);
    if (base.scheme.empty()) return std::nullopt;

    UrlParts target;
    if (ref.has_authority) {
        target.has_authority = true;
        target.authority = ref.authority;
        target.path = RemoveDotSegments(ref.path);
        target.has_query = ref.has_query;
        target.query = ref.query;
    } else {
        if (ref.path.empty()) {
            target.path = base.path;
            if (ref.has_query) {
                target.has_query = true;
                target.query = ref.query;
            } else {
                target.has_query = base.has_query;
                target.query = base.query;
            }
        } else {
            if (ref.path[0] == '/') {
                target.path = RemoveDotSegments(ref.path);
            } else {
                target.path = RemoveDotSegments(Merge(base, ref.path));
            }
            target.has_query = ref.has_query;
            target.query = ref.query;
        }
        target.has_authority = base.has_authority;
        target.authority = base.authority;
    }
    target.scheme = base.scheme;
    target.has_fragment = ref.has_fragment;
    target.fragment = ref.fragment;
    return Recompose(target);
}

}
}
