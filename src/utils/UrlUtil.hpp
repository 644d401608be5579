#pragma once
#include <string>
#include <optional>

namespace LinkPreview {
namespace UrlUtil {

// Generic URI components (RFC 3986 appendix B split). Presence flags keep
// "http://h/?" distinct from "http://h/".
struct UrlParts {
    std::string scheme;          // lowercased, empty for relative references
    bool has_authority = false;
    std::string authority;
    std::string path;
    bool has_query = false;
    std::string query;
    bool has_fragment = false;
    std::string fragment;
};

UrlParts Split(const std::string& url);
std::string Recompose(const UrlParts& parts);

// RFC 3986 section 5.2.4.
std::string RemoveDotSegments(const std::string& path);

// Host component of an authority, without userinfo, port or IPv6 brackets.
std::string HostOf(const std::string& authority);

bool HasScheme(const std::string& url);

// Absolute http/https URL with a non-empty host, a numeric port if any,
// and no whitespace or control characters.
bool IsHttpUrl(const std::string& url);

// Resolve a reference against a base URL (page URL) per RFC 3986 section 5.2.
// - A reference that carries its own scheme is returned unchanged.
// - "//host/x" takes the base scheme.
// - "/x", "x", "../x", "?q" and "#f" are merged with the base path.
// Returns nullopt when the reference is relative and the base is not absolute.
std::optional<std::string> ResolveAgainst(const std::string& base_url, const std::string& candidate);

}
}
