#include "ResponseJson.hpp"

namespace LinkPreview {

static void set_if_present(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
    if (value && !value->empty()) j[key] = *value;
}

nlohmann::json MetadataToJson(const Metadata& metadata) {
    nlohmann::json j = nlohmann::json::object();
    j["url"] = metadata.url;
    set_if_present(j, "title", metadata.title);
    set_if_present(j, "description", metadata.description);
    set_if_present(j, "image", metadata.image);
    set_if_present(j, "site_name", metadata.site_name);
    set_if_present(j, "type", metadata.type);
    set_if_present(j, "locale", metadata.locale);
    set_if_present(j, "author", metadata.author);
    set_if_present(j, "publisher", metadata.publisher);
    set_if_present(j, "published_time", metadata.published_time);
    set_if_present(j, "modified_time", metadata.modified_time);
    set_if_present(j, "video_url", metadata.video_url);
    set_if_present(j, "audio_url", metadata.audio_url);
    set_if_present(j, "duration", metadata.duration);
    set_if_present(j, "twitter_handle", metadata.twitter_handle);
    set_if_present(j, "twitter_card", metadata.twitter_card);
    set_if_present(j, "canonical_url", metadata.canonical_url);
    set_if_present(j, "favicon", metadata.favicon);
    set_if_present(j, "theme_color", metadata.theme_color);
    if (metadata.keywords && !metadata.keywords->empty()) {
        j["keywords"] = *metadata.keywords;
    }
    return j;
}

nlohmann::json ResponseToJson(const UnfurlResponse& response) {
    nlohmann::json j;
    j["success"] = response.success;
    if (response.success && response.data) {
        j["data"] = MetadataToJson(*response.data);
    }
    if (response.error) j["error"] = *response.error;
    if (response.error_code) j["error_code"] = *response.error_code;
    return j;
}

}
