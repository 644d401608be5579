#pragma once
#include <nlohmann/json.hpp>
#include "../core/UnfurlResponse.hpp"

namespace LinkPreview {

// Absent fields are omitted, so a consumer never sees null or "".
nlohmann::json MetadataToJson(const Metadata& metadata);

// {"success":true,"data":{...}} or {"success":false,"error":"...","error_code":"..."}
nlohmann::json ResponseToJson(const UnfurlResponse& response);

}
