#include <catch2/catch_all.hpp>
#include "utils/ResponseJson.hpp"

using namespace LinkPreview;

TEST_CASE("MetadataToJson omits absent and empty fields") {
    Metadata m;
    m.url = "https://example.com/";
    m.title = "Example";
    m.description = "";

    auto j = MetadataToJson(m);
    CHECK(j["url"] == "https://example.com/");
    CHECK(j["title"] == "Example");
    CHECK_FALSE(j.contains("description"));
    CHECK_FALSE(j.contains("image"));
    CHECK_FALSE(j.contains("keywords"));
    CHECK(j.size() == 2);
}

TEST_CASE("MetadataToJson writes keywords as an array") {
    Metadata m;
    m.url = "https://example.com/";
    m.keywords = std::vector<std::string>{"c++", "html"};

    auto j = MetadataToJson(m);
    REQUIRE(j["keywords"].is_array());
    CHECK(j["keywords"].size() == 2);
    CHECK(j["keywords"][0] == "c++");
    CHECK(j["keywords"][1] == "html");
}

TEST_CASE("MetadataToJson uses snake_case field names") {
    Metadata m;
    m.url = "https://example.com/";
    m.site_name = "Site";
    m.canonical_url = "https://example.com/c";
    m.twitter_handle = "@ex";
    m.theme_color = "#fff";

    auto j = MetadataToJson(m);
    CHECK(j["site_name"] == "Site");
    CHECK(j["canonical_url"] == "https://example.com/c");
    CHECK(j["twitter_handle"] == "@ex");
    CHECK(j["theme_color"] == "#fff");
}

TEST_CASE("ResponseToJson success envelope carries data and no error") {
    Metadata m;
    m.url = "https://example.com/";
    auto j = ResponseToJson(UnfurlResponse::Success(m));

    CHECK(j["success"] == true);
    REQUIRE(j.contains("data"));
    CHECK(j["data"]["url"] == "https://example.com/");
    CHECK_FALSE(j.contains("error"));
    CHECK_FALSE(j.contains("error_code"));
}

TEST_CASE("ResponseToJson failure envelope carries error and code but no data") {
    auto j = ResponseToJson(UnfurlResponse::Failure(ErrorCode::kHttpStatus, "HTTP error 404 while fetching https://x.test/"));

    CHECK(j["success"] == false);
    CHECK_FALSE(j.contains("data"));
    CHECK(j["error"] == "HTTP error 404 while fetching https://x.test/");
    CHECK(j["error_code"] == "http_status");
}
