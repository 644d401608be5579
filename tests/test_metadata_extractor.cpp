#include <catch2/catch_all.hpp>
#include "parser/MetadataExtractor.hpp"

using namespace LinkPreview;

namespace {

std::optional<std::string> S(const char* s) { return std::optional<std::string>(s); }

std::string Head(const std::string& inner) {
    return "<!doctype html><html><head>" + inner + "</head><body></body></html>";
}

} // namespace

TEST_CASE("Title prefers og:title, then twitter:title, then the title element") {
    const std::string page = "https://example.com/a";

    CHECK(MetadataExtractor::Extract(Head(R"(
        <title>Doc</title>
        <meta name="twitter:title" content="Tw">
        <meta property="og:title" content="OG">)"), page).title == S("OG"));

    CHECK(MetadataExtractor::Extract(Head(R"(
        <title>Doc</title>
        <meta name="twitter:title" content="Tw">)"), page).title == S("Tw"));

    CHECK(MetadataExtractor::Extract(Head("<title>Doc</title>"), page).title == S("Doc"));

    // Blank og:title does not block the fallback.
    CHECK(MetadataExtractor::Extract(Head(R"(
        <title>Doc</title>
        <meta property="og:title" content="  ">)"), page).title == S("Doc"));
}

TEST_CASE("Description falls back from og to twitter to the description meta") {
    const std::string page = "https://example.com/";

    CHECK(MetadataExtractor::Extract(Head(R"(
        <meta name="description" content="plain">
        <meta name="twitter:description" content="tw">
        <meta property="og:description" content="og">)"), page).description == S("og"));

    CHECK(MetadataExtractor::Extract(Head(R"(
        <meta name="description" content="plain">
        <meta name="twitter:description" content="tw">)"), page).description == S("tw"));

    CHECK(MetadataExtractor::Extract(Head(R"(<meta name="description" content="plain">)"), page).description == S("plain"));
}

TEST_CASE("Image URLs are resolved against the page URL") {
    SECTION("og:image wins over twitter:image") {
        auto m = MetadataExtractor::Extract(Head(R"(
            <meta name="twitter:image" content="/tw.png">
            <meta property="og:image" content="https://cdn.example.net/og.png">)"), "https://example.com/post");
        CHECK(m.image == S("https://cdn.example.net/og.png"));
    }
    SECTION("root-relative") {
        auto m = MetadataExtractor::Extract(Head(R"(<meta property="og:image" content="/img/a.png">)"),
                                            "https://example.com/blog/post.html");
        CHECK(m.image == S("https://example.com/img/a.png"));
    }
    SECTION("path-relative") {
        auto m = MetadataExtractor::Extract(Head(R"(<meta property="og:image" content="../img/a.png">)"),
                                            "https://example.com/blog/2024/post.html");
        CHECK(m.image == S("https://example.com/blog/img/a.png"));
    }
    SECTION("scheme-relative takes the page scheme") {
        const std::string html = Head(R"(<meta property="og:image" content="//cdn.example.net/a.png">)");
        CHECK(MetadataExtractor::Extract(html, "https://example.com/").image == S("https://cdn.example.net/a.png"));
        CHECK(MetadataExtractor::Extract(html, "http://example.com/").image == S("http://cdn.example.net/a.png"));
    }
    SECTION("relative image keeps the page origin") {
        auto m = MetadataExtractor::Extract(Head(R"(<meta name="twitter:image" content="pic.jpg">)"),
                                            "http://example.com:8080/dir/page");
        REQUIRE(m.image);
        CHECK_THAT(*m.image, Catch::Matchers::StartsWith("http://example.com:8080/"));
        CHECK(*m.image == "http://example.com:8080/dir/pic.jpg");
    }
}

TEST_CASE("Simple Open Graph and Twitter fields are read directly") {
    auto m = MetadataExtractor::Extract(Head(R"(
        <meta property="og:site_name" content="Example Site">
        <meta property="og:type" content="article">
        <meta property="og:locale" content="en_GB">
        <meta name="twitter:card" content="summary_large_image">
        <meta name="theme-color" content="#336699">)"), "https://example.com/");

    CHECK(m.site_name == S("Example Site"));
    CHECK(m.type == S("article"));
    CHECK(m.locale == S("en_GB"));
    CHECK(m.twitter_card == S("summary_large_image"));
    CHECK(m.theme_color == S("#336699"));
}

TEST_CASE("Article fields follow their fallback chains") {
    const std::string page = "https://news.example.com/story";

    SECTION("article namespace first") {
        auto m = MetadataExtractor::Extract(Head(R"(
            <meta name="author" content="Fallback Author">
            <meta property="article:author" content="Jane Doe">
            <meta name="publisher" content="Fallback Pub">
            <meta property="article:publisher" content="Daily">
            <meta name="date" content="2020-01-01">
            <meta property="og:published_time" content="2021-01-01">
            <meta property="article:published_time" content="2022-01-01T10:00:00Z">
            <meta property="og:updated_time" content="2022-02-01">
            <meta property="article:modified_time" content="2022-03-01">)"), page);
        CHECK(m.author == S("Jane Doe"));
        CHECK(m.publisher == S("Daily"));
        CHECK(m.published_time == S("2022-01-01T10:00:00Z"));
        CHECK(m.modified_time == S("2022-03-01"));
    }
    SECTION("generic fallbacks") {
        auto m = MetadataExtractor::Extract(Head(R"(
            <meta name="author" content="Fallback Author">
            <meta name="publisher" content="Fallback Pub">
            <meta name="date" content="2020-01-01">
            <meta property="og:updated_time" content="2022-02-01">)"), page);
        CHECK(m.author == S("Fallback Author"));
        CHECK(m.publisher == S("Fallback Pub"));
        CHECK(m.published_time == S("2020-01-01"));
        CHECK(m.modified_time == S("2022-02-01"));
    }
    SECTION("og:published_time before date") {
        auto m = MetadataExtractor::Extract(Head(R"(
            <meta name="date" content="2020-01-01">
            <meta property="og:published_time" content="2021-01-01">)"), page);
        CHECK(m.published_time == S("2021-01-01"));
    }
}

TEST_CASE("Video and audio URLs follow their chains and are resolved") {
    const std::string page = "https://media.example.com/watch/1";

    SECTION("og:video:url first") {
        auto m = MetadataExtractor::Extract(Head(R"(
            <meta property="og:video:secure_url" content="https://secure.example.com/v.mp4">
            <meta property="og:video" content="/plain.mp4">
            <meta property="og:video:url" content="/v/url.mp4">
            <meta property="og:video:duration" content="120">)"), page);
        CHECK(m.video_url == S("https://media.example.com/v/url.mp4"));
        CHECK(m.duration == S("120"));
    }
    SECTION("og:video then og:video:secure_url") {
        auto m = MetadataExtractor::Extract(Head(R"(
            <meta property="og:video:secure_url" content="https://secure.example.com/v.mp4">
            <meta property="og:video" content="plain.mp4">)"), page);
        CHECK(m.video_url == S("https://media.example.com/watch/plain.mp4"));

        auto only_secure = MetadataExtractor::Extract(Head(R"(
            <meta property="og:video:secure_url" content="https://secure.example.com/v.mp4">)"), page);
        CHECK(only_secure.video_url == S("https://secure.example.com/v.mp4"));
    }
    SECTION("audio and video:duration") {
        auto m = MetadataExtractor::Extract(Head(R"(
            <meta property="og:audio" content="/a.mp3">
            <meta property="video:duration" content="PT2M">)"), page);
        CHECK(m.audio_url == S("https://media.example.com/a.mp3"));
        CHECK(m.duration == S("PT2M"));

        auto url_first = MetadataExtractor::Extract(Head(R"(
            <meta property="og:audio" content="/a.mp3">
            <meta property="og:audio:url" content="/b.mp3">)"), page);
        CHECK(url_first.audio_url == S("https://media.example.com/b.mp3"));
    }
}

TEST_CASE("Twitter handle prefers the creator over the site account") {
    const std::string page = "https://example.com/";
    CHECK(MetadataExtractor::Extract(Head(R"(
        <meta name="twitter:site" content="@site">
        <meta name="twitter:creator" content="@writer">)"), page).twitter_handle == S("@writer"));
    CHECK(MetadataExtractor::Extract(Head(R"(<meta name="twitter:site" content="@site">)"), page).twitter_handle == S("@site"));
}

TEST_CASE("Canonical URL comes from link rel=canonical, then og:url") {
    const std::string page = "https://example.com/a/b?utm=1";

    CHECK(MetadataExtractor::Extract(Head(R"(
        <meta property="og:url" content="https://example.com/og">
        <link rel="canonical" href="/a/canonical">)"), page).canonical_url == S("https://example.com/a/canonical"));

    CHECK(MetadataExtractor::Extract(Head(R"(<meta property="og:url" content="https://example.com/og">)"), page)
              .canonical_url == S("https://example.com/og"));

    CHECK(MetadataExtractor::Extract(Head(R"(<meta property="og:url" content="/relative-og">)"), page)
              .canonical_url == S("https://example.com/relative-og"));
}

TEST_CASE("Favicon lookup order") {
    const std::string page = "https://example.com/x/y";

    SECTION("icon beats the others") {
        auto m = MetadataExtractor::Extract(Head(R"(
            <link rel="apple-touch-icon" href="/apple.png">
            <link rel="shortcut icon" href="/shortcut.ico">
            <link rel="icon" href="/icon.png">)"), page);
        CHECK(m.favicon == S("https://example.com/icon.png"));
    }
    SECTION("shortcut icon beats apple-touch-icon") {
        auto m = MetadataExtractor::Extract(Head(R"(
            <link rel="apple-touch-icon" href="/apple.png">
            <link rel="shortcut icon" href="/shortcut.ico">)"), page);
        CHECK(m.favicon == S("https://example.com/shortcut.ico"));
    }
    SECTION("apple-touch-icon alone") {
        auto m = MetadataExtractor::Extract(Head(R"(<link rel="apple-touch-icon" href="apple.png">)"), page);
        CHECK(m.favicon == S("https://example.com/x/apple.png"));
    }
    SECTION("any rel containing the icon token") {
        auto m = MetadataExtractor::Extract(Head(R"(
            <link rel="mask-icon" href="/mask.svg">
            <link rel="alternate icon" href="/alt.ico">)"), page);
        CHECK(m.favicon == S("https://example.com/alt.ico"));
    }
    SECTION("mask-icon alone is not a favicon") {
        auto m = MetadataExtractor::Extract(Head(R"(<link rel="mask-icon" href="/mask.svg">)"), page);
        CHECK_FALSE(m.favicon);
    }
}

TEST_CASE("Keywords are split on commas and trimmed") {
    const std::string page = "https://example.com/";

    auto m = MetadataExtractor::Extract(Head(R"(<meta name="keywords" content="a, b ,, c">)"), page);
    REQUIRE(m.keywords);
    CHECK(*m.keywords == std::vector<std::string>{"a", "b", "c"});

    CHECK_FALSE(MetadataExtractor::Extract(Head(R"(<meta name="keywords" content=" , ">)"), page).keywords);
    CHECK_FALSE(MetadataExtractor::Extract(Head(R"(<meta name="keywords" content="">)"), page).keywords);
    CHECK_FALSE(MetadataExtractor::Extract(Head("<title>t</title>"), page).keywords);
}

TEST_CASE("SplitKeywords handles edge cases") {
    using Words = std::vector<std::string>;
    auto split = [](const std::string& raw) { return MetadataExtractor::SplitKeywords(raw).value_or(Words{}); };

    CHECK(split("solo") == Words{"solo"});
    CHECK(split(",lead,trail,") == Words{"lead", "trail"});
    CHECK(split("multi word, phrase") == Words{"multi word", "phrase"});
    CHECK_FALSE(MetadataExtractor::SplitKeywords(""));
    CHECK_FALSE(MetadataExtractor::SplitKeywords(",,,"));
}

TEST_CASE("The page URL is echoed verbatim") {
    const std::string page = "HTTPS://Example.COM/Path/../x?q=1#frag";
    CHECK(MetadataExtractor::Extract(Head("<title>t</title>"), page).url == page);
    CHECK(MetadataExtractor::Extract("", page).url == page);
}

TEST_CASE("Blank values never surface as empty strings") {
    auto m = MetadataExtractor::Extract(Head(R"(
        <title>   </title>
        <meta property="og:title" content="">
        <meta property="og:description" content="   ">
        <meta property="og:image" content="">
        <meta property="og:site_name" content=" ">
        <meta name="author" content="">
        <meta name="theme-color" content="">
        <link rel="icon" href="">
        <link rel="canonical" href="  ">)"), "https://example.com/");

    CHECK_FALSE(m.title);
    CHECK_FALSE(m.description);
    CHECK_FALSE(m.image);
    CHECK_FALSE(m.site_name);
    CHECK_FALSE(m.author);
    CHECK_FALSE(m.theme_color);
    CHECK_FALSE(m.favicon);
    CHECK_FALSE(m.canonical_url);
}

TEST_CASE("Relative URLs are dropped when the page URL is not absolute") {
    auto m = MetadataExtractor::Extract(Head(R"(
        <meta property="og:image" content="/img.png">
        <meta property="og:video" content="https://cdn.example.com/v.mp4">)"), "not-absolute");

    CHECK_FALSE(m.image);
    CHECK(m.video_url == S("https://cdn.example.com/v.mp4"));
}

TEST_CASE("Extract never throws on hostile input") {
    std::string deep;
    for (int i = 0; i < 2000; ++i) deep += "<div>";
    deep += "<meta property=\"og:title\" content=\"deep\">";

    Metadata m;
    REQUIRE_NOTHROW(m = MetadataExtractor::Extract(deep, "https://example.com/"));
    CHECK(m.title == S("deep"));

    const char nul_bytes[] = "\0\0<meta\0>";
    REQUIRE_NOTHROW(MetadataExtractor::Extract(std::string(nul_bytes, sizeof(nul_bytes) - 1), "https://example.com/"));
}
