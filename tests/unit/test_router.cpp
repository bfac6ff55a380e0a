// Easel Router Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/gateway/factory.hpp"
#include "../../src/gateway/router.hpp"

using namespace easel::gateway;
using easel::http::Method;

TEST_CASE("Router exact and prefix matching", "[router][match]") {
    Router router;
    router.add_route(RouteBuilder("/api/generate").method(Method::POST).exact().handler(
        HandlerId::Generate).build());
    router.add_route(RouteBuilder("/api/gemini/").method(Method::POST).prefix().handler(
        HandlerId::GeminiLegacy).build());

    SECTION("Exact match") {
        auto match = router.match(Method::POST, "/api/generate");
        REQUIRE(match.matched());
        REQUIRE(match.handler_id == HandlerId::Generate);
        REQUIRE(match.remainder.empty());
    }

    SECTION("Exact route does not match longer paths") {
        REQUIRE_FALSE(router.match(Method::POST, "/api/generate/extra").matched());
    }

    SECTION("Prefix match exposes the remainder") {
        auto match = router.match(Method::POST, "/api/gemini/v1beta/models/x:generateContent");
        REQUIRE(match.handler_id == HandlerId::GeminiLegacy);
        REQUIRE(match.remainder == "v1beta/models/x:generateContent");
    }

    SECTION("Method must match") {
        REQUIRE_FALSE(router.match(Method::GET, "/api/generate").matched());
    }
}

TEST_CASE("Router first match wins", "[router][order]") {
    Router router;
    router.add_route(RouteBuilder("/api/").method(Method::OPTIONS).prefix().handler(
        HandlerId::CorsPreflight).build());
    router.add_route(RouteBuilder("").any_path().handler(HandlerId::NotImplemented).build());

    REQUIRE(router.match(Method::OPTIONS, "/api/generate").handler_id == HandlerId::CorsPreflight);
    REQUIRE(router.match(Method::OPTIONS, "/index.html").handler_id ==
            HandlerId::NotImplemented);
    REQUIRE(router.match(Method::DELETE, "/api/generate").handler_id ==
            HandlerId::NotImplemented);

    router.clear();
    REQUIRE(router.routes().empty());
    REQUIRE_FALSE(router.match(Method::GET, "/").matched());
}

TEST_CASE("Fixed routing table", "[router][table]") {
    auto router = build_router();

    struct Case {
        Method method;
        const char* path;
        HandlerId expected;
    };

    const Case cases[] = {
        {Method::POST, "/api/generate", HandlerId::Generate},
        {Method::POST, "/api/describe-image", HandlerId::DescribeImage},
        {Method::POST, "/api/gemini/v1beta/models/m:generateContent", HandlerId::GeminiLegacy},
        {Method::GET, "/api/unsplash", HandlerId::ImageSearch},
        {Method::GET, "/api/giphy", HandlerId::GifSearch},
        {Method::OPTIONS, "/api/generate", HandlerId::CorsPreflight},
        {Method::OPTIONS, "/api/unsplash", HandlerId::CorsPreflight},
        {Method::GET, "/", HandlerId::StaticFile},
        {Method::GET, "/js/app.js", HandlerId::StaticFile},
        {Method::HEAD, "/index.html", HandlerId::StaticFile},
        // GET on a POST-only API path falls through to static files
        {Method::GET, "/api/generate", HandlerId::StaticFile},
        {Method::POST, "/api/unknown", HandlerId::NotFound},
        {Method::POST, "/upload", HandlerId::NotFound},
        {Method::OPTIONS, "/index.html", HandlerId::NotFound},
        {Method::PUT, "/api/generate", HandlerId::NotImplemented},
        {Method::DELETE, "/", HandlerId::NotImplemented},
        {Method::PATCH, "/api/unsplash", HandlerId::NotImplemented},
    };

    for (const auto& c : cases) {
        INFO(easel::http::to_string(c.method) << " " << c.path);
        auto match = router->match(c.method, c.path);
        REQUIRE(match.handler_id == c.expected);
    }
}

TEST_CASE("Handler names for logs", "[router][names]") {
    REQUIRE(to_string(HandlerId::Generate) == "generate");
    REQUIRE(to_string(HandlerId::ImageSearch) == "image-search");
    REQUIRE(to_string(HandlerId::StaticFile) == "static");
    REQUIRE(to_string(HandlerId::None) == "none");
}
