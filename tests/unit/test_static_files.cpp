// Easel Static File Handler Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <memory>

#include "../../src/gateway/static_files.hpp"
#include "test_helpers.hpp"

using namespace easel::gateway;
using easel::http::Method;
using easel::testing::TestRequest;

namespace {

/// Document root populated with a small site
class SiteFixture {
public:
    SiteFixture() {
        root_ = std::filesystem::temp_directory_path() / "easel_static_test";
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "js");
        std::filesystem::create_directories(root_ / "img");
        std::filesystem::create_directories(root_ / "empty");

        write("index.html", "<!doctype html><title>home</title>");
        write("js/app.js", "console.log('hi');");
        write("js/index.html", "<p>js index</p>");
        write("img/logo.PNG", "\x89PNG");
        write("my file.txt", "spaces");
        write("data.bin", "raw");

        easel::control::StaticConfig config;
        config.root = root_.string();
        handler_ = std::make_unique<StaticFileHandler>(config);
    }

    ~SiteFixture() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const StaticFileHandler& handler() const { return *handler_; }
    const std::filesystem::path& root() const { return root_; }

private:
    void write(const std::string& relative, const std::string& content) {
        std::ofstream(root_ / relative, std::ios::binary) << content;
    }

    std::filesystem::path root_;
    std::unique_ptr<StaticFileHandler> handler_;
};

}  // namespace

TEST_CASE("MIME types by extension", "[static][mime]") {
    REQUIRE(mime_type_for("index.html") == "text/html");
    REQUIRE(mime_type_for("app.js") == "text/javascript");
    REQUIRE(mime_type_for("module.mjs") == "text/javascript");
    REQUIRE(mime_type_for("style.css") == "text/css");
    REQUIRE(mime_type_for("photo.JPEG") == "image/jpeg");
    REQUIRE(mime_type_for("anim.gif") == "image/gif");
    REQUIRE(mime_type_for("icon.svg") == "image/svg+xml");
    REQUIRE(mime_type_for("font.woff2") == "font/woff2");
    REQUIRE(mime_type_for("app.js.map") == "application/json");
    REQUIRE(mime_type_for("module.wasm") == "application/wasm");
    REQUIRE(mime_type_for("archive.tar.xz") == "application/octet-stream");
    REQUIRE(mime_type_for("Makefile") == "application/octet-stream");
}

TEST_CASE("Path resolution stays under the root", "[static][resolve]") {
    SiteFixture site;
    const auto& handler = site.handler();

    auto resolved = handler.resolve("/js/app.js");
    REQUIRE(resolved.has_value());
    REQUIRE(resolved->string() == (handler.root() / "js" / "app.js").string());

    auto dotted = handler.resolve("/js/../index.html");
    REQUIRE(dotted.has_value());
    REQUIRE(dotted->string() == (handler.root() / "index.html").string());

    auto spaced = handler.resolve("/my%20file.txt");
    REQUIRE(spaced.has_value());
    REQUIRE(spaced->string() == (handler.root() / "my file.txt").string());

    REQUIRE_FALSE(handler.resolve("/../etc/passwd").has_value());
    REQUIRE_FALSE(handler.resolve("/js/../../etc/passwd").has_value());
    REQUIRE_FALSE(handler.resolve("/%2e%2e/etc/passwd").has_value());
    REQUIRE_FALSE(handler.resolve("/a%00b").has_value());
    REQUIRE_FALSE(handler.resolve("/..%5c..%5cwindows").has_value());
    REQUIRE_FALSE(handler.resolve("/bad%zz").has_value());
}

TEST_CASE("Serving files", "[static][serve]") {
    SiteFixture site;
    const auto& handler = site.handler();

    SECTION("Root serves index.html without caching") {
        TestRequest request(Method::GET, "/");
        auto response = handler.serve(request);
        REQUIRE(response.status_code() == 200);
        REQUIRE(response.body == "<!doctype html><title>home</title>");
        REQUIRE(response.get_header("Content-Type") == "text/html");
        REQUIRE(response.get_header("Cache-Control") == "no-cache");
    }

    SECTION("JavaScript is not cached") {
        TestRequest request(Method::GET, "/js/app.js?v=3");
        auto response = handler.serve(request);
        REQUIRE(response.status_code() == 200);
        REQUIRE(response.get_header("Content-Type") == "text/javascript");
        REQUIRE(response.get_header("Cache-Control") == "no-cache");
    }

    SECTION("Images may be cached") {
        TestRequest request(Method::GET, "/img/logo.PNG");
        auto response = handler.serve(request);
        REQUIRE(response.status_code() == 200);
        REQUIRE(response.get_header("Content-Type") == "image/png");
        REQUIRE_FALSE(response.has_header("Cache-Control"));
    }

    SECTION("Unknown extension") {
        TestRequest request(Method::GET, "/data.bin");
        REQUIRE(handler.serve(request).get_header("Content-Type") == "application/octet-stream");
    }

    SECTION("Percent-encoded name") {
        TestRequest request(Method::GET, "/my%20file.txt");
        auto response = handler.serve(request);
        REQUIRE(response.status_code() == 200);
        REQUIRE(response.body == "spaces");
    }

    SECTION("HEAD keeps the body length but omits the body") {
        TestRequest request(Method::HEAD, "/js/app.js");
        auto response = handler.serve(request);
        REQUIRE(response.status_code() == 200);
        REQUIRE(response.omit_body);
        REQUIRE(response.body == "console.log('hi');");
    }
}

TEST_CASE("Directories and missing files", "[static][serve]") {
    SiteFixture site;
    const auto& handler = site.handler();

    SECTION("Directory without trailing slash redirects") {
        TestRequest request(Method::GET, "/js?x=1");
        auto response = handler.serve(request);
        REQUIRE(response.status_code() == 301);
        REQUIRE(response.get_header("Location") == "/js/?x=1");
    }

    SECTION("Directory with trailing slash serves its index") {
        TestRequest request(Method::GET, "/js/");
        auto response = handler.serve(request);
        REQUIRE(response.status_code() == 200);
        REQUIRE(response.body == "<p>js index</p>");
    }

    SECTION("Directory without index is not found") {
        TestRequest request(Method::GET, "/empty/");
        REQUIRE(handler.serve(request).status_code() == 404);
    }

    SECTION("Missing file uses the HTML error page") {
        TestRequest request(Method::GET, "/nope.html");
        auto response = handler.serve(request);
        REQUIRE(response.status_code() == 404);
        REQUIRE(response.get_header("Content-Type") == "text/html;charset=utf-8");
        REQUIRE(response.body.find("File not found") != std::string::npos);
    }

    SECTION("Traversal is not found") {
        TestRequest request(Method::GET, "/%2e%2e/%2e%2e/etc/passwd");
        REQUIRE(handler.serve(request).status_code() == 404);
    }
}
