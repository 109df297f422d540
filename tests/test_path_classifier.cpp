#include <catch2/catch.hpp>
#include "path_classifier.hpp"
#include <string>

using namespace blackhole;

// Helpers to unwrap a classification or fail the test.
static LocalAsset as_local(const Classification& c) {
    REQUIRE(std::holds_alternative<LocalAsset>(c));
    return std::get<LocalAsset>(c);
}

static RemoteAsset as_remote(const Classification& c) {
    REQUIRE(std::holds_alternative<RemoteAsset>(c));
    return std::get<RemoteAsset>(c);
}

static bool is_malformed(const Classification& c) {
    return std::holds_alternative<MalformedRequest>(c);
}

// ============================================================================
// Local assets
// ============================================================================

TEST_CASE("Plain file name is a local asset", "[classify]") {
    auto local = as_local(classify("github.css"));
    REQUIRE(local.name == "github.css");
}

TEST_CASE("Nested local path keeps the whole path as name", "[classify]") {
    auto local = as_local(classify("css/site.css"));
    REQUIRE(local.name == "css/site.css");
}

TEST_CASE("At sign outside the leading segment stays local", "[classify]") {
    auto local = as_local(classify("img/logo@2x.png"));
    REQUIRE(local.name == "img/logo@2x.png");
}

// ============================================================================
// Remote assets
// ============================================================================

TEST_CASE("package@version/file is a remote asset", "[classify]") {
    auto remote = as_remote(classify("vue@3.2.0/dist/vue.global.min.js"));
    REQUIRE(remote.package == "vue");
    REQUIRE(remote.version == "3.2.0");
    REQUIRE(remote.file == "dist/vue.global.min.js");
}

TEST_CASE("Single file under a version", "[classify]") {
    auto remote = as_remote(classify("lodash@4.17.21/lodash.min.js"));
    REQUIRE(remote.package == "lodash");
    REQUIRE(remote.version == "4.17.21");
    REQUIRE(remote.file == "lodash.min.js");
}

TEST_CASE("Scoped package keeps its scope", "[classify]") {
    auto remote = as_remote(classify("@scope/pkg@1.0.0/file.js"));
    REQUIRE(remote.package == "@scope/pkg");
    REQUIRE(remote.version == "1.0.0");
    REQUIRE(remote.file == "file.js");
}

TEST_CASE("Scoped package with nested file", "[classify]") {
    auto remote = as_remote(classify("@highlightjs/cdn-assets@11.9.0/styles/github.min.css"));
    REQUIRE(remote.package == "@highlightjs/cdn-assets");
    REQUIRE(remote.version == "11.9.0");
    REQUIRE(remote.file == "styles/github.min.css");
}

TEST_CASE("Last at sign in the leading segment separates the version", "[classify]") {
    auto remote = as_remote(classify("a@b@c/x.js"));
    REQUIRE(remote.package == "a@b");
    REQUIRE(remote.version == "c");
    REQUIRE(remote.file == "x.js");
}

TEST_CASE("Version tags are accepted", "[classify]") {
    auto remote = as_remote(classify("react@latest/umd/react.production.min.js"));
    REQUIRE(remote.version == "latest");
}

TEST_CASE("Remote key joins the parts", "[classify]") {
    auto remote = as_remote(classify("@scope/pkg@1.0.0/dist/a.js"));
    REQUIRE(remote.key() == "@scope/pkg@1.0.0/dist/a.js");
}

// ============================================================================
// Malformed requests
// ============================================================================

TEST_CASE("Empty path is malformed", "[classify]") {
    REQUIRE(is_malformed(classify("")));
}

TEST_CASE("Missing package is malformed", "[classify]") {
    REQUIRE(is_malformed(classify("@1.0.0/file.js")));
}

TEST_CASE("Missing version is malformed", "[classify]") {
    REQUIRE(is_malformed(classify("vue@/dist/vue.js")));
}

TEST_CASE("Missing file is malformed", "[classify]") {
    REQUIRE(is_malformed(classify("vue@3.2.0")));
    REQUIRE(is_malformed(classify("vue@3.2.0/")));
}

TEST_CASE("Scoped package without version is malformed", "[classify]") {
    REQUIRE(is_malformed(classify("@scope/pkg/file.js")));
    REQUIRE(is_malformed(classify("@scope")));
}

TEST_CASE("Scoped package with empty name is malformed", "[classify]") {
    REQUIRE(is_malformed(classify("@scope/@1.0.0/file.js")));
    REQUIRE(is_malformed(classify("@/pkg@1.0.0/file.js")));
}

// ============================================================================
// Path safety
// ============================================================================

TEST_CASE("Ordinary relative paths are safe", "[safety]") {
    REQUIRE(is_safe_path("github.css"));
    REQUIRE(is_safe_path("dist/vue.global.min.js"));
    REQUIRE(is_safe_path("@scope/pkg"));
    REQUIRE(is_safe_path("a..b.js"));
}

TEST_CASE("Traversal and odd separators are unsafe", "[safety]") {
    REQUIRE_FALSE(is_safe_path(""));
    REQUIRE_FALSE(is_safe_path(".."));
    REQUIRE_FALSE(is_safe_path("../etc/passwd"));
    REQUIRE_FALSE(is_safe_path("css/../../secret"));
    REQUIRE_FALSE(is_safe_path("./a.css"));
    REQUIRE_FALSE(is_safe_path("/etc/passwd"));
    REQUIRE_FALSE(is_safe_path("a//b.css"));
    REQUIRE_FALSE(is_safe_path("a\\b.css"));
    REQUIRE_FALSE(is_safe_path("dir/"));
}
