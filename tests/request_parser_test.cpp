// ─────────────────────────────────────────────────────────────────────────────
// Request Parser Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpenum/config/request_parser.hpp"

using namespace mcpenum;
using namespace std::chrono_literals;

namespace {

ConfigResult<EnumerationRequest> parse(const std::string& text, RequestLimits limits = {}) {
    return RequestParser(limits).parse(text);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Valid requests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RequestParser reads every connection shape", "[config][parser]") {
    auto request = parse(R"({
        "mcp_json": {"mcpServers": {
            "remote": {"url": "https://example.com/mcp", "headers": {"Authorization": "Bearer abc"}},
            "local": {"command": "npx", "args": ["-y", "@scope/server"], "env": {"API_KEY": "k"}},
            "docs": {"description": "Static docs", "tools": [{"name": "search"}]}
        }},
        "timeout_seconds": 45,
        "include_schemas": false,
        "parallel_discovery": false
    })");

    REQUIRE(request.has_value());
    CHECK(request->timeout == 45s);
    CHECK(request->include_schemas == false);
    CHECK(request->parallel_discovery == false);
    REQUIRE(request->servers.size() == 3);

    const auto& remote = request->servers[0];
    CHECK(remote.name == "remote");
    CHECK(remote.index == 0);
    const auto* http = std::get_if<HttpSpec>(&remote.spec);
    REQUIRE(http != nullptr);
    CHECK(http->url == "https://example.com/mcp");
    CHECK(http->headers.at("Authorization") == "Bearer abc");

    const auto& local = request->servers[1];
    CHECK(local.index == 1);
    const auto* command = std::get_if<CommandSpec>(&local.spec);
    REQUIRE(command != nullptr);
    CHECK(command->command == "npx");
    CHECK(command->args == std::vector<std::string>{"-y", "@scope/server"});
    CHECK(command->env.at("API_KEY") == "k");

    const auto& docs = request->servers[2];
    CHECK(std::holds_alternative<MetadataSpec>(docs.spec));
    CHECK(docs.metadata["description"] == "Static docs");
    CHECK(docs.metadata["tools"][0]["name"] == "search");
}

TEST_CASE("RequestParser keeps declaration order", "[config][parser]") {
    auto request = parse(R"({"mcp_json": {"mcpServers": {
        "zeta": {}, "alpha": {}, "mid": {}
    }}})");

    REQUIRE(request.has_value());
    REQUIRE(request->servers.size() == 3);
    CHECK(request->servers[0].name == "zeta");
    CHECK(request->servers[1].name == "alpha");
    CHECK(request->servers[2].name == "mid");
}

TEST_CASE("RequestParser applies defaults", "[config][parser]") {
    auto request = parse(R"({"mcp_json": {"mcpServers": {"a": {"url": "https://a.test"}}}})");

    REQUIRE(request.has_value());
    CHECK(request->timeout == 30s);
    CHECK(request->include_schemas);
    CHECK(request->parallel_discovery);
    CHECK(request->servers[0].timeout.has_value() == false);
}

TEST_CASE("RequestParser accepts a bare mcpServers document", "[config][parser]") {
    auto request = parse(R"({"mcpServers": {"a": {"command": "uvx", "args": ["mcp-server-fetch"]}}})");

    REQUIRE(request.has_value());
    REQUIRE(request->servers.size() == 1);
    CHECK(std::holds_alternative<CommandSpec>(request->servers[0].spec));
}

TEST_CASE("RequestParser prefers url over command", "[config][parser]") {
    auto request = parse(R"({"mcpServers": {"both": {"url": "https://x.test/mcp", "command": "npx"}}})");

    REQUIRE(request.has_value());
    CHECK(std::holds_alternative<HttpSpec>(request->servers[0].spec));
}

TEST_CASE("RequestParser reads per-server timeouts", "[config][parser][timeout]") {
    auto request = parse(R"({"mcpServers": {"a": {"command": "node", "args": ["s.js"], "timeout": 2.5}}})");

    REQUIRE(request.has_value());
    CHECK(request->servers[0].timeout == std::optional<std::chrono::milliseconds>(2500ms));
    CHECK(request->servers[0].metadata.contains("timeout") == false);
}

TEST_CASE("RequestParser rounds fractional request timeouts", "[config][parser][timeout]") {
    auto request = parse(R"({"mcpServers": {"a": {}}, "timeout_seconds": 7.25})");

    REQUIRE(request.has_value());
    CHECK(request->timeout == 7250ms);
}

// ═══════════════════════════════════════════════════════════════════════════
// Rejected requests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RequestParser rejects an empty server map", "[config][parser][error]") {
    auto request = parse(R"({"mcp_json": {"mcpServers": {}}})");

    REQUIRE(request.has_value() == false);
    CHECK(request.error().code == ConfigError::Code::EmptyServers);
    CHECK(request.error().field == "mcp_json.mcpServers");
}

TEST_CASE("RequestParser rejects a missing server map", "[config][parser][error]") {
    SECTION("no mcp_json") {
        auto request = parse(R"({"timeout_seconds": 30})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().code == ConfigError::Code::MissingServers);
    }

    SECTION("mcp_json without mcpServers") {
        auto request = parse(R"({"mcp_json": {}})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().code == ConfigError::Code::MissingServers);
    }
}

TEST_CASE("RequestParser rejects invalid JSON", "[config][parser][error]") {
    auto request = parse(R"({"mcp_json": )");

    REQUIRE(request.has_value() == false);
    CHECK(request.error().code == ConfigError::Code::InvalidJson);
}

TEST_CASE("RequestParser rejects duplicate server names", "[config][parser][error]") {
    auto request = parse(R"({"mcp_json": {"mcpServers": {
        "dup": {"url": "https://a.test"},
        "dup": {"command": "npx", "args": ["x"]}
    }}})");

    REQUIRE(request.has_value() == false);
    CHECK(request.error().code == ConfigError::Code::DuplicateKey);
    CHECK(request.error().field == "dup");
}

TEST_CASE("RequestParser allows the same key in different objects", "[config][parser]") {
    auto request = parse(R"({"mcp_json": {"mcpServers": {
        "a": {"url": "https://a.test", "headers": {"X-Key": "1"}},
        "b": {"url": "https://b.test", "headers": {"X-Key": "2"}}
    }}})");

    REQUIRE(request.has_value());
    CHECK(request->servers.size() == 2);
}

TEST_CASE("RequestParser enforces the server limit", "[config][parser][error]") {
    RequestLimits limits;
    limits.max_servers = 2;

    auto request = parse(R"({"mcpServers": {"a": {}, "b": {}, "c": {}}})", limits);

    REQUIRE(request.has_value() == false);
    CHECK(request.error().code == ConfigError::Code::TooManyServers);
    CHECK(request.error().message == "Too many servers: 3 (maximum 2)");
}

TEST_CASE("RequestParser enforces the timeout range", "[config][parser][timeout][error]") {
    SECTION("too short") {
        auto request = parse(R"({"mcpServers": {"a": {}}, "timeout_seconds": 1})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().code == ConfigError::Code::InvalidTimeout);
        CHECK(request.error().message == "timeout_seconds must be between 5 and 300");
    }

    SECTION("too long") {
        auto request = parse(R"({"mcpServers": {"a": {}}, "timeout_seconds": 301})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().code == ConfigError::Code::InvalidTimeout);
    }

    SECTION("not a number") {
        auto request = parse(R"({"mcpServers": {"a": {}}, "timeout_seconds": "30"})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().code == ConfigError::Code::InvalidType);
    }

    SECTION("non-positive server timeout") {
        auto request = parse(R"({"mcpServers": {"a": {"command": "node", "timeout": 0}}})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().code == ConfigError::Code::InvalidTimeout);
        CHECK(request.error().field == "mcpServers.a.timeout");
    }

    SECTION("server timeout above the request maximum") {
        auto request = parse(R"({"mcpServers": {"a": {"command": "node", "timeout": 1e10}}})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().code == ConfigError::Code::InvalidTimeout);
        CHECK(request.error().field == "mcpServers.a.timeout");
        CHECK(request.error().message == "Server 'a' timeout must not exceed 300 seconds");
    }

    SECTION("server timeout at the request maximum") {
        auto request = parse(R"({"mcpServers": {"a": {"command": "node", "timeout": 300}}})");
        REQUIRE(request.has_value());
        CHECK(request->servers[0].timeout == std::optional<std::chrono::milliseconds>(300s));
    }
}

TEST_CASE("RequestParser checks field types", "[config][parser][error]") {
    SECTION("server is not an object") {
        auto request = parse(R"({"mcpServers": {"a": "https://a.test"}})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().code == ConfigError::Code::InvalidServer);
    }

    SECTION("args is not an array") {
        auto request = parse(R"({"mcpServers": {"a": {"command": "node", "args": "server.js"}}})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().code == ConfigError::Code::InvalidType);
        CHECK(request.error().field == "mcpServers.a.args");
    }

    SECTION("non-string argument") {
        auto request = parse(R"({"mcpServers": {"a": {"command": "node", "args": ["s.js", 3]}}})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().field == "mcpServers.a.args[1]");
    }

    SECTION("non-string header") {
        auto request = parse(R"({"mcpServers": {"a": {"url": "https://a.test", "headers": {"X-Retry": 3}}}})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().field == "mcpServers.a.headers.X-Retry");
    }

    SECTION("url is not a string") {
        auto request = parse(R"({"mcpServers": {"a": {"url": 42}}})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().field == "mcpServers.a.url");
    }

    SECTION("include_schemas is not a boolean") {
        auto request = parse(R"({"mcpServers": {"a": {}}, "include_schemas": "yes"})");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().field == "include_schemas");
    }

    SECTION("document is not an object") {
        auto request = parse(R"([1, 2, 3])");
        REQUIRE(request.has_value() == false);
        CHECK(request.error().code == ConfigError::Code::InvalidType);
    }
}
