#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON Parsing
// ─────────────────────────────────────────────────────────────────────────────
// Server responses (HTTP bodies, SSE event data, stdio lines) are parsed with
// simdjson and converted into nlohmann::json, which the rest of the code uses
// for inspection and for building outgoing messages.
//
//   auto doc = mcpenum::fast_parse(body);
//   if (doc.has_value() == false) {
//       return tl::unexpected(DiscoveryError::malformed_response(doc.error().message));
//   }

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mcpenum {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg)
        : message(std::move(msg))
    {}
};

using JsonParseResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    // Tool input schemas nest deeper than protocol envelopes; 64 still
    // rejects pathological documents well before stack exhaustion.
    std::size_t max_depth{64};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    // Each instance owns its simdjson parser; share nothing across threads
    [[nodiscard]] JsonParseResult parse(std::string_view json_str);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] JsonParseResult convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] JsonParseResult convert_object(simdjson::ondemand::object obj, std::size_t depth);
    [[nodiscard]] JsonParseResult convert_array(simdjson::ondemand::array arr, std::size_t depth);

    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;
};

/// Parse with a thread-local parser
[[nodiscard]] JsonParseResult fast_parse(std::string_view json_str);

}  // namespace mcpenum
