#pragma once

#include "mcpenum/discovery/strategy.hpp"

namespace mcpenum {

struct StaticDiscoveryConfig {
    // Report "<server>_config" for declarations that list no tools at all
    bool emit_placeholder{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// StaticDiscoveryStrategy
// ─────────────────────────────────────────────────────────────────────────────
// Reads tools out of the declaration itself. No I/O, never blocks and never
// fails: unusable entries are skipped with a warning.
//
// Sources, first match wins:
//   metadata.tools               array of tool objects or {"name": {...}} map
//   metadata.capabilities.tools  array of names or tool objects
//   placeholder                  "<server>_config" (unless disabled)

class StaticDiscoveryStrategy final : public IDiscoveryStrategy {
public:
    StaticDiscoveryStrategy() = default;
    explicit StaticDiscoveryStrategy(StaticDiscoveryConfig config) : config_(config) {}

    [[nodiscard]] DiscoveryResult discover(
        const ServerDescriptor& descriptor,
        const Deadline& deadline
    ) override;

private:
    StaticDiscoveryConfig config_;
};

}  // namespace mcpenum
