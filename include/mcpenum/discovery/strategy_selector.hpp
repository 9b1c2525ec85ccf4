#pragma once

#include "mcpenum/discovery/server_spec.hpp"
#include "mcpenum/discovery/strategy.hpp"

#include <memory>

namespace mcpenum {

/// Which strategy handles a connection shape. A url wins over a command,
/// and a declaration with neither is handled statically. Total and pure.
[[nodiscard]] StrategyKind select_strategy(const ServerSpec& spec) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// StrategySet
// ─────────────────────────────────────────────────────────────────────────────
// One instance of each strategy, shared by every server of a request.
// Missing slots are not allowed: construction fails loudly on nullptr.

class StrategySet {
public:
    StrategySet(
        std::shared_ptr<IDiscoveryStrategy> http,
        std::shared_ptr<IDiscoveryStrategy> stdio,
        std::shared_ptr<IDiscoveryStrategy> static_config
    );

    [[nodiscard]] IDiscoveryStrategy& resolve(StrategyKind kind) const noexcept;

private:
    std::shared_ptr<IDiscoveryStrategy> http_;
    std::shared_ptr<IDiscoveryStrategy> stdio_;
    std::shared_ptr<IDiscoveryStrategy> static_;
};

}  // namespace mcpenum
