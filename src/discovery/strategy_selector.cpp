#include "mcpenum/discovery/strategy_selector.hpp"

#include <stdexcept>

namespace mcpenum {

StrategyKind select_strategy(const ServerSpec& spec) noexcept {
    if (const auto* http = std::get_if<HttpSpec>(&spec)) {
        if (http->url.empty() == false) {
            return StrategyKind::Http;
        }
    }
    if (const auto* command = std::get_if<CommandSpec>(&spec)) {
        if (command->command.empty() == false) {
            return StrategyKind::Stdio;
        }
    }
    return StrategyKind::Static;
}

StrategySet::StrategySet(
    std::shared_ptr<IDiscoveryStrategy> http,
    std::shared_ptr<IDiscoveryStrategy> stdio,
    std::shared_ptr<IDiscoveryStrategy> static_config
)
    : http_(std::move(http))
    , stdio_(std::move(stdio))
    , static_(std::move(static_config))
{
    const bool complete = http_ && stdio_ && static_;
    if (complete == false) {
        throw std::invalid_argument("StrategySet requires all three strategies");
    }
}

IDiscoveryStrategy& StrategySet::resolve(StrategyKind kind) const noexcept {
    switch (kind) {
        case StrategyKind::Http:   return *http_;
        case StrategyKind::Stdio:  return *stdio_;
        case StrategyKind::Static: return *static_;
    }
    return *static_;
}

}  // namespace mcpenum
