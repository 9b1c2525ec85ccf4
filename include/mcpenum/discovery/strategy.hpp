#pragma once

#include "mcpenum/deadline.hpp"
#include "mcpenum/discovery/discovery_error.hpp"
#include "mcpenum/discovery/server_spec.hpp"

namespace mcpenum {

// ─────────────────────────────────────────────────────────────────────────────
// IDiscoveryStrategy
// ─────────────────────────────────────────────────────────────────────────────
// One way of learning a server's tools. Implementations are shared by all
// concurrently running servers of a request, so discover() must be
// reentrant: per-server state lives on the stack of the call.
//
// discover() returns before the deadline expires (allowing a short overrun
// for teardown) and gives up promptly once the deadline's token is cancelled.
// Tools are returned with their `server` field set to descriptor.name.

class IDiscoveryStrategy {
public:
    virtual ~IDiscoveryStrategy() = default;

    [[nodiscard]] virtual DiscoveryResult discover(
        const ServerDescriptor& descriptor,
        const Deadline& deadline
    ) = 0;
};

}  // namespace mcpenum
