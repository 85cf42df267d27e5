#pragma once

#include "client/ireplica_client.hpp"
#include "core/error.hpp"

#include <memory>
#include <string>

namespace logfanout {

/**
 * @brief Address -> client lookup shared process-wide
 *
 * Get-or-create semantics belong to the implementation. Fails with
 * ErrorCategory::UNAVAILABLE when no connection can be established.
 */
class IReplicaClientPool {
public:
    virtual ~IReplicaClientPool() = default;

    [[nodiscard]] virtual Result<std::shared_ptr<IReplicaClient>> client_for(
        const std::string& addr) = 0;
};

} // namespace logfanout
