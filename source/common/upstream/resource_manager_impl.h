#pragma once

#include <cstdint>
#include <memory>

#include "relay/upstream/resource_manager.h"

#include "source/common/common/basic_resource_impl.h"

namespace Relay {
namespace Upstream {

/**
 * Implementation of ResourceManager.
 * NOTE: This implementation makes some assumptions which favor simplicity over correctness.
 * 1) Primarily, it assumes that traffic will be mostly balanced over all the worker threads since
 *    no attempt is made to balance resources between them. It is possible that starvation can
 *    occur during high contention.
 * 2) Though atomics are used, it is possible for resources to temporarily go above the supplied
 *    maximums. This should not effect overall behavior.
 */
class ResourceManagerImpl : public ResourceManager {
public:
  ResourceManagerImpl(uint64_t max_connections, uint64_t max_pending_requests,
                      uint64_t max_requests, uint64_t max_retries, uint64_t max_connection_pools)
      : connections_(max_connections), pending_requests_(max_pending_requests),
        requests_(max_requests), retries_(max_retries), connection_pools_(max_connection_pools) {}

  // Upstream::ResourceManager
  ResourceLimit& connections() override { return connections_; }
  ResourceLimit& pendingRequests() override { return pending_requests_; }
  ResourceLimit& requests() override { return requests_; }
  ResourceLimit& retries() override { return retries_; }
  ResourceLimit& connectionPools() override { return connection_pools_; }

private:
  BasicResourceLimitImpl connections_;
  BasicResourceLimitImpl pending_requests_;
  BasicResourceLimitImpl requests_;
  BasicResourceLimitImpl retries_;
  BasicResourceLimitImpl connection_pools_;
};

using ResourceManagerImplPtr = std::unique_ptr<ResourceManagerImpl>;

} // namespace Upstream
} // namespace Relay
