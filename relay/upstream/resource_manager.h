#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "relay/common/pure.h"
#include "relay/common/resource.h"

namespace Relay {
namespace Upstream {

/**
 * Resource priority classes. The parallel NumResourcePriorities constant allows defining fixed
 * arrays for each priority, but does not pollute the enum.
 */
enum class ResourcePriority { Default, High };
const size_t NumResourcePriorities = 2;

/**
 * Global resource manager that loosely synchronizes maximum connections, pending requests, etc.
 * NOTE: Currently this is used on a per cluster basis.
 */
class ResourceManager {
public:
  virtual ~ResourceManager() = default;

  /**
   * @return ResourceLimit& active TCP connections.
   */
  virtual ResourceLimit& connections() PURE;

  /**
   * @return ResourceLimit& active pending requests (requests that have not yet been attached to a
   *         connection pool connection).
   */
  virtual ResourceLimit& pendingRequests() PURE;

  /**
   * @return ResourceLimit& active requests (requests that are currently bound to a connection pool
   *         connection and are awaiting response).
   */
  virtual ResourceLimit& requests() PURE;

  /**
   * @return ResourceLimit& active retries.
   */
  virtual ResourceLimit& retries() PURE;

  /**
   * @return ResourceLimit& active connection pools.
   */
  virtual ResourceLimit& connectionPools() PURE;
};

using ResourceManagerPtr = std::unique_ptr<ResourceManager>;

} // namespace Upstream
} // namespace Relay
