#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "relay/common/pure.h"
#include "relay/network/connection.h"
#include "relay/stats/primitive_stats_macros.h"
#include "relay/upstream/host_description.h"
#include "relay/upstream/resource_manager.h"

#include "absl/types/optional.h"

namespace Relay {
namespace Upstream {

/**
 * An upstream host.
 */
class Host : public HostDescription {
public:
  struct CreateConnectionData {
    Network::ClientConnectionPtr connection_;
    HostDescriptionConstSharedPtr host_description_;
  };

  /**
   * Create a connection for this host.
   * @return the connection data which includes the raw network connection and the host
   *         description. The connection is not connected yet.
   */
  virtual CreateConnectionData createConnection() const PURE;
};

using HostConstSharedPtr = std::shared_ptr<const Host>;

/**
 * All cluster traffic stats.
 */
#define ALL_CLUSTER_TRAFFIC_STATS(COUNTER, GAUGE)                                                  \
  COUNTER(upstream_cx_close_notify)                                                                \
  COUNTER(upstream_cx_connect_fail)                                                                \
  COUNTER(upstream_cx_destroy_local)                                                               \
  COUNTER(upstream_cx_destroy_local_with_active_rq)                                                \
  COUNTER(upstream_cx_destroy_remote)                                                              \
  COUNTER(upstream_cx_destroy_remote_with_active_rq)                                               \
  COUNTER(upstream_cx_http2_total)                                                                 \
  COUNTER(upstream_cx_rx_bytes_total)                                                              \
  COUNTER(upstream_cx_total)                                                                       \
  COUNTER(upstream_cx_tx_bytes_total)                                                              \
  COUNTER(upstream_rq_pending_failure_eject)                                                       \
  COUNTER(upstream_rq_pending_overflow)                                                            \
  COUNTER(upstream_rq_rx_reset)                                                                    \
  COUNTER(upstream_rq_timeout)                                                                     \
  COUNTER(upstream_rq_total)                                                                       \
  COUNTER(upstream_rq_tx_reset)                                                                    \
  GAUGE(upstream_cx_active)                                                                        \
  GAUGE(upstream_cx_rx_bytes_buffered)                                                             \
  GAUGE(upstream_cx_tx_bytes_buffered)                                                             \
  GAUGE(upstream_rq_active)

/**
 * Struct definition for all cluster traffic stats. @see primitive_stats_macros.h
 */
struct ClusterTrafficStats {
  ALL_CLUSTER_TRAFFIC_STATS(GENERATE_PRIMITIVE_COUNTER_STRUCT, GENERATE_PRIMITIVE_GAUGE_STRUCT);

  std::vector<std::pair<absl::string_view, Stats::PrimitiveCounterReference>> counters() {
    return {ALL_CLUSTER_TRAFFIC_STATS(PRIMITIVE_COUNTER_NAME_AND_REFERENCE,
                                      IGNORE_PRIMITIVE_GAUGE)};
  }

  std::vector<std::pair<absl::string_view, Stats::PrimitiveGaugeReference>> gauges() {
    return {ALL_CLUSTER_TRAFFIC_STATS(IGNORE_PRIMITIVE_COUNTER,
                                      PRIMITIVE_GAUGE_NAME_AND_REFERENCE)};
  }
};

/**
 * Information about a given upstream cluster.
 */
class ClusterInfo {
public:
  virtual ~ClusterInfo() = default;

  /**
   * @return the name of the cluster.
   */
  virtual const std::string& name() const PURE;

  /**
   * @return the maximum number of streams a single connection may carry over its lifetime, or
   *         absl::nullopt if unlimited.
   */
  virtual absl::optional<uint64_t> maxRequestsPerConnection() const PURE;

  /**
   * @return ResourceManager& the resource manager to use by proxy agents for this cluster (at
   *         a particular priority).
   */
  virtual ResourceManager& resourceManager(ResourcePriority priority) const PURE;

  /**
   * @return ClusterTrafficStats& all traffic related stats for this cluster.
   */
  virtual ClusterTrafficStats& trafficStats() const PURE;
};

using ClusterInfoConstSharedPtr = std::shared_ptr<const ClusterInfo>;

} // namespace Upstream
} // namespace Relay
