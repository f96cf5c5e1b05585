#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "relay/common/pure.h"
#include "relay/stats/primitive_stats_macros.h"

#include "absl/strings/string_view.h"

namespace Relay {
namespace Upstream {

/**
 * All per host stats.
 */
#define ALL_HOST_STATS(COUNTER, GAUGE)                                                             \
  COUNTER(cx_close_notify)                                                                         \
  COUNTER(cx_connect_fail)                                                                         \
  COUNTER(cx_destroy_local)                                                                        \
  COUNTER(cx_destroy_local_with_active_rq)                                                         \
  COUNTER(cx_destroy_remote)                                                                       \
  COUNTER(cx_destroy_remote_with_active_rq)                                                        \
  COUNTER(cx_http2_total)                                                                          \
  COUNTER(cx_total)                                                                                \
  COUNTER(rq_pending_failure_eject)                                                                \
  COUNTER(rq_pending_overflow)                                                                     \
  COUNTER(rq_rx_reset)                                                                             \
  COUNTER(rq_timeout)                                                                              \
  COUNTER(rq_total)                                                                                \
  COUNTER(rq_tx_reset)                                                                             \
  GAUGE(cx_active)                                                                                 \
  GAUGE(rq_active)

/**
 * All per host stats defined. @see primitive_stats_macros.h
 */
struct HostStats {
  ALL_HOST_STATS(GENERATE_PRIMITIVE_COUNTER_STRUCT, GENERATE_PRIMITIVE_GAUGE_STRUCT);

  // Provide access to name,counter pairs.
  std::vector<std::pair<absl::string_view, Stats::PrimitiveCounterReference>> counters() {
    return {ALL_HOST_STATS(PRIMITIVE_COUNTER_NAME_AND_REFERENCE, IGNORE_PRIMITIVE_GAUGE)};
  }

  // Provide access to name,gauge pairs.
  std::vector<std::pair<absl::string_view, Stats::PrimitiveGaugeReference>> gauges() {
    return {ALL_HOST_STATS(IGNORE_PRIMITIVE_COUNTER, PRIMITIVE_GAUGE_NAME_AND_REFERENCE)};
  }
};

class ClusterInfo;

/**
 * A description of an upstream host.
 */
class HostDescription {
public:
  virtual ~HostDescription() = default;

  /**
   * @return the cluster the host is a member of.
   */
  virtual const ClusterInfo& cluster() const PURE;

  /**
   * @return the host's address in "host:port" form. Connections are pooled by this key.
   */
  virtual const std::string& addressString() const PURE;

  /**
   * @return all of the stats for the host.
   */
  virtual HostStats& stats() const PURE;
};

using HostDescriptionConstSharedPtr = std::shared_ptr<const HostDescription>;

} // namespace Upstream
} // namespace Relay
