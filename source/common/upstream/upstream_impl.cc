#include "source/common/upstream/upstream_impl.h"

#include <algorithm>
#include <limits>

#include "source/common/protobuf/utility.h"

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"

namespace Relay {
namespace Upstream {
namespace {

constexpr uint64_t DefaultMaxConnections = 1024;
constexpr uint64_t DefaultMaxPendingRequests = 1024;
constexpr uint64_t DefaultMaxRequests = 1024;
constexpr uint64_t DefaultMaxRetries = 3;

} // namespace

absl::StatusOr<ClusterInfoConstSharedPtr>
ClusterInfoImpl::create(const relay::config::cluster::v3::Cluster& config) {
  if (config.name().empty()) {
    return absl::InvalidArgumentError("cluster: name must not be empty");
  }

  absl::flat_hash_set<int> seen_priorities;
  for (const auto& threshold : config.circuit_breakers().thresholds()) {
    if (!seen_priorities.insert(threshold.priority()).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("cluster ", config.name(), ": duplicate circuit breaker priority ",
                       relay::config::cluster::v3::RoutingPriority_Name(threshold.priority())));
    }
  }

  return ClusterInfoConstSharedPtr(new ClusterInfoImpl(config));
}

ClusterInfoImpl::ClusterInfoImpl(const relay::config::cluster::v3::Cluster& config)
    : name_(config.name()),
      max_requests_per_connection_(
          config.has_max_requests_per_connection()
              ? absl::optional<uint64_t>(config.max_requests_per_connection().value())
              : absl::nullopt),
      resource_managers_(config) {
  RELAY_LOG(debug, "cluster '{}' created, max requests per connection: {}", name_,
            max_requests_per_connection_.has_value()
                ? std::to_string(max_requests_per_connection_.value())
                : "unlimited");
}

ResourceManager& ClusterInfoImpl::resourceManager(ResourcePriority priority) const {
  ASSERT(static_cast<size_t>(priority) < resource_managers_.managers_.size());
  return *resource_managers_.managers_[static_cast<size_t>(priority)];
}

ClusterInfoImpl::ResourceManagers::ResourceManagers(
    const relay::config::cluster::v3::Cluster& config) {
  managers_[static_cast<size_t>(ResourcePriority::Default)] =
      load(config, relay::config::cluster::v3::DEFAULT);
  managers_[static_cast<size_t>(ResourcePriority::High)] =
      load(config, relay::config::cluster::v3::HIGH);
}

ResourceManagerImplPtr ClusterInfoImpl::ResourceManagers::load(
    const relay::config::cluster::v3::Cluster& config,
    const relay::config::cluster::v3::RoutingPriority& priority) {
  uint64_t max_connections = DefaultMaxConnections;
  uint64_t max_pending_requests = DefaultMaxPendingRequests;
  uint64_t max_requests = DefaultMaxRequests;
  uint64_t max_retries = DefaultMaxRetries;
  uint64_t max_connection_pools = std::numeric_limits<uint64_t>::max();

  const auto& thresholds = config.circuit_breakers().thresholds();
  const auto it = std::find_if(
      thresholds.cbegin(), thresholds.cend(),
      [priority](const relay::config::cluster::v3::CircuitBreakers::Thresholds& threshold) {
        return threshold.priority() == priority;
      });
  if (it != thresholds.cend()) {
    max_connections = PROTOBUF_GET_WRAPPED_OR_DEFAULT(*it, max_connections, max_connections);
    max_pending_requests =
        PROTOBUF_GET_WRAPPED_OR_DEFAULT(*it, max_pending_requests, max_pending_requests);
    max_requests = PROTOBUF_GET_WRAPPED_OR_DEFAULT(*it, max_requests, max_requests);
    max_retries = PROTOBUF_GET_WRAPPED_OR_DEFAULT(*it, max_retries, max_retries);
    max_connection_pools =
        PROTOBUF_GET_WRAPPED_OR_DEFAULT(*it, max_connection_pools, max_connection_pools);
  }

  return std::make_unique<ResourceManagerImpl>(max_connections, max_pending_requests,
                                               max_requests, max_retries, max_connection_pools);
}

Host::CreateConnectionData HostImpl::createConnection() const {
  RELAY_LOG(trace, "creating connection to {}", address_);
  return {connection_factory_.createClientConnection(address_), shared_from_this()};
}

} // namespace Upstream
} // namespace Relay
