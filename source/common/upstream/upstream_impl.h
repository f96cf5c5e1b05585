#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>

#include "relay/network/client_connection_factory.h"
#include "relay/upstream/resource_manager.h"
#include "relay/upstream/upstream.h"

#include "source/common/common/logger.h"
#include "source/common/upstream/resource_manager_impl.h"

#include "absl/status/statusor.h"
#include "api/relay/config/cluster/v3/cluster.pb.h"

namespace Relay {
namespace Upstream {

/**
 * Implementation of Upstream::ClusterInfo.
 */
class ClusterInfoImpl : public ClusterInfo, protected Logger::Loggable<Logger::Id::upstream> {
public:
  /**
   * Validate the cluster config and build the cluster info.
   * @return the cluster info, or an InvalidArgument status if the config is rejected.
   */
  static absl::StatusOr<ClusterInfoConstSharedPtr>
  create(const relay::config::cluster::v3::Cluster& config);

  // Upstream::ClusterInfo
  const std::string& name() const override { return name_; }
  absl::optional<uint64_t> maxRequestsPerConnection() const override {
    return max_requests_per_connection_;
  }
  ResourceManager& resourceManager(ResourcePriority priority) const override;
  ClusterTrafficStats& trafficStats() const override { return traffic_stats_; }

private:
  struct ResourceManagers {
    explicit ResourceManagers(const relay::config::cluster::v3::Cluster& config);
    ResourceManagerImplPtr load(const relay::config::cluster::v3::Cluster& config,
                                const relay::config::cluster::v3::RoutingPriority& priority);

    using Managers = std::array<ResourceManagerImplPtr, NumResourcePriorities>;

    Managers managers_;
  };

  explicit ClusterInfoImpl(const relay::config::cluster::v3::Cluster& config);

  const std::string name_;
  const absl::optional<uint64_t> max_requests_per_connection_;
  mutable ResourceManagers resource_managers_;
  mutable ClusterTrafficStats traffic_stats_;
};

/**
 * Implementation of Upstream::Host.
 */
class HostImpl : public Host,
                 public std::enable_shared_from_this<HostImpl>,
                 protected Logger::Loggable<Logger::Id::upstream> {
public:
  HostImpl(ClusterInfoConstSharedPtr cluster, const std::string& address,
           Network::ClientConnectionFactory& connection_factory)
      : cluster_(std::move(cluster)), address_(address), connection_factory_(connection_factory) {}

  // Upstream::HostDescription
  const ClusterInfo& cluster() const override { return *cluster_; }
  const std::string& addressString() const override { return address_; }
  HostStats& stats() const override { return stats_; }

  // Upstream::Host
  CreateConnectionData createConnection() const override;

private:
  ClusterInfoConstSharedPtr cluster_;
  const std::string address_;
  Network::ClientConnectionFactory& connection_factory_;
  mutable HostStats stats_;
};

using HostImplSharedPtr = std::shared_ptr<HostImpl>;

} // namespace Upstream
} // namespace Relay
