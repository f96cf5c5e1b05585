#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "relay/upstream/upstream.h"

#include "source/common/upstream/resource_manager_impl.h"

#include "test/mocks/network/mocks.h"

#include "absl/types/optional.h"
#include "gmock/gmock.h"

namespace Relay {
namespace Upstream {

class MockClusterInfo : public ClusterInfo {
public:
  MockClusterInfo();
  ~MockClusterInfo() override;

  // Replace the limits of every priority.
  void resetResourceManager(uint64_t max_connections, uint64_t max_pending_requests,
                            uint64_t max_requests, uint64_t max_retries);

  // Upstream::ClusterInfo
  MOCK_METHOD(const std::string&, name, (), (const));
  MOCK_METHOD(absl::optional<uint64_t>, maxRequestsPerConnection, (), (const));
  MOCK_METHOD(ResourceManager&, resourceManager, (ResourcePriority priority), (const));
  MOCK_METHOD(ClusterTrafficStats&, trafficStats, (), (const));

  std::string name_{"fake_cluster"};
  absl::optional<uint64_t> max_requests_per_connection_;
  ResourceManagerImplPtr resource_manager_;
  mutable ClusterTrafficStats traffic_stats_;
};

class MockHost : public Host {
public:
  struct MockCreateConnectionData {
    Network::ClientConnection* connection_{};
    HostDescriptionConstSharedPtr host_description_{};
  };

  MockHost();
  ~MockHost() override;

  CreateConnectionData createConnection() const override {
    MockCreateConnectionData data = createConnection_();
    return {Network::ClientConnectionPtr{data.connection_}, data.host_description_};
  }

  // Upstream::HostDescription
  MOCK_METHOD(const ClusterInfo&, cluster, (), (const));
  MOCK_METHOD(const std::string&, addressString, (), (const));
  MOCK_METHOD(HostStats&, stats, (), (const));

  MOCK_METHOD(MockCreateConnectionData, createConnection_, (), (const));

  std::string address_{"10.0.0.1:8080"};
  std::shared_ptr<testing::NiceMock<MockClusterInfo>> cluster_{
      std::make_shared<testing::NiceMock<MockClusterInfo>>()};
  mutable HostStats stats_;
};

} // namespace Upstream
} // namespace Relay
