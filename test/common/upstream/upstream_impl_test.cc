#include <limits>
#include <memory>
#include <string>

#include "source/common/upstream/upstream_impl.h"

#include "test/mocks/network/mocks.h"
#include "test/test_common/status_utility.h"
#include "test/test_common/utility.h"

#include "api/relay/config/cluster/v3/cluster.pb.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using testing::Eq;
using testing::HasSubstr;
using testing::NiceMock;
using testing::Return;

namespace Relay {
namespace Upstream {
namespace {

using StatusHelpers::StatusIs;

relay::config::cluster::v3::Cluster parseClusterFromJson(const std::string& json) {
  return TestUtility::parseJson<relay::config::cluster::v3::Cluster>(json);
}

ClusterInfoConstSharedPtr makeClusterInfo(const std::string& json) {
  absl::StatusOr<ClusterInfoConstSharedPtr> cluster =
      ClusterInfoImpl::create(parseClusterFromJson(json));
  EXPECT_TRUE(cluster.ok()) << cluster.status();
  return cluster.ok() ? cluster.value() : nullptr;
}

TEST(ClusterInfoImplTest, Defaults) {
  ClusterInfoConstSharedPtr cluster = makeClusterInfo(R"EOF({"name": "backend"})EOF");
  ASSERT_NE(nullptr, cluster);

  EXPECT_EQ("backend", cluster->name());
  EXPECT_FALSE(cluster->maxRequestsPerConnection().has_value());
  for (ResourcePriority priority : {ResourcePriority::Default, ResourcePriority::High}) {
    ResourceManager& resource_manager = cluster->resourceManager(priority);
    EXPECT_EQ(1024U, resource_manager.connections().max());
    EXPECT_EQ(1024U, resource_manager.pendingRequests().max());
    EXPECT_EQ(1024U, resource_manager.requests().max());
    EXPECT_EQ(3U, resource_manager.retries().max());
    EXPECT_EQ(std::numeric_limits<uint64_t>::max(), resource_manager.connectionPools().max());
  }
}

TEST(ClusterInfoImplTest, CircuitBreakersPerPriority) {
  const std::string json = R"EOF(
  {
    "name": "backend",
    "max_requests_per_connection": 100,
    "circuit_breakers": {
      "thresholds": [
        {"priority": "DEFAULT", "max_requests": 10, "max_retries": 1},
        {"priority": "HIGH", "max_connections": 5, "max_pending_requests": 6,
         "max_requests": 20, "max_connection_pools": 2}
      ]
    }
  }
  )EOF";
  ClusterInfoConstSharedPtr cluster = makeClusterInfo(json);
  ASSERT_NE(nullptr, cluster);

  EXPECT_EQ(100U, cluster->maxRequestsPerConnection().value());

  ResourceManager& normal = cluster->resourceManager(ResourcePriority::Default);
  EXPECT_EQ(1024U, normal.connections().max());
  EXPECT_EQ(1024U, normal.pendingRequests().max());
  EXPECT_EQ(10U, normal.requests().max());
  EXPECT_EQ(1U, normal.retries().max());

  ResourceManager& high = cluster->resourceManager(ResourcePriority::High);
  EXPECT_EQ(5U, high.connections().max());
  EXPECT_EQ(6U, high.pendingRequests().max());
  EXPECT_EQ(20U, high.requests().max());
  EXPECT_EQ(3U, high.retries().max());
  EXPECT_EQ(2U, high.connectionPools().max());
}

TEST(ClusterInfoImplTest, PrioritiesDoNotShareLimits) {
  ClusterInfoConstSharedPtr cluster = makeClusterInfo(R"EOF({"name": "backend"})EOF");
  ASSERT_NE(nullptr, cluster);

  cluster->resourceManager(ResourcePriority::Default).requests().inc();
  EXPECT_EQ(1U, cluster->resourceManager(ResourcePriority::Default).requests().count());
  EXPECT_EQ(0U, cluster->resourceManager(ResourcePriority::High).requests().count());
  cluster->resourceManager(ResourcePriority::Default).requests().dec();
}

TEST(ClusterInfoImplTest, EmptyNameIsRejected) {
  EXPECT_THAT(ClusterInfoImpl::create(parseClusterFromJson("{}")),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(ClusterInfoImplTest, DuplicatePriorityIsRejected) {
  const std::string json = R"EOF(
  {
    "name": "backend",
    "circuit_breakers": {
      "thresholds": [
        {"priority": "HIGH", "max_requests": 10},
        {"priority": "HIGH", "max_requests": 20}
      ]
    }
  }
  )EOF";
  absl::StatusOr<ClusterInfoConstSharedPtr> cluster =
      ClusterInfoImpl::create(parseClusterFromJson(json));
  ASSERT_FALSE(cluster.ok());
  EXPECT_EQ(absl::StatusCode::kInvalidArgument, cluster.status().code());
  EXPECT_THAT(std::string(cluster.status().message()),
              HasSubstr("duplicate circuit breaker priority HIGH"));
}

TEST(ClusterInfoImplTest, TrafficStatsStartAtZero) {
  ClusterInfoConstSharedPtr cluster = makeClusterInfo(R"EOF({"name": "backend"})EOF");
  ASSERT_NE(nullptr, cluster);

  for (const auto& [name, counter] : cluster->trafficStats().counters()) {
    EXPECT_EQ(0U, counter.get().value()) << name;
  }
  for (const auto& [name, gauge] : cluster->trafficStats().gauges()) {
    EXPECT_EQ(0U, gauge.get().value()) << name;
  }
  cluster->trafficStats().upstream_rq_total_.inc();
  EXPECT_EQ(1U, cluster->trafficStats().upstream_rq_total_.value());
}

class HostImplTest : public testing::Test {
public:
  HostImplTest()
      : cluster_(makeClusterInfo(R"EOF({"name": "backend"})EOF")),
        host_(std::make_shared<HostImpl>(cluster_, "10.0.0.1:8080", connection_factory_)) {}

  NiceMock<Network::MockClientConnectionFactory> connection_factory_;
  ClusterInfoConstSharedPtr cluster_;
  HostImplSharedPtr host_;
};

TEST_F(HostImplTest, Description) {
  EXPECT_EQ("10.0.0.1:8080", host_->addressString());
  EXPECT_EQ(cluster_.get(), &host_->cluster());
  EXPECT_EQ(0U, host_->stats().cx_total_.value());
}

TEST_F(HostImplTest, CreateConnection) {
  auto* connection = new NiceMock<Network::MockClientConnection>();
  EXPECT_CALL(connection_factory_, createClientConnection_(Eq("10.0.0.1:8080")))
      .WillOnce(Return(connection));

  Host::CreateConnectionData data = host_->createConnection();
  EXPECT_EQ(connection, data.connection_.get());
  EXPECT_EQ(host_.get(), data.host_description_.get());
}

TEST_F(HostImplTest, CreateConnectionWithoutTransport) {
  EXPECT_CALL(connection_factory_, createClientConnection_(Eq("10.0.0.1:8080")))
      .WillOnce(Return(nullptr));

  Host::CreateConnectionData data = host_->createConnection();
  EXPECT_EQ(nullptr, data.connection_);
  EXPECT_EQ(host_.get(), data.host_description_.get());
}

} // namespace
} // namespace Upstream
} // namespace Relay
