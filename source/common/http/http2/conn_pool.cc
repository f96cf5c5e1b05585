#include "source/common/http/http2/conn_pool.h"

#include <vector>

#include "source/common/common/assert.h"
#include "source/common/http/utility.h"
#include "source/common/network/utility.h"

#include "absl/strings/str_cat.h"

namespace Relay {
namespace Http {
namespace Http2 {

ConnPoolImpl::ConnPoolImpl(Upstream::HostConstSharedPtr host, Upstream::ResourcePriority priority,
                           MultiplexerFactory& multiplexer_factory, CreateCodecFn codec_fn)
    : host_(std::move(host)), priority_(priority), codec_fn_(std::move(codec_fn)),
      multiplexer_(multiplexer_factory.createMultiplexer(*this)) {
  RELEASE_ASSERT(host_ != nullptr, "connection pool requires a host");
  RELEASE_ASSERT(multiplexer_ != nullptr, "multiplexer factory returned no multiplexer");
}

ConnPoolImpl::~ConnPoolImpl() { close(); }

absl::string_view ConnPoolImpl::protocolDescription() const {
  return Utility::getProtocolString(protocol());
}

bool ConnPoolImpl::hasActiveConnections() const {
  std::vector<ActiveClientSharedPtr> clients;
  {
    absl::MutexLock lock(&mutex_);
    for (const auto& [address, entry] : clients_by_address_) {
      clients.insert(clients.end(), entry->clients_.begin(), entry->clients_.end());
    }
    clients.insert(clients.end(), draining_clients_.begin(), draining_clients_.end());
    for (const ActiveClientSharedPtr& client : clients) {
      if (client->pending_streams_ > 0) {
        return true;
      }
    }
  }

  // Codec clients are queried without mutex_ since they may call back into the pool.
  for (const ActiveClientSharedPtr& client : clients) {
    if (client->codec_client_->numActiveRequests() > 0) {
      return true;
    }
  }
  return false;
}

size_t ConnPoolImpl::numActiveClients() const {
  absl::MutexLock lock(&mutex_);
  size_t count = 0;
  for (const auto& [address, entry] : clients_by_address_) {
    count += entry->clients_.size();
  }
  return count;
}

size_t ConnPoolImpl::numDrainingClients() const {
  absl::MutexLock lock(&mutex_);
  return draining_clients_.size();
}

std::list<ConnPoolImpl::ActiveClientSharedPtr>
ConnPoolImpl::activeClients(absl::string_view address) const {
  absl::MutexLock lock(&mutex_);
  auto it = clients_by_address_.find(address);
  if (it == clients_by_address_.end()) {
    return {};
  }
  return it->second->clients_;
}

ConnectionPool::Cancellable* ConnPoolImpl::newStream(absl::string_view stream_id,
                                                     ResponseDecoder& response_decoder,
                                                     ConnectionPool::Callbacks& callbacks) {
  purgeClosedClients();

  std::string failure_reason;
  ActiveClientSharedPtr client = getOrCreateActiveClient(host_->addressString(), failure_reason);
  if (client == nullptr) {
    RELAY_STREAM_LOG(debug, "no connection to {}: {}", stream_id, host_->addressString(),
                     failure_reason);
    callbacks.onPoolFailure(stream_id, ConnectionPool::PoolFailureReason::ConnectionFailure,
                            failure_reason, host_);
    return nullptr;
  }

  ResourceLimit& requests = host_->cluster().resourceManager(priority_).requests();
  if (!requests.canCreate()) {
    releaseStream(*client, false);
    RELAY_STREAM_LOG(debug, "max requests overflow", stream_id);
    callbacks.onPoolFailure(stream_id, ConnectionPool::PoolFailureReason::Overflow, "", nullptr);
    host_->stats().rq_pending_overflow_.inc();
    host_->cluster().trafficStats().upstream_rq_pending_overflow_.inc();
    return nullptr;
  }

  host_->stats().rq_total_.inc();
  host_->stats().rq_active_.inc();
  host_->cluster().trafficStats().upstream_rq_total_.inc();
  host_->cluster().trafficStats().upstream_rq_active_.inc();
  requests.inc();

  RELAY_CONN_LOG(debug, "creating stream {}", *client->codec_client_, stream_id);
  RequestEncoder& encoder = client->codec_client_->newStream(stream_id, response_decoder);
  releaseStream(*client, true);
  callbacks.onPoolReady(stream_id, encoder, client->real_host_description_);
  return nullptr;
}

absl::Status ConnPoolImpl::initActiveClient() {
  purgeClosedClients();

  std::string failure_reason;
  ActiveClientSharedPtr client = getOrCreateActiveClient(host_->addressString(), failure_reason);
  if (client == nullptr) {
    return absl::UnavailableError(
        absl::StrCat("unable to connect to ", host_->addressString(), ": ", failure_reason));
  }
  releaseStream(*client, false);
  return absl::OkStatus();
}

ConnPoolImpl::ActiveClientSharedPtr
ConnPoolImpl::getOrCreateActiveClient(const std::string& address, std::string& failure_reason) {
  AddressClients* entry;
  {
    absl::MutexLock lock(&mutex_);
    std::unique_ptr<AddressClients>& slot = clients_by_address_[address];
    if (slot == nullptr) {
      slot = std::make_unique<AddressClients>();
    }
    entry = slot.get();
    if (ActiveClientSharedPtr client = findReadyClient(*entry); client != nullptr) {
      reserveStream(*client);
      return client;
    }
  }

  // Entries are never erased while the pool lives, so entry stays valid without mutex_. Another
  // caller may have created a connection while we waited for the creation lock.
  absl::MutexLock creation_lock(&entry->creation_mutex_);
  {
    absl::MutexLock lock(&mutex_);
    if (ActiveClientSharedPtr client = findReadyClient(*entry); client != nullptr) {
      reserveStream(*client);
      return client;
    }
  }

  auto client = std::make_shared<ActiveClient>(*this, address);
  const absl::Status status = client->initialize();
  if (!status.ok()) {
    failure_reason = std::string(status.message());
    return nullptr;
  }

  absl::MutexLock lock(&mutex_);
  if (client->state_ != ActiveClient::State::Connecting) {
    failure_reason = "connection closed during setup";
    return nullptr;
  }
  client->state_ = ActiveClient::State::Ready;
  entry->clients_.push_back(client);
  reserveStream(*client);
  RELAY_CONN_LOG(debug, "added to pool for {}, {} connections", *client->codec_client_, address,
                 entry->clients_.size());
  return client;
}

ConnPoolImpl::ActiveClientSharedPtr ConnPoolImpl::findReadyClient(const AddressClients& entry) const {
  for (const ActiveClientSharedPtr& client : entry.clients_) {
    if (canTakeNewStream(*client)) {
      return client;
    }
  }
  return nullptr;
}

bool ConnPoolImpl::canTakeNewStream(const ActiveClient& client) const {
  const absl::optional<uint64_t> max_streams = host_->cluster().maxRequestsPerConnection();
  if (max_streams.has_value() && client.totalStreams() >= max_streams.value()) {
    return false;
  }
  return client.multiplexed_connection_->canTakeNewRequest();
}

void ConnPoolImpl::reserveStream(ActiveClient& client) {
  // Runs in the same critical section as canTakeNewStream().
  client.pending_streams_++;
  client.total_streams_++;
}

void ConnPoolImpl::releaseStream(ActiveClient& client, bool stream_created) {
  bool close_now;
  {
    absl::MutexLock lock(&mutex_);
    ASSERT(client.pending_streams_ > 0);
    client.pending_streams_--;
    if (!stream_created) {
      client.total_streams_--;
    }
    close_now = client.state_ == ActiveClient::State::Draining && client.pending_streams_ == 0 &&
                !client.closedWithActiveRequest();
  }
  // The client was retired while the stream was being set up.
  if (close_now) {
    closeIfIdle(client);
  }
}

bool ConnPoolImpl::retireClient(ActiveClient& client) {
  if (client.state_ != ActiveClient::State::Ready) {
    return false;
  }

  auto it = clients_by_address_.find(client.address_);
  ASSERT(it != clients_by_address_.end());
  std::list<ActiveClientSharedPtr>& clients = it->second->clients_;
  for (auto client_it = clients.begin(); client_it != clients.end(); ++client_it) {
    if (client_it->get() == &client) {
      draining_clients_.splice(draining_clients_.end(), clients, client_it);
      client.state_ = ActiveClient::State::Draining;
      return true;
    }
  }

  IS_RELAY_BUG("ready client missing from its address list");
  return false;
}

void ConnPoolImpl::closeIfIdle(ActiveClient& client) {
  {
    absl::MutexLock lock(&mutex_);
    // Retired clients take no new reservations. The last releaseStream() closes it instead.
    if (client.pending_streams_ > 0) {
      return;
    }
  }
  if (client.codec_client_->numActiveRequests() == 0) {
    RELAY_CONN_LOG(debug, "closing idle retired connection", *client.codec_client_);
    client.codec_client_->close();
  }
}

void ConnPoolImpl::purgeClosedClients() {
  std::list<ActiveClientSharedPtr> to_destroy;
  {
    absl::MutexLock lock(&mutex_);
    to_destroy.swap(closed_clients_);
  }
}

void ConnPoolImpl::close() {
  std::vector<ActiveClientSharedPtr> to_close;
  {
    absl::MutexLock lock(&mutex_);
    for (const auto& [address, entry] : clients_by_address_) {
      to_close.insert(to_close.end(), entry->clients_.begin(), entry->clients_.end());
    }
    to_close.insert(to_close.end(), draining_clients_.begin(), draining_clients_.end());
  }

  // Closing raises LocalClose synchronously, which re-enters the pool to remove the client.
  for (const ActiveClientSharedPtr& client : to_close) {
    client->codec_client_->close();
  }
  purgeClosedClients();
}

void ConnPoolImpl::drainConnections() {
  std::vector<ActiveClientSharedPtr> retired;
  {
    absl::MutexLock lock(&mutex_);
    for (const auto& [address, entry] : clients_by_address_) {
      retired.insert(retired.end(), entry->clients_.begin(), entry->clients_.end());
    }
    for (const ActiveClientSharedPtr& client : retired) {
      retireClient(*client);
    }
  }

  RELAY_LOG(debug, "draining {} connections to {}", retired.size(), host_->addressString());
  for (const ActiveClientSharedPtr& client : retired) {
    closeIfIdle(*client);
  }
  purgeClosedClients();
}

void ConnPoolImpl::markDead(const MultiplexedConnection& connection) {
  ActiveClientSharedPtr dead;
  {
    absl::MutexLock lock(&mutex_);
    for (const auto& [address, entry] : clients_by_address_) {
      for (const ActiveClientSharedPtr& client : entry->clients_) {
        if (client->multiplexed_connection_.get() == &connection) {
          dead = client;
          break;
        }
      }
      if (dead != nullptr) {
        break;
      }
    }
    if (dead == nullptr) {
      RELAY_LOG(debug, "dead connection {} is not pooled", connection.id());
      return;
    }
    retireClient(*dead);
  }

  RELAY_CONN_LOG(debug, "marked dead by multiplexer", *dead->codec_client_);
  closeIfIdle(*dead);
}

void ConnPoolImpl::onConnectionEvent(ActiveClient& client, Network::ConnectionEvent event) {
  Upstream::HostStats& host_stats = host_->stats();
  Upstream::ClusterTrafficStats& cluster_stats = host_->cluster().trafficStats();

  switch (event) {
  case Network::ConnectionEvent::LocalClose:
  case Network::ConnectionEvent::RemoteClose: {
    {
      absl::MutexLock lock(&mutex_);
      if (client.state_ == ActiveClient::State::Closed) {
        return;
      }
      retireClient(client);
      for (auto it = draining_clients_.begin(); it != draining_clients_.end(); ++it) {
        if (it->get() == &client) {
          closed_clients_.splice(closed_clients_.end(), draining_clients_, it);
          break;
        }
      }
      client.state_ = ActiveClient::State::Closed;
    }

    const bool local = event == Network::ConnectionEvent::LocalClose;
    RELAY_CONN_LOG(debug, "{} close, active requests: {}", *client.codec_client_,
                   local ? "local" : "remote", client.closedWithActiveRequest());
    if (local) {
      host_stats.cx_destroy_local_.inc();
      cluster_stats.upstream_cx_destroy_local_.inc();
    } else {
      host_stats.cx_destroy_remote_.inc();
      cluster_stats.upstream_cx_destroy_remote_.inc();
    }
    if (client.closedWithActiveRequest()) {
      if (local) {
        host_stats.cx_destroy_local_with_active_rq_.inc();
        cluster_stats.upstream_cx_destroy_local_with_active_rq_.inc();
      } else {
        host_stats.cx_destroy_remote_with_active_rq_.inc();
        cluster_stats.upstream_cx_destroy_remote_with_active_rq_.inc();
      }
    }
    host_stats.cx_active_.dec();
    cluster_stats.upstream_cx_active_.dec();
    break;
  }
  case Network::ConnectionEvent::ConnectTimeout:
    RELAY_CONN_LOG(debug, "connect timeout", *client.codec_client_);
    host_stats.rq_timeout_.inc();
    cluster_stats.upstream_rq_timeout_.inc();
    client.codec_client_->close();
    break;
  case Network::ConnectionEvent::ConnectFailed:
    RELAY_CONN_LOG(debug, "connect failed", *client.codec_client_);
    host_stats.cx_connect_fail_.inc();
    cluster_stats.upstream_cx_connect_fail_.inc();
    break;
  case Network::ConnectionEvent::Connected:
    RELAY_CONN_LOG(trace, "connected", *client.codec_client_);
    break;
  }
}

void ConnPoolImpl::onStreamDestroy(ActiveClient& client) {
  host_->stats().rq_active_.dec();
  host_->cluster().trafficStats().upstream_rq_active_.dec();
  host_->cluster().resourceManager(priority_).requests().dec();

  bool draining;
  {
    absl::MutexLock lock(&mutex_);
    draining = client.state_ == ActiveClient::State::Draining;
  }
  // A connection that died with requests on it closes by itself.
  if (draining && !client.closedWithActiveRequest()) {
    closeIfIdle(client);
  }
}

void ConnPoolImpl::onStreamReset(ActiveClient& client, StreamResetReason reason) {
  RELAY_CONN_LOG(debug, "stream reset: {}", *client.codec_client_,
                 Utility::resetReasonToString(reason));
  switch (reason) {
  case StreamResetReason::ConnectionTermination:
  case StreamResetReason::ConnectionFailure:
    host_->stats().rq_pending_failure_eject_.inc();
    host_->cluster().trafficStats().upstream_rq_pending_failure_eject_.inc();
    client.closed_with_active_rq_ = true;
    break;
  case StreamResetReason::LocalReset:
    host_->stats().rq_tx_reset_.inc();
    host_->cluster().trafficStats().upstream_rq_tx_reset_.inc();
    break;
  case StreamResetReason::RemoteReset:
    host_->stats().rq_rx_reset_.inc();
    host_->cluster().trafficStats().upstream_rq_rx_reset_.inc();
    break;
  case StreamResetReason::LocalRefusedStreamReset:
  case StreamResetReason::RemoteRefusedStreamReset:
  case StreamResetReason::Overflow:
    break;
  }
}

void ConnPoolImpl::onGoAway(ActiveClient& client, GoAwayErrorCode error_code) {
  RELAY_CONN_LOG(debug, "remote goaway: {}", *client.codec_client_,
                 Utility::goAwayErrorCodeToString(error_code));
  host_->stats().cx_close_notify_.inc();
  host_->cluster().trafficStats().upstream_cx_close_notify_.inc();

  bool retired;
  {
    absl::MutexLock lock(&mutex_);
    retired = retireClient(client);
  }
  if (retired) {
    closeIfIdle(client);
  }
}

ConnPoolImpl::ActiveClient::ActiveClient(ConnPoolImpl& parent, const std::string& address)
    : parent_(parent), address_(address) {}

absl::Status ConnPoolImpl::ActiveClient::initialize() {
  Upstream::Host::CreateConnectionData data = parent_.host_->createConnection();
  if (data.connection_ == nullptr) {
    return absl::UnavailableError("no connection available");
  }

  if (const absl::Status status = data.connection_->connect(); !status.ok()) {
    data.connection_->close(Network::ConnectionCloseType::NoFlush);
    return status;
  }

  absl::StatusOr<MultiplexedConnectionSharedPtr> multiplexed_connection =
      parent_.multiplexer_->newClientConnection(data.connection_->ioHandle());
  if (!multiplexed_connection.ok()) {
    data.connection_->close(Network::ConnectionCloseType::NoFlush);
    return multiplexed_connection.status();
  }

  real_host_description_ = data.host_description_;
  multiplexed_connection_ = std::move(multiplexed_connection.value());
  codec_client_ = parent_.codec_fn_(data, multiplexed_connection_);
  if (codec_client_ == nullptr) {
    // The codec may have taken ownership of the connection before failing.
    if (data.connection_ != nullptr) {
      data.connection_->close(Network::ConnectionCloseType::NoFlush);
    }
    return absl::InternalError("unable to create codec client");
  }

  // Nothing below can fail. Count the connection before any event can close it.
  Upstream::HostStats& host_stats = parent_.host_->stats();
  Upstream::ClusterTrafficStats& cluster_stats = parent_.host_->cluster().trafficStats();
  host_stats.cx_total_.inc();
  host_stats.cx_active_.inc();
  host_stats.cx_http2_total_.inc();
  cluster_stats.upstream_cx_total_.inc();
  cluster_stats.upstream_cx_active_.inc();
  cluster_stats.upstream_cx_http2_total_.inc();

  codec_client_->addConnectionCallbacks(*this);
  codec_client_->setCodecClientCallbacks(*this);
  codec_client_->setCodecConnectionCallbacks(*this);

  codec_client_->setConnectionStats(
      {cluster_stats.upstream_cx_rx_bytes_total_, cluster_stats.upstream_cx_rx_bytes_buffered_,
       cluster_stats.upstream_cx_tx_bytes_total_, cluster_stats.upstream_cx_tx_bytes_buffered_});

  RELAY_CONN_LOG(debug, "connected to {}", *codec_client_, address_);
  return absl::OkStatus();
}

void ConnPoolImpl::ActiveClient::onEvent(Network::ConnectionEvent event) {
  ActiveClientSharedPtr self = shared_from_this();
  RELAY_CONN_LOG(trace, "event: {}", *codec_client_,
                 Network::Utility::connectionEventToString(event));
  parent_.onConnectionEvent(*this, event);
}

void ConnPoolImpl::ActiveClient::onStreamDestroy() {
  ActiveClientSharedPtr self = shared_from_this();
  parent_.onStreamDestroy(*this);
}

void ConnPoolImpl::ActiveClient::onStreamReset(StreamResetReason reason) {
  ActiveClientSharedPtr self = shared_from_this();
  parent_.onStreamReset(*this, reason);
}

void ConnPoolImpl::ActiveClient::onGoAway(GoAwayErrorCode error_code) {
  ActiveClientSharedPtr self = shared_from_this();
  parent_.onGoAway(*this, error_code);
}

} // namespace Http2
} // namespace Http
} // namespace Relay
