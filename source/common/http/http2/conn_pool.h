#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <string>

#include "relay/http/codec_client.h"
#include "relay/http/conn_pool.h"
#include "relay/http/multiplexer.h"
#include "relay/network/connection.h"
#include "relay/upstream/upstream.h"

#include "source/common/common/logger.h"
#include "source/common/common/non_copyable.h"

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"

namespace Relay {
namespace Http {
namespace Http2 {

/**
 * Implementation of a "connection pool" for HTTP/2 that pools multiplexed connections per peer
 * address. A new connection is only opened when every pooled connection to the address refuses
 * new streams.
 *
 * The pool is safe for concurrent use: streams can be requested from any thread while connection
 * and stream events arrive from the transport's own threads.
 *
 * NOTE: The connection pool does NOT do DNS resolution. It assumes it is being given a numeric IP
 *       address. Higher layer code should handle resolving DNS on error and creating a new pool
 *       bound to a different IP address.
 */
class ConnPoolImpl : public Http::ConnectionPool::Instance,
                     public DeadConnectionNotifier,
                     protected Logger::Loggable<Logger::Id::pool> {
public:
  using CreateCodecFn = std::function<CodecClientPtr(
      Upstream::Host::CreateConnectionData& data, MultiplexedConnectionSharedPtr connection)>;

  ConnPoolImpl(Upstream::HostConstSharedPtr host, Upstream::ResourcePriority priority,
               MultiplexerFactory& multiplexer_factory, CreateCodecFn codec_fn);
  ~ConnPoolImpl() override;

  // Http::ConnectionPool::Instance
  Http::Protocol protocol() const override { return Http::Protocol::Http2; }
  bool hasActiveConnections() const override;
  ConnectionPool::Cancellable* newStream(absl::string_view stream_id,
                                         ResponseDecoder& response_decoder,
                                         ConnectionPool::Callbacks& callbacks) override;
  absl::string_view protocolDescription() const override;

  // Relay::ConnectionPool::Instance
  void drainConnections() override;
  void close() override;
  Upstream::HostConstSharedPtr host() const override { return host_; }

  // Http::DeadConnectionNotifier
  void markDead(const MultiplexedConnection& connection) override;
  MultiplexedConnectionSharedPtr clientConnectionForAddress(absl::string_view) override {
    // Selection always goes through newStream().
    return nullptr;
  }

  /**
   * Make sure a usable connection to the host exists, opening one if needed. No stream is
   * created and no callbacks are invoked.
   * @return absl::OkStatus() if a connection is ready, an Unavailable status carrying the
   *         connection failure otherwise.
   */
  absl::Status initActiveClient();

  /**
   * @return the number of connections that can be selected for new streams.
   */
  size_t numActiveClients() const;

  /**
   * @return the number of retired connections that are still open.
   */
  size_t numDrainingClients() const;

  // One pooled HTTP/2 connection. It receives the connection, stream and goaway events of its
  // codec client and forwards them to the pool.
  class ActiveClient : public Network::ConnectionCallbacks,
                       public CodecClientCallbacks,
                       public Http::ConnectionCallbacks,
                       public std::enable_shared_from_this<ActiveClient>,
                       NonCopyable {
  public:
    enum class State {
      // Being set up, not yet visible to other callers.
      Connecting,
      // Registered under its address and selectable for new streams.
      Ready,
      // Retired by goaway, dead notification or drain. Open until the codec closes it.
      Draining,
      // The connection has closed.
      Closed,
    };

    ActiveClient(ConnPoolImpl& parent, const std::string& address);

    /**
     * Open the connection and build the codec client on top of it. On failure nothing has been
     * registered with the pool and the returned status carries the reason.
     */
    absl::Status initialize();

    // Network::ConnectionCallbacks
    void onEvent(Network::ConnectionEvent event) override;

    // Http::CodecClientCallbacks
    void onStreamDestroy() override;
    void onStreamReset(StreamResetReason reason) override;

    // Http::ConnectionCallbacks
    void onGoAway(GoAwayErrorCode error_code) override;

    uint64_t id() const { return codec_client_->id(); }
    uint64_t totalStreams() const { return total_streams_.load(); }
    bool closedWithActiveRequest() const { return closed_with_active_rq_.load(); }
    const std::string& address() const { return address_; }

    ConnPoolImpl& parent_;
    const std::string address_;
    CodecClientPtr codec_client_;
    MultiplexedConnectionSharedPtr multiplexed_connection_;
    Upstream::HostDescriptionConstSharedPtr real_host_description_;
    std::atomic<uint64_t> total_streams_{};
    std::atomic<bool> closed_with_active_rq_{};
    // Guarded by parent_.mutex_.
    State state_{State::Connecting};
    // Streams selected onto this client whose codec stream does not exist yet. Guarded by
    // parent_.mutex_. A retired client is not closed while this is non-zero.
    uint64_t pending_streams_{};
  };

  using ActiveClientSharedPtr = std::shared_ptr<ActiveClient>;

  /**
   * @return the selectable connections registered under an address, in creation order.
   */
  std::list<ActiveClientSharedPtr> activeClients(absl::string_view address) const;

protected:
  // The connections to one peer address. Creation is serialized per address by creation_mutex_
  // so that concurrent callers that all find no usable connection open only one between them.
  struct AddressClients {
    absl::Mutex creation_mutex_;
    std::list<ActiveClientSharedPtr> clients_;
  };

  // Returns a client with one stream reserved on it, see releaseStream().
  ActiveClientSharedPtr getOrCreateActiveClient(const std::string& address,
                                                std::string& failure_reason);
  ActiveClientSharedPtr findReadyClient(const AddressClients& entry) const
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  bool canTakeNewStream(const ActiveClient& client) const;
  void reserveStream(ActiveClient& client) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  // Drop a reservation taken during selection. If no stream was created the lifetime stream
  // count is rolled back too.
  void releaseStream(ActiveClient& client, bool stream_created);

  // Move a Ready client to the draining list. Returns false if it was already retired.
  bool retireClient(ActiveClient& client) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  void closeIfIdle(ActiveClient& client);
  void purgeClosedClients();

  void onConnectionEvent(ActiveClient& client, Network::ConnectionEvent event);
  void onStreamDestroy(ActiveClient& client);
  void onStreamReset(ActiveClient& client, StreamResetReason reason);
  void onGoAway(ActiveClient& client, GoAwayErrorCode error_code);

  const Upstream::HostConstSharedPtr host_;
  const Upstream::ResourcePriority priority_;
  const CreateCodecFn codec_fn_;
  const MultiplexerPtr multiplexer_;

  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, std::unique_ptr<AddressClients>>
      clients_by_address_ ABSL_GUARDED_BY(mutex_);
  std::list<ActiveClientSharedPtr> draining_clients_ ABSL_GUARDED_BY(mutex_);
  // Closed clients are released on a later pool call, never from inside their own codec
  // callback.
  std::list<ActiveClientSharedPtr> closed_clients_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Http2
} // namespace Http
} // namespace Relay
