#pragma once

#include <cstdint>
#include <memory>

#include "relay/common/pure.h"
#include "relay/network/io_handle.h"
#include "relay/stats/primitive_stats.h"

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace Relay {
namespace Network {

/**
 * Events that occur on a connection.
 */
enum class ConnectionEvent {
  RemoteClose,
  LocalClose,
  Connected,
  // The transport gave up waiting for the connection to be established.
  ConnectTimeout,
  // The transport failed to establish the connection.
  ConnectFailed,
};

/**
 * @return true if the event reports that the connection is now closed.
 */
inline bool isCloseEvent(ConnectionEvent event) {
  return event == ConnectionEvent::RemoteClose || event == ConnectionEvent::LocalClose;
}

/**
 * Network level callbacks that happen on a connection.
 */
class ConnectionCallbacks {
public:
  virtual ~ConnectionCallbacks() = default;

  /**
   * Callback for connection events.
   * @param events supplies the ConnectionEvent that occurred.
   */
  virtual void onEvent(ConnectionEvent event) PURE;
};

/**
 * Type of connection close to perform.
 */
enum class ConnectionCloseType {
  FlushWrite, // Flush pending write data before raising ConnectionEvent::LocalClose
  NoFlush,    // Do not flush any pending data and immediately raise ConnectionEvent::LocalClose
};

/**
 * An abstract raw connection. Free the connection or call close() to disconnect.
 */
class Connection {
public:
  enum class State { Open, Closing, Closed };

  struct ConnectionStats {
    Stats::PrimitiveCounter& read_total_;
    Stats::PrimitiveGauge& read_current_;
    Stats::PrimitiveCounter& write_total_;
    Stats::PrimitiveGauge& write_current_;
  };

  virtual ~Connection() = default;

  /**
   * Register callbacks that fire when connection events occur.
   */
  virtual void addConnectionCallbacks(ConnectionCallbacks& cb) PURE;

  /**
   * Close the connection.
   */
  virtual void close(ConnectionCloseType type) PURE;

  /**
   * @return uint64_t the unique local ID of this connection.
   */
  virtual uint64_t id() const PURE;

  /**
   * @return State the current state of the connection.
   */
  virtual State state() const PURE;

  /**
   * Set the stats to update for various connection state changes. Note that for performance
   * reasons these stats are eventually consistent and may not always accurately represent the
   * connection state at any given point in time.
   */
  virtual void setConnectionStats(const ConnectionStats& stats) PURE;

  /**
   * @return std::string the failure reason of the underlying transport, if any.
   */
  virtual absl::string_view transportFailureReason() const PURE;
};

using ConnectionPtr = std::unique_ptr<Connection>;

/**
 * Connections capable of outbound connects.
 */
class ClientConnection : public Connection {
public:
  /**
   * Connect to a remote host and complete the connection level handshake. Blocks until the
   * handshake completed or failed.
   * @return absl::Status the outcome of the handshake.
   */
  virtual absl::Status connect() PURE;

  /**
   * @return IoHandle& the raw transport the connection runs over.
   */
  virtual IoHandle& ioHandle() PURE;
};

using ClientConnectionPtr = std::unique_ptr<ClientConnection>;

} // namespace Network
} // namespace Relay
