#pragma once

#include <cstdint>
#include <memory>

#include "relay/common/pure.h"
#include "relay/network/io_handle.h"

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace Relay {
namespace Http {

/**
 * A multiplexed client connection established over a raw transport. It carries many concurrent
 * logical streams, bounded by the concurrency ceiling negotiated with the peer.
 */
class MultiplexedConnection {
public:
  virtual ~MultiplexedConnection() = default;

  /**
   * @return true if another logical stream can be opened on the connection: it is below its
   * concurrent stream ceiling, has stream IDs left and is neither closing nor going away.
   */
  virtual bool canTakeNewRequest() const PURE;

  /**
   * @return uint64_t an identifier for logging.
   */
  virtual uint64_t id() const PURE;
};

using MultiplexedConnectionSharedPtr = std::shared_ptr<MultiplexedConnection>;

/**
 * Implemented by the owner of multiplexed connections so the multiplexer can report connections
 * it decided on its own are no longer usable, e.g. after stream ID exhaustion.
 */
class DeadConnectionNotifier {
public:
  virtual ~DeadConnectionNotifier() = default;

  /**
   * Evict the connection.
   * @param connection supplies the connection the multiplexer declared dead.
   */
  virtual void markDead(const MultiplexedConnection& connection) PURE;

  /**
   * Lookup hook used by multiplexers that select connections themselves.
   * @param address supplies the "host:port" the caller wants a connection to.
   * @return MultiplexedConnectionSharedPtr a connection, or nullptr if the owner selects
   * connections by other means.
   */
  virtual MultiplexedConnectionSharedPtr clientConnectionForAddress(absl::string_view address) PURE;
};

/**
 * Builds multiplexed connections over raw transports.
 */
class Multiplexer {
public:
  virtual ~Multiplexer() = default;

  /**
   * Establish a multiplexed connection over an already connected transport.
   * @param transport supplies the raw transport.
   * @return the multiplexed connection or the reason it could not be set up.
   */
  virtual absl::StatusOr<MultiplexedConnectionSharedPtr>
  newClientConnection(Network::IoHandle& transport) PURE;
};

using MultiplexerPtr = std::unique_ptr<Multiplexer>;

class MultiplexerFactory {
public:
  virtual ~MultiplexerFactory() = default;

  /**
   * @param notifier supplies the receiver of dead connection notifications. It must outlive the
   * returned multiplexer.
   * @return MultiplexerPtr a new multiplexer reporting to notifier.
   */
  virtual MultiplexerPtr createMultiplexer(DeadConnectionNotifier& notifier) PURE;
};

} // namespace Http
} // namespace Relay
