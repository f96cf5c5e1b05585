#pragma once

#include <functional>

#include "relay/common/pure.h"
#include "relay/upstream/upstream.h"

namespace Relay {
namespace ConnectionPool {

/**
 * Handle that allows a pending stream to be canceled before it is completed. The HTTP/2 pool
 * always attaches or fails a stream inline, so it never hands one out; the type is kept so the
 * newStream() contract can grow a real cancellation path without changing its signature.
 */
class Cancellable {
public:
  virtual ~Cancellable() = default;

  /**
   * Cancel the pending stream.
   */
  virtual void cancel() PURE;
};

/**
 * An instance of a generic connection pool.
 */
class Instance {
public:
  virtual ~Instance() = default;

  /**
   * Retire every connection currently in the pool. Streams already in flight complete on the
   * retired connections; new streams are placed on new connections.
   */
  virtual void drainConnections() PURE;

  /**
   * Close every connection owned by the pool.
   */
  virtual void close() PURE;

  /**
   * @return Upstream::HostConstSharedPtr the host for which connections are pooled.
   */
  virtual Upstream::HostConstSharedPtr host() const PURE;
};

enum class PoolFailureReason {
  // A resource overflowed and policy prevented a new stream from being created.
  Overflow,
  // No usable connection could be established to the host.
  ConnectionFailure,
};

} // namespace ConnectionPool
} // namespace Relay
