#pragma once

#include <memory>

#include "relay/common/conn_pool.h"
#include "relay/common/pure.h"
#include "relay/http/codec.h"
#include "relay/http/protocol.h"
#include "relay/upstream/upstream.h"

#include "absl/strings/string_view.h"

namespace Relay {
namespace Http {
namespace ConnectionPool {

using PoolFailureReason = ::Relay::ConnectionPool::PoolFailureReason;
using Cancellable = ::Relay::ConnectionPool::Cancellable;

/**
 * Pool callbacks invoked in the context of a newStream() call. Exactly one of them fires, inline,
 * for every newStream() call.
 */
class Callbacks {
public:
  virtual ~Callbacks() = default;

  /**
   * Called when a pool error occurred and no stream could be created for the request.
   * @param stream_id supplies the identifier passed to newStream().
   * @param reason supplies the failure reason.
   * @param transport_failure_reason supplies the details of the transport failure reason.
   * @param host supplies the description of the host that caused the failure. This may be nullptr
   *             if no host was involved in the failure (for example overflow).
   */
  virtual void onPoolFailure(absl::string_view stream_id, PoolFailureReason reason,
                             absl::string_view transport_failure_reason,
                             Upstream::HostDescriptionConstSharedPtr host) PURE;

  /**
   * Called when a stream was created for the request.
   * @param stream_id supplies the identifier passed to newStream().
   * @param encoder supplies the request encoder to use.
   * @param host supplies the description of the host that will carry the request.
   */
  virtual void onPoolReady(absl::string_view stream_id, RequestEncoder& encoder,
                           Upstream::HostDescriptionConstSharedPtr host) PURE;
};

/**
 * An instance of an HTTP connection pool.
 */
class Instance : public Relay::ConnectionPool::Instance {
public:
  ~Instance() override = default;

  /**
   * @return Http::Protocol the protocol spoken on the pooled connections.
   */
  virtual Http::Protocol protocol() const PURE;

  /**
   * Determines whether the connection pool is actively processing any requests.
   * @return true if the connection pool has any connection carrying requests.
   */
  virtual bool hasActiveConnections() const PURE;

  /**
   * Create a new stream on the pool.
   * @param stream_id supplies the caller assigned identifier of the stream.
   * @param response_decoder supplies the decoder events to fire when the response is
   *                         available.
   * @param callbacks supplies the callbacks to invoke when the stream is ready or has failed.
   *                  One of them is always invoked before this call returns.
   * @return Cancellable* reserved for pools that queue streams; nullptr when the callbacks have
   *                      already been invoked.
   */
  virtual Cancellable* newStream(absl::string_view stream_id, ResponseDecoder& response_decoder,
                                 Callbacks& callbacks) PURE;

  /**
   * Returns a user-friendly protocol description for logging.
   * @return absl::string_view a protocol description for logging.
   */
  virtual absl::string_view protocolDescription() const PURE;
};

using InstancePtr = std::unique_ptr<Instance>;

} // namespace ConnectionPool
} // namespace Http
} // namespace Relay
