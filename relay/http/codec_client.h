#pragma once

#include <cstdint>
#include <memory>

#include "relay/common/pure.h"
#include "relay/http/codec.h"
#include "relay/http/protocol.h"
#include "relay/network/connection.h"

#include "absl/strings/string_view.h"

namespace Relay {
namespace Http {

/**
 * Callbacks specific to a codec client.
 */
class CodecClientCallbacks {
public:
  virtual ~CodecClientCallbacks() = default;

  /**
   * Called every time an owned stream is destroyed, whether complete or not. The stream is no
   * longer counted by numActiveRequests() when this fires.
   */
  virtual void onStreamDestroy() PURE;

  /**
   * Called when a stream is reset by the client.
   * @param reason supplies the reset reason.
   */
  virtual void onStreamReset(StreamResetReason reason) PURE;
};

/**
 * The stream codec adapter: turns one multiplexed connection into logical request/response
 * streams and reports connection and stream lifecycle events back to its owner.
 */
class CodecClient {
public:
  virtual ~CodecClient() = default;

  /**
   * Add a connection callback to the underlying network connection.
   */
  virtual void addConnectionCallbacks(Network::ConnectionCallbacks& cb) PURE;

  /**
   * Register the receiver of stream destroy and stream reset events.
   */
  virtual void setCodecClientCallbacks(CodecClientCallbacks& callbacks) PURE;

  /**
   * Register the receiver of codec level connection events (goaway).
   */
  virtual void setCodecConnectionCallbacks(ConnectionCallbacks& callbacks) PURE;

  /**
   * Set the byte accounting stats of the underlying connection.
   */
  virtual void setConnectionStats(const Network::Connection::ConnectionStats& stats) PURE;

  /**
   * Create a new stream.
   * @param stream_id supplies the caller assigned identifier of the stream.
   * @param response_decoder supplies the decoder to use for response callbacks.
   * @return RequestEncoder& the encoder to use for encoding the request.
   */
  virtual RequestEncoder& newStream(absl::string_view stream_id,
                                    ResponseDecoder& response_decoder) PURE;

  /**
   * Close the underlying network connection. This is immediate and will not attempt to flush any
   * pending write data.
   */
  virtual void close() PURE;

  /**
   * @return the underlying connection ID.
   */
  virtual uint64_t id() const PURE;

  /**
   * @return size_t the number of outstanding requests that have not completed or been reset.
   */
  virtual size_t numActiveRequests() const PURE;

  /**
   * @return the underlying codec protocol.
   */
  virtual Protocol protocol() const PURE;
};

using CodecClientPtr = std::unique_ptr<CodecClient>;

} // namespace Http
} // namespace Relay
