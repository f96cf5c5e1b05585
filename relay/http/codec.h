#pragma once

#include <cstdint>
#include <memory>

#include "relay/common/pure.h"

#include "absl/strings/string_view.h"

namespace Relay {
namespace Http {

enum class GoAwayErrorCode {
  NoError,
  Other,
};

/**
 * Stream reset reasons.
 */
enum class StreamResetReason {
  // If a local codec level reset was sent on the stream.
  LocalReset,
  // If a local codec level refused stream reset was sent on the stream (allowing for retry).
  LocalRefusedStreamReset,
  // If a remote codec level reset was received on the stream.
  RemoteReset,
  // If a remote codec level refused stream reset was received on the stream (allowing for retry).
  RemoteRefusedStreamReset,
  // If the stream was locally reset by a connection pool due to an initial connection failure.
  ConnectionFailure,
  // If the stream was locally reset due to connection termination.
  ConnectionTermination,
  // The stream was reset because of a resource overflow.
  Overflow
};

/**
 * An HTTP stream (request, response, and push).
 */
class Stream {
public:
  virtual ~Stream() = default;

  /**
   * Reset the stream. No events will fire beyond this point.
   * @param reason supplies the reset reason.
   */
  virtual void resetStream(StreamResetReason reason) PURE;
};

/**
 * Encodes an HTTP request onto a logical stream of a multiplexed connection.
 */
class RequestEncoder {
public:
  virtual ~RequestEncoder() = default;

  /**
   * Encode a data frame.
   * @param data supplies the data to encode.
   * @param end_stream supplies whether this is the last data frame.
   */
  virtual void encodeData(absl::string_view data, bool end_stream) PURE;

  /**
   * @return Stream& the backing stream.
   */
  virtual Stream& getStream() PURE;
};

/**
 * Receives the response of a logical stream.
 */
class ResponseDecoder {
public:
  virtual ~ResponseDecoder() = default;

  /**
   * Called with a decoded data frame.
   * @param data supplies the decoded data.
   * @param end_stream supplies whether this is the last data frame.
   */
  virtual void decodeData(absl::string_view data, bool end_stream) PURE;
};

/**
 * Connection level callbacks.
 */
class ConnectionCallbacks {
public:
  virtual ~ConnectionCallbacks() = default;

  /**
   * Fires when the remote indicates "go away." No new streams should be created.
   */
  virtual void onGoAway(GoAwayErrorCode error_code) PURE;
};

} // namespace Http
} // namespace Relay
