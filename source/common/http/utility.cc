#include "source/common/http/utility.h"

#include "source/common/common/assert.h"
#include "source/common/common/macros.h"

namespace Relay {
namespace Http {
namespace {

struct ProtocolStringValues {
  const std::string Http10String{"HTTP/1.0"};
  const std::string Http11String{"HTTP/1.1"};
  const std::string Http2String{"HTTP/2"};
  const std::string Http3String{"HTTP/3"};
};

const ProtocolStringValues& protocolStrings() { CONSTRUCT_ON_FIRST_USE(ProtocolStringValues); }

} // namespace

const std::string& Utility::getProtocolString(const Protocol protocol) {
  switch (protocol) {
  case Protocol::Http10:
    return protocolStrings().Http10String;
  case Protocol::Http11:
    return protocolStrings().Http11String;
  case Protocol::Http2:
    return protocolStrings().Http2String;
  case Protocol::Http3:
    return protocolStrings().Http3String;
  }

  return protocolStrings().Http2String;
}

const std::string Utility::resetReasonToString(const StreamResetReason reset_reason) {
  switch (reset_reason) {
  case StreamResetReason::ConnectionFailure:
    return "connection failure";
  case StreamResetReason::ConnectionTermination:
    return "connection termination";
  case StreamResetReason::LocalReset:
    return "local reset";
  case StreamResetReason::LocalRefusedStreamReset:
    return "local refused stream reset";
  case StreamResetReason::Overflow:
    return "overflow";
  case StreamResetReason::RemoteReset:
    return "remote reset";
  case StreamResetReason::RemoteRefusedStreamReset:
    return "remote refused stream reset";
  }

  return "";
}

absl::string_view Utility::goAwayErrorCodeToString(const GoAwayErrorCode error_code) {
  switch (error_code) {
  case GoAwayErrorCode::NoError:
    return "no error";
  case GoAwayErrorCode::Other:
    return "other";
  }

  return "";
}

} // namespace Http
} // namespace Relay
