#include "test/mocks/network/mocks.h"

#include "absl/status/status.h"

using testing::_;
using testing::Invoke;
using testing::Return;
using testing::ReturnPointee;
using testing::ReturnRef;

namespace Relay {
namespace Network {

MockConnectionCallbacks::MockConnectionCallbacks() = default;
MockConnectionCallbacks::~MockConnectionCallbacks() = default;

MockIoHandle::MockIoHandle() {
  ON_CALL(*this, fdDoNotUse()).WillByDefault(ReturnPointee(&fd_));
  ON_CALL(*this, isOpen()).WillByDefault(Return(true));
}
MockIoHandle::~MockIoHandle() = default;

uint64_t MockClientConnection::next_id_ = 0;

MockClientConnection::MockClientConnection() {
  ON_CALL(*this, addConnectionCallbacks(_)).WillByDefault(Invoke([this](ConnectionCallbacks& cb) {
    callbacks_.push_back(&cb);
  }));
  ON_CALL(*this, close(_)).WillByDefault(Invoke([this](ConnectionCloseType) {
    if (state_ != State::Closed) {
      raiseEvent(ConnectionEvent::LocalClose);
    }
  }));
  ON_CALL(*this, id()).WillByDefault(ReturnPointee(&id_));
  ON_CALL(*this, state()).WillByDefault(ReturnPointee(&state_));
  ON_CALL(*this, transportFailureReason()).WillByDefault(Invoke([this]() -> absl::string_view {
    return transport_failure_reason_;
  }));
  ON_CALL(*this, connect()).WillByDefault(Return(absl::OkStatus()));
  ON_CALL(*this, ioHandle()).WillByDefault(ReturnRef(io_handle_));
}

MockClientConnection::~MockClientConnection() = default;

void MockClientConnection::raiseEvent(ConnectionEvent event) {
  if (isCloseEvent(event)) {
    if (state_ == State::Closed) {
      return;
    }
    state_ = State::Closed;
  }
  for (ConnectionCallbacks* callbacks : callbacks_) {
    callbacks->onEvent(event);
  }
}

MockClientConnectionFactory::MockClientConnectionFactory() = default;
MockClientConnectionFactory::~MockClientConnectionFactory() = default;

} // namespace Network
} // namespace Relay
