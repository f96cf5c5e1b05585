#include "test/mocks/http/mocks.h"

using testing::_;
using testing::Invoke;
using testing::Return;
using testing::ReturnRef;

namespace Relay {
namespace Http {

MockStream::MockStream() = default;
MockStream::~MockStream() = default;

MockRequestEncoder::MockRequestEncoder() {
  ON_CALL(*this, getStream()).WillByDefault(ReturnRef(stream_));
}
MockRequestEncoder::~MockRequestEncoder() = default;

MockResponseDecoder::MockResponseDecoder() = default;
MockResponseDecoder::~MockResponseDecoder() = default;

std::atomic<uint64_t> MockCodecClient::next_id_{0};

MockCodecClient::MockCodecClient() {
  ON_CALL(*this, addConnectionCallbacks(_))
      .WillByDefault(Invoke(
          [this](Network::ConnectionCallbacks& cb) { connection_callbacks_.push_back(&cb); }));
  ON_CALL(*this, setCodecClientCallbacks(_))
      .WillByDefault(
          Invoke([this](CodecClientCallbacks& callbacks) { codec_client_callbacks_ = &callbacks; }));
  ON_CALL(*this, setCodecConnectionCallbacks(_))
      .WillByDefault(
          Invoke([this](ConnectionCallbacks& callbacks) { codec_callbacks_ = &callbacks; }));
  ON_CALL(*this, newStream(_, _))
      .WillByDefault(Invoke([this](absl::string_view, ResponseDecoder&) -> RequestEncoder& {
        active_requests_++;
        return request_encoder_;
      }));
  ON_CALL(*this, close()).WillByDefault(Invoke([this]() {
    raiseEvent(Network::ConnectionEvent::LocalClose);
  }));
  ON_CALL(*this, id()).WillByDefault(Return(id_));
  ON_CALL(*this, numActiveRequests()).WillByDefault(Invoke([this]() -> size_t {
    return active_requests_.load();
  }));
  ON_CALL(*this, protocol()).WillByDefault(Return(Protocol::Http2));
}

MockCodecClient::~MockCodecClient() = default;

void MockCodecClient::raiseEvent(Network::ConnectionEvent event) {
  if (Network::isCloseEvent(event)) {
    if (closed_) {
      return;
    }
    closed_ = true;
  }
  // Callbacks may release the last reference to their owner, so iterate over a copy.
  const std::list<Network::ConnectionCallbacks*> callbacks = connection_callbacks_;
  for (Network::ConnectionCallbacks* cb : callbacks) {
    cb->onEvent(event);
  }
}

void MockCodecClient::raiseGoAway(GoAwayErrorCode error_code) {
  ASSERT_NE(nullptr, codec_callbacks_);
  codec_callbacks_->onGoAway(error_code);
}

void MockCodecClient::destroyStream() {
  ASSERT_NE(nullptr, codec_client_callbacks_);
  ASSERT_GT(active_requests_.load(), 0U);
  active_requests_--;
  codec_client_callbacks_->onStreamDestroy();
}

void MockCodecClient::resetStream(StreamResetReason reason) {
  ASSERT_NE(nullptr, codec_client_callbacks_);
  codec_client_callbacks_->onStreamReset(reason);
}

std::atomic<uint64_t> MockMultiplexedConnection::next_id_{0};

MockMultiplexedConnection::MockMultiplexedConnection() {
  ON_CALL(*this, canTakeNewRequest()).WillByDefault(Return(true));
  ON_CALL(*this, id()).WillByDefault(Return(id_));
}
MockMultiplexedConnection::~MockMultiplexedConnection() = default;

MockMultiplexer::MockMultiplexer() {
  ON_CALL(*this, newClientConnection(_))
      .WillByDefault(Invoke(
          [this](Network::IoHandle&) -> absl::StatusOr<MultiplexedConnectionSharedPtr> {
            auto connection = std::make_shared<testing::NiceMock<MockMultiplexedConnection>>();
            absl::MutexLock lock(&mutex_);
            connections_.push_back(connection);
            return connection;
          }));
}
MockMultiplexer::~MockMultiplexer() = default;

std::vector<MockMultiplexedConnectionSharedPtr> MockMultiplexer::connections() const {
  absl::MutexLock lock(&mutex_);
  return connections_;
}

MockMultiplexerFactory::MockMultiplexerFactory() {
  ON_CALL(*this, createMultiplexer(_))
      .WillByDefault(Invoke([this](DeadConnectionNotifier& notifier) -> MultiplexerPtr {
        notifier_ = &notifier;
        auto multiplexer = std::make_unique<testing::NiceMock<MockMultiplexer>>();
        multiplexer_ = multiplexer.get();
        return multiplexer;
      }));
}
MockMultiplexerFactory::~MockMultiplexerFactory() = default;

namespace ConnectionPool {
MockCallbacks::MockCallbacks() = default;
MockCallbacks::~MockCallbacks() = default;
} // namespace ConnectionPool

} // namespace Http
} // namespace Relay
