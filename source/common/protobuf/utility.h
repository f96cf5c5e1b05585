#pragma once

#include <string>

#include "relay/common/exception.h"

#include "source/common/protobuf/protobuf.h"

#include "absl/strings/string_view.h"

// Obtain the value of a wrapped field (e.g. google.protobuf.UInt32Value) if set. Otherwise, return
// the default value.
#define PROTOBUF_GET_WRAPPED_OR_DEFAULT(message, field_name, default_value)                        \
  ((message).has_##field_name() ? (message).field_name().value() : (default_value))

// Obtain the value of a wrapped field (e.g. google.protobuf.UInt32Value) if set. Otherwise, throw
// a MissingFieldException.
#define PROTOBUF_GET_WRAPPED_REQUIRED(message, field_name)                                         \
  ([](const auto& msg) {                                                                           \
    if (!msg.has_##field_name()) {                                                                 \
      ::Relay::ProtoExceptionUtil::throwMissingFieldException(#field_name, msg);                   \
    }                                                                                              \
    return msg.field_name().value();                                                               \
  }((message)))

namespace Relay {

class MissingFieldException : public RelayException {
public:
  MissingFieldException(const std::string& message);
};

class ProtoExceptionUtil {
public:
  [[noreturn]] static void throwMissingFieldException(const std::string& field_name,
                                                      const Protobuf::Message& message);
};

class MessageUtil {
public:
  /**
   * Parse a JSON string into a message. Unknown fields are rejected.
   * @param json supplies the JSON text.
   * @param message supplies the message to populate.
   * @throw RelayException if the JSON is malformed or does not match the message schema.
   */
  static void loadFromJson(absl::string_view json, Protobuf::Message& message);

  /**
   * Same as loadFromJson but reports the parse error through the returned status.
   */
  static absl::Status loadFromJsonNoThrow(absl::string_view json, Protobuf::Message& message);

  /**
   * Read a JSON file into a message.
   * @throw RelayException if the file cannot be read or does not parse.
   */
  static void loadFromFile(const std::string& path, Protobuf::Message& message);

  /**
   * @return the JSON rendering of a message with the original proto field names.
   */
  static std::string getJsonStringFromMessageOrError(const Protobuf::Message& message,
                                                     bool pretty_print = false);
};

} // namespace Relay
