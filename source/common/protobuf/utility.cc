#include "source/common/protobuf/utility.h"

#include <fstream>
#include <sstream>

#include "source/common/common/logger.h"

#include "absl/strings/str_cat.h"

namespace Relay {

MissingFieldException::MissingFieldException(const std::string& message)
    : RelayException(message) {}

void ProtoExceptionUtil::throwMissingFieldException(const std::string& field_name,
                                                    const Protobuf::Message& message) {
  std::string error =
      fmt::format("Field '{}' is missing in: {}", field_name, message.DebugString());
  throw MissingFieldException(error);
}

absl::Status MessageUtil::loadFromJsonNoThrow(absl::string_view json,
                                              Protobuf::Message& message) {
  ProtobufUtil::JsonParseOptions options;
  options.case_insensitive_enum_parsing = true;
  const auto status = ProtobufUtil::JsonStringToMessage(std::string(json), &message, options);
  if (!status.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unable to parse JSON as proto (", status.ToString(), "): ", json));
  }
  return absl::OkStatus();
}

void MessageUtil::loadFromJson(absl::string_view json, Protobuf::Message& message) {
  THROW_IF_NOT_OK(loadFromJsonNoThrow(json, message));
}

void MessageUtil::loadFromFile(const std::string& path, Protobuf::Message& message) {
  std::ifstream file(path);
  if (!file) {
    throwRelayExceptionOrPanic(absl::StrCat("unable to read file: ", path));
  }
  std::stringstream contents;
  contents << file.rdbuf();
  RELAY_LOG_MISC(debug, "loading {} from {}", message.GetTypeName(), path);
  loadFromJson(contents.str(), message);
}

std::string MessageUtil::getJsonStringFromMessageOrError(const Protobuf::Message& message,
                                                         bool pretty_print) {
  ProtobufUtil::JsonPrintOptions json_options;
  json_options.preserve_proto_field_names = true;
  json_options.add_whitespace = pretty_print;
  std::string json;
  const auto status = ProtobufUtil::MessageToJsonString(message, &json, json_options);
  if (!status.ok()) {
    return status.ToString();
  }
  return json;
}

} // namespace Relay
