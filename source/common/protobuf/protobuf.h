#pragma once

#include "google/protobuf/message.h"
#include "google/protobuf/util/json_util.h"
#include "google/protobuf/wrappers.pb.h"

namespace Relay {

// All references to google::protobuf in relay need to be made via the Relay::Protobuf namespace.
namespace Protobuf = google::protobuf;

// Alias for the protobuf util namespace.
namespace ProtobufUtil = google::protobuf::util;

} // namespace Relay
