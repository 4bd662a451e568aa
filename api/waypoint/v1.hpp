#pragma once

#include <google/protobuf/struct.pb.h>

#include "waypoint/checkpoint/v1/checkpoint.pb.h"

namespace waypoint::v1 {
using namespace ::waypoint::checkpoint::v1;

using Value              = ::google::protobuf::Value;
using CheckpointMetadata = ::google::protobuf::Struct;
}
