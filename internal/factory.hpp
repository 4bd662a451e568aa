#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/checkpoint/saver.hpp"
#include "internal/serde/serializer.hpp"

namespace waypoint::factory {

/*
  Composition root.

  The ONLY place allowed to know concrete saver types. Backends compiled
  out of this build are reported as errors when a config asks for them.
*/

// Logging first, then tracing.
void InitializeRuntime(const waypoint::runtime::config::RuntimeConfig& config);
void ShutdownRuntime();

std::shared_ptr<const serde::SerializerProtocol> BuildSerializer(const waypoint::runtime::config::RuntimeConfig& config);

checkpoint::CheckpointIdPolicy BuildIdPolicy(const waypoint::runtime::config::RuntimeConfig& config);

// Without a configured backend the saver is an in-memory SQLite database.
std::unique_ptr<checkpoint::BaseCheckpointSaver> BuildSaver(const waypoint::runtime::config::RuntimeConfig& config);

} // namespace waypoint::factory
