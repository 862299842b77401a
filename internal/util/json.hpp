#pragma once

#include <filesystem>
#include <string>

#include <google/protobuf/message.h>

namespace canary::util {

/*
  Protobuf <-> JSON helpers for persisted reports and snapshots.

  Field names stay snake_case and default values are printed so every
  report has a fixed shape.
*/

std::string ToJson(const google::protobuf::Message& message);

// Throws IntegrityFailure on malformed input.
void FromJson(const std::string& json, google::protobuf::Message* message);

// Writes tmp → fsync → rename.
void WriteJsonFile(const std::filesystem::path& path, const google::protobuf::Message& message);

void ReadJsonFile(const std::filesystem::path& path, google::protobuf::Message* message);

} // namespace canary::util
