#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"
#include "internal/util/fs.hpp"

namespace canary::util {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw StorageError("Failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw IntegrityFailure("Invalid " + message->GetTypeName() + " document: " + std::string(status.message()));
  }
}

void WriteJsonFile(const std::filesystem::path& path, const google::protobuf::Message& message) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  auto tmp_path = path;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    out << ToJson(message);
    out.close();
    if (!out) {
      throw StorageError("Failed to write " + tmp_path.string());
    }
  }
  SyncFile(tmp_path);
  std::filesystem::rename(tmp_path, path);
}

void ReadJsonFile(const std::filesystem::path& path, google::protobuf::Message* message) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw NotFound("Cannot open " + path.string());
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  FromJson(buf.str(), message);
}

} // namespace canary::util
