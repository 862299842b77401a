#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace canary::config {

using canary::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static void SetIfEmpty(std::string* field, const std::string& value) {
  if (field->empty()) {
    *field = value;
  }
}

static void AddTable(RuntimeConfig* config, const char* name, const char* date_column) {
  auto* table = config->mutable_archival()->add_tables();
  table->set_name(name);
  table->set_date_column(date_column);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  SetIfEmpty(config->mutable_logging()->mutable_level(), "info");

  auto* database = config->mutable_database();
  SetIfEmpty(database->mutable_path(), "data/canary_protocol.db");
  if (!database->has_wal_mode()) {
    database->set_wal_mode(false);
  }
  if (database->busy_timeout_ms() == 0) {
    database->set_busy_timeout_ms(5000);
  }

  auto* system = config->mutable_system();
  SetIfEmpty(system->mutable_data_directory(), "data");
  SetIfEmpty(system->mutable_config_directory(), "config");
  SetIfEmpty(system->mutable_log_directory(), "logs");

  auto* lock = config->mutable_lock();
  SetIfEmpty(lock->mutable_path(), database->path() + ".lock");
  if (lock->timeout_ms() == 0) {
    lock->set_timeout_ms(10000);
  }

  auto* migrations = config->mutable_migrations();
  SetIfEmpty(migrations->mutable_directory(), "migrations");
  if (!migrations->has_include_builtin()) {
    migrations->set_include_builtin(true);
  }

  auto* verification = config->mutable_verification();
  SetIfEmpty(verification->mutable_backup_directory(), "data/backups");
  SetIfEmpty(verification->mutable_report_directory(), "data/verification");
  if (verification->max_backup_age_days() == 0) {
    verification->set_max_backup_age_days(30);
  }
  if (verification->test_sample_size() == 0) {
    verification->set_test_sample_size(100);
  }
  if (verification->critical_tables_size() == 0) {
    verification->add_critical_tables("weekly_digests");
    verification->add_critical_tables("daily_headlines");
    verification->add_critical_tables("user_feedback");
  }
  if (verification->backup_extensions_size() == 0) {
    verification->add_backup_extensions(".db");
    verification->add_backup_extensions(".sqlite");
    verification->add_backup_extensions(".sql");
  }

  auto* archival = config->mutable_archival();
  SetIfEmpty(archival->mutable_archive_directory(), "data/archives");
  SetIfEmpty(archival->mutable_log_directory(), system->log_directory());
  if (archival->log_retention_days() == 0) {
    archival->set_log_retention_days(90);
  }
  if (archival->log_extensions_size() == 0) {
    archival->add_log_extensions(".log");
  }
  // retention_days stays 0 here: RetentionPolicy resolves it by table class
  if (archival->tables_size() == 0) {
    AddTable(config, "daily_headlines", "date");
    AddTable(config, "daily_economic", "date");
    AddTable(config, "weekly_digests", "date");
    AddTable(config, "user_feedback", "digest_date");
    AddTable(config, "individual_article_feedback", "digest_date");
  }

  auto* restore = config->mutable_restore();
  SetIfEmpty(restore->mutable_backup_directory(), "backups");
  SetIfEmpty(restore->mutable_staging_directory(), system->data_directory() + "/restore_staging");
  SetIfEmpty(restore->mutable_verification_policy(), "refuse");
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty file is a valid "all defaults" config
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  const auto& policy = config.restore().verification_policy();
  if (!policy.empty() && policy != "refuse" && policy != "warn" && policy != "skip") {
    throw std::runtime_error("Invalid configuration: restore.verification_policy must be refuse, warn or skip");
  }

  ApplyDefaults(&config);
  return config;
}

} // namespace canary::config
