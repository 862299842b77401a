#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "args.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using namespace canary;

using cli::Args;
using cli::ParseCount;
using cli::UsageError;

namespace {

constexpr int kExitOk      = 0;
constexpr int kExitUsage   = 1;
constexpr int kExitFailure = 2;

util::CancellationToken g_cancel;

void HandleSignal(int) {
  g_cancel.Cancel();
}

void Usage() {
  std::cout << "Usage:\n"
            << "  canaryctl [--config <yaml>] migrate [--status | --rollback <version> | --target <version>]\n"
            << "  canaryctl [--config <yaml>] verify [--file <path> | --restore-test <path> | --history <days> | --run]\n"
            << "  canaryctl [--config <yaml>] archive [--table <name> | --run | --summary | --restore <file>]\n"
            << "  canaryctl [--config <yaml>] restore [--file <path> [--type auto|database|full_system|sql_dump] [--yes] [--force]\n"
            << "                                       | --interactive | --history | --list]\n"
            << "  canaryctl [--config <yaml>] backup [--database | --bundle]\n";
}

void Item(bool ok, const std::string& label, const std::string& detail = {}) {
  std::cout << (ok ? "PASS  " : "FAIL  ") << label;
  if (!detail.empty()) {
    std::cout << ": " << detail;
  }
  std::cout << "\n";
}

std::string Iso(const google::protobuf::Timestamp& ts) {
  return util::ToIso8601(util::FromProto(ts));
}

std::string StatusName(lifecycle::v1::ArchivalStatus status) {
  const std::string name   = lifecycle::v1::ArchivalStatus_Name(status);
  const std::string prefix = "ARCHIVAL_STATUS_";
  return name.rfind(prefix, 0) == 0 ? name.substr(prefix.size()) : name;
}

bool AskYesNo(const std::string& prompt) {
  std::cout << prompt << " [y/N] " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) {
    return false;
  }
  return answer == "y" || answer == "Y" || answer == "yes" || answer == "YES";
}

// ------------------------------------------------------------
// migrate
// ------------------------------------------------------------

int RunMigrate(factory::RuntimeDependencies& rt, const Args& args) {
  auto& engine = rt.Migrations();

  if (args.Has("--status")) {
    const auto status = engine.GetStatus();
    std::cout << "Current version: " << status.current_version << "\n";
    for (const auto& applied : status.applied) {
      std::cout << "  applied  " << applied.version << "  " << applied.applied_at << "  " << applied.description << "\n";
    }
    for (const auto& pending : status.pending) {
      std::cout << "  pending  " << pending << "\n";
    }
    for (const auto& drifted : status.drifted) {
      Item(false, "checksum drift", drifted);
    }
    for (const auto& unknown : status.unknown) {
      Item(false, "applied but not defined", unknown);
    }
    return status.drifted.empty() ? kExitOk : kExitFailure;
  }

  if (auto version = args.Value("--rollback")) {
    const auto result = engine.Rollback(*version);
    Item(static_cast<bool>(result), "rollback " + *version, result.message);
    std::cout << "Current version: " << engine.GetCurrentVersion() << "\n";
    return result ? kExitOk : kExitFailure;
  }

  const auto outcome = engine.ApplyPending(args.Value("--target"));
  for (const auto& version : outcome.applied_versions) {
    Item(true, "apply " + version);
  }
  if (!outcome.result) {
    Item(false, "apply " + (outcome.failed_version.empty() ? std::string("batch") : outcome.failed_version),
         outcome.result.message);
  } else if (outcome.AppliedCount() == 0) {
    std::cout << "No pending migrations\n";
  }
  std::cout << "Current version: " << outcome.current_version << "\n";
  return outcome.result ? kExitOk : kExitFailure;
}

// ------------------------------------------------------------
// verify
// ------------------------------------------------------------

void PrintIntegrity(const lifecycle::v1::VerificationReport& report) {
  Item(report.file_exists(), "exists", report.backup_file());
  if (!report.file_exists()) {
    return;
  }
  std::cout << "      size " << report.file_size_bytes() << " bytes, sha256 " << report.checksum() << "\n";
  Item(report.database_readable(), "readable", std::to_string(report.table_count()) + " tables");
  Item(report.schema_valid(), "schema",
       std::to_string(report.schema_comparison().matching_tables()) + "/" +
           std::to_string(report.schema_comparison().original_tables()) + " tables match");
  Item(report.data_sample_valid(), "data sample");
  for (const auto& error : report.errors()) {
    std::cout << "      error: " << error << "\n";
  }
  Item(report.overall_valid(), "overall");
}

int RunVerify(factory::RuntimeDependencies& rt, const Args& args) {
  auto verifier = rt.Verifier();

  if (auto file = args.Value("--file")) {
    const auto report = verifier->VerifyIntegrity(*file);
    PrintIntegrity(report);
    return report.overall_valid() ? kExitOk : kExitFailure;
  }

  if (auto file = args.Value("--restore-test")) {
    const auto report = verifier->TestRestoration(*file);
    Item(report.data_integrity_verified(), "integrity of restored copy");
    if (report.operation_tests().join_skipped()) {
      std::cout << "      join test skipped (tables absent)\n";
    } else {
      std::cout << "      tables " << report.operation_tests().table_count() << ", join rows "
                << report.operation_tests().join_test() << "\n";
    }
    std::cout << "      copy " << std::fixed << std::setprecision(3) << report.performance_metrics().copy_time_seconds()
              << "s, verify " << report.performance_metrics().verification_time_seconds() << "s, total "
              << report.performance_metrics().total_time_seconds() << "s\n";
    for (const auto& error : report.errors()) {
      std::cout << "      error: " << error << "\n";
    }
    Item(report.restoration_successful(), "restoration test", *file);
    return report.restoration_successful() ? kExitOk : kExitFailure;
  }

  if (auto days = args.Value("--history")) {
    const auto history = verifier->GetVerificationHistory(ParseCount("--history", *days));
    if (history.empty()) {
      std::cout << "No verification reports in the last " << *days << " days\n";
    }
    for (const auto& report : history) {
      std::cout << Iso(report.started_at()) << "  verified " << report.backups_verified() << ", failed "
                << report.backups_failed() << ", success rate " << std::fixed << std::setprecision(1)
                << report.summary().success_rate() << "%\n";
    }
    return kExitOk;
  }

  const auto batch = verifier->RunBatchVerification();
  if (!batch.error().empty()) {
    Item(false, "batch verification", batch.error());
    return kExitFailure;
  }
  for (const auto& item : batch.verification_results()) {
    const bool ok = item.overall_status() == "PASS";
    std::string detail = item.error();
    if (detail.empty() && !ok && item.integrity_check().errors_size() > 0) {
      detail = item.integrity_check().errors(0);
    }
    Item(ok, item.backup_file(), detail);
  }
  std::cout << "Verified " << batch.backups_verified() << ", failed " << batch.backups_failed() << " of "
            << batch.backups_considered() << " considered (" << batch.backups_found() << " found)\n";
  if (batch.cancelled()) {
    std::cout << "Cancelled before all backups were checked\n";
  }
  if (!batch.report_file().empty()) {
    std::cout << "Report: " << batch.report_file() << "\n";
  }
  return batch.backups_failed() == 0 && !batch.cancelled() ? kExitOk : kExitFailure;
}

// ------------------------------------------------------------
// archive
// ------------------------------------------------------------

void PrintTable(const lifecycle::v1::TableArchivalResult& r) {
  const bool ok = r.status() != lifecycle::v1::ARCHIVAL_STATUS_FAILED;
  std::string detail = StatusName(r.status()) + ", " + std::to_string(r.archived_count()) + " rows";
  if (!r.archive_file().empty()) {
    detail += " -> " + r.archive_file();
  }
  if (!r.error().empty()) {
    detail += " (" + r.error() + ")";
  }
  Item(ok, r.table(), detail);
}

int RunArchive(factory::RuntimeDependencies& rt, const Args& args) {
  auto& archival = rt.Archival();

  if (auto table = args.Value("--table")) {
    const auto r = archival.ArchiveTable(*table);
    PrintTable(r);
    return r.status() == lifecycle::v1::ARCHIVAL_STATUS_FAILED ? kExitFailure : kExitOk;
  }

  if (args.Has("--summary")) {
    const auto summary = archival.GetArchiveSummary();
    std::cout << "Archive directory: " << summary.archive_directory() << "\n";
    for (const auto& t : summary.by_type()) {
      std::cout << "  " << std::left << std::setw(16) << t.type() << t.count() << " files, " << t.total_bytes()
                << " bytes\n";
    }
    std::cout << "Total: " << summary.total_files() << " files, " << summary.total_size_bytes() << " bytes\n";
    if (summary.total_files() > 0) {
      std::cout << "Oldest: " << Iso(summary.oldest()) << "\nNewest: " << Iso(summary.newest()) << "\n";
    }
    return kExitOk;
  }

  if (auto file = args.Value("--restore")) {
    const auto r = archival.RestoreFromArchive(*file);
    Item(static_cast<bool>(r.result), "restore " + *file,
         r.result ? std::to_string(r.inserted) + " rows into " + r.table + ", " + std::to_string(r.skipped) +
                        " already present"
                  : r.result.message);
    return r.result ? kExitOk : kExitFailure;
  }

  const auto report = archival.RunFullArchival();
  for (const auto& t : report.tables()) {
    PrintTable(t);
  }
  const auto& logs = report.logs();
  Item(logs.status() != lifecycle::v1::ARCHIVAL_STATUS_FAILED, "logs",
       StatusName(logs.status()) + ", " + std::to_string(logs.archived_files()) + " files" +
           (logs.error().empty() ? std::string() : " (" + logs.error() + ")"));
  std::cout << "Archived " << report.total_records_archived() << " records from " << report.tables_archived()
            << " tables, " << report.tables_failed() << " failed\n";
  if (!report.report_file().empty()) {
    std::cout << "Report: " << report.report_file() << "\n";
  }
  const bool ok = report.tables_failed() == 0 && logs.status() != lifecycle::v1::ARCHIVAL_STATUS_FAILED &&
                  !report.cancelled();
  return ok ? kExitOk : kExitFailure;
}

// ------------------------------------------------------------
// restore
// ------------------------------------------------------------

int PrintOutcome(const restore::RestoreOutcome& outcome) {
  Item(static_cast<bool>(outcome.result), outcome.restore_type + " restore of " + outcome.backup_file,
       outcome.result ? std::string() : outcome.result.message);
  if (outcome.safety_backup) {
    std::cout << "      safety backup: " << outcome.safety_backup->string() << "\n";
  }
  return outcome.result ? kExitOk : kExitFailure;
}

void PrintBackups(const std::vector<verify::BackupArtifact>& backups) {
  for (size_t i = 0; i < backups.size(); ++i) {
    const auto& b = backups[i];
    std::cout << std::right << std::setw(3) << i + 1 << ". " << std::left << std::setw(40) << b.name << std::setw(12)
              << verify::ToString(b.type) << std::setw(14) << b.size_bytes << util::ToIso8601(b.modified) << "\n";
  }
}

int RunRestore(factory::RuntimeDependencies& rt, const Args& args) {
  auto& coordinator = rt.Restore();

  if (args.Has("--list")) {
    const auto backups = coordinator.ListAvailableBackups();
    if (backups.empty()) {
      std::cout << "No backups found in " << rt.Config().restore().backup_directory() << "\n";
    }
    PrintBackups(backups);
    return kExitOk;
  }

  if (args.Has("--history")) {
    const auto records = coordinator.GetRestoreHistory(10);
    if (records.empty()) {
      std::cout << "No restore operations recorded\n";
    }
    for (const auto& r : records) {
      std::cout << r.timestamp << "  " << std::left << std::setw(9) << r.status << std::setw(12) << r.restore_type
                << r.backup_file << "\n";
      if (!r.notes.empty()) {
        std::cout << "      " << r.notes << "\n";
      }
    }
    return kExitOk;
  }

  if (args.Has("--interactive")) {
    const auto backups = coordinator.ListAvailableBackups();
    if (backups.empty()) {
      std::cout << "No backups found in " << rt.Config().restore().backup_directory() << "\n";
      return kExitFailure;
    }
    PrintBackups(backups);
    std::cout << "Select backup (1-" << backups.size() << ", empty to cancel): " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line) || line.empty()) {
      std::cout << "Cancelled\n";
      return kExitOk;
    }
    const auto choice = ParseCount("selection", line);
    if (choice == 0 || choice > backups.size()) {
      throw UsageError("selection out of range: " + line);
    }
    return PrintOutcome(coordinator.RestoreFromBackup(backups[choice - 1].path, std::nullopt, AskYesNo));
  }

  const auto file = args.Value("--file");
  if (!file) {
    throw UsageError("restore needs --file, --interactive, --history or --list");
  }

  std::optional<verify::BackupType> type;
  if (auto text = args.Value("--type"); text && *text != "auto") {
    type = verify::ParseBackupType(*text);
    if (!type) {
      throw UsageError("unknown backup type: " + *text);
    }
  }

  restore::ConfirmFn confirm = AskYesNo;
  if (args.Has("--yes")) {
    confirm = [](const std::string& prompt) {
      std::cout << prompt << " yes (--yes)\n";
      return true;
    };
  }
  return PrintOutcome(coordinator.RestoreFromBackup(*file, type, confirm));
}

// ------------------------------------------------------------
// backup
// ------------------------------------------------------------

int RunBackup(factory::RuntimeDependencies& rt, const Args& args) {
  if (args.Has("--bundle")) {
    const auto path = rt.Backups().CreateSystemBundle();
    Item(true, "system bundle", path.string());
    return kExitOk;
  }
  const auto path = rt.Backups().CreateDatabaseBackup();
  Item(true, "database backup", path.string());
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> argv_list(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  size_t                     pos = 0;
  if (pos < argv_list.size() && argv_list[pos] == "--config") {
    if (pos + 1 >= argv_list.size()) {
      Usage();
      return kExitUsage;
    }
    config_path = argv_list[pos + 1];
    pos += 2;
  }
  if (pos >= argv_list.size()) {
    Usage();
    return kExitUsage;
  }

  const std::string command = argv_list[pos];
  const Args        args(std::vector<std::string>(argv_list.begin() + pos + 1, argv_list.end()));

  if (command == "help" || command == "--help" || command == "-h") {
    Usage();
    return kExitOk;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path ? config::ConfigLoader::LoadFromYaml(*config_path) : config::ConfigLoader::Defaults();
    if (command == "restore" && args.Has("--force")) {
      config.mutable_restore()->set_verification_policy("warn");
    }

    observability::InitializeLogging(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto rt = factory::BuildRuntime(std::move(config), &g_cancel);

    int rc = kExitUsage;
    if (command == "migrate") {
      rc = RunMigrate(*rt, args);
    } else if (command == "verify") {
      rc = RunVerify(*rt, args);
    } else if (command == "archive") {
      rc = RunArchive(*rt, args);
    } else if (command == "restore") {
      rc = RunRestore(*rt, args);
    } else if (command == "backup") {
      rc = RunBackup(*rt, args);
    } else {
      std::cerr << "unknown command: " << command << "\n";
      Usage();
    }

    observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    return kExitUsage;
  } catch (const std::exception& e) {
    CANARY_LOG_ERROR("canaryctl failed", {observability::StringField("command", command),
                                          observability::StringField("error", e.what())});
    Item(false, command, e.what());
    observability::ShutdownLogging();
    return kExitFailure;
  }
}
