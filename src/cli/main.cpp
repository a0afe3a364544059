#include <atomic>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "ba/common.h"
#include "ba/core/verifier.h"
#include "ba/error.h"
#include "ba/errors.h"
#include "ba/orchestrator/armor_engine.h"
#include "ba/orchestrator/config.h"
#include "ba/orchestrator/console_reporter.h"
#include "ba/orchestrator/event_bus.h"
#include "ba/storage/catalog_log.h"
#include "ba/storage/checksum_ledger.h"
#include "ba/storage/parity_codec.h"
#include "ba/storage/repair_store.h"

#include <signal.h>

namespace {

  constexpr std::string_view kVersion = "bookarmor 1.0.0";

  // Fatal exit codes (sysexits.h). Run outcomes use the bit flags from
  // armor_engine.h instead.
  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitUnavailable = 69;
  constexpr int kExitIO = 74;

  std::atomic<bool> g_stop_requested{false};

  void StopSignalHandler(int) { g_stop_requested.store(true, std::memory_order_relaxed); }

  class StopSignalGuard {
   public:
    StopSignalGuard() {
      struct sigaction sa {};
      sa.sa_handler = StopSignalHandler;
      sigemptyset(&sa.sa_mask);
      sa.sa_flags = 0;
      sigaction(SIGINT, &sa, &old_int_);
      sigaction(SIGTERM, &sa, &old_term_);
    }
    ~StopSignalGuard() {
      sigaction(SIGINT, &old_int_, nullptr);
      sigaction(SIGTERM, &old_term_, nullptr);
    }
    StopSignalGuard(const StopSignalGuard&) = delete;
    StopSignalGuard& operator=(const StopSignalGuard&) = delete;

   private:
    struct sigaction old_int_ {};
    struct sigaction old_term_ {};
  };

  void PrintUsage(std::ostream& os) {
    os << "Usage: bookarmor [-h|-u|-d|-v] [--fail-fast] [--verify-parity] [--repair <collection>/<name>]\n";
  }

  void PrintHelp() {
    std::cout << kVersion << "\n\n";
    std::cout << "Catalogs every book under BOOK_DIR/<collection>/, stores an md5sum ledger and\n";
    std::cout << "par2 recovery data for new books, and re-verifies books already cataloged.\n\n";
    PrintUsage(std::cout);
    std::cout << "\nOptions:\n";
    std::cout << "  -h                 Show this help\n";
    std::cout << "  -u                 Show usage\n";
    std::cout << "  -d                 Display the effective configuration\n";
    std::cout << "  -v                 Show version\n";
    std::cout << "  --fail-fast        Stop at the first failing book (FAILURE_POLICY=fail-fast)\n";
    std::cout << "  --verify-parity    Re-verify recovery data of known books (VERIFY_PARITY=1)\n";
    std::cout << "  --repair KEY       Restore one book from its recovery data and exit\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  REDUNDANCY BOOK_DIR INDEX CSV REPAIR FAILURE_POLICY VERIFY_PARITY PAR2\n";
    std::cout << "  ARMOR_LOG ARMOR_LOG_MAX_SIZE\n";
    std::cout << "\nExit status: 0 clean; bits 1 mismatch, 2 protection failure, 4 duplicates,\n";
    std::cout << "8 interrupted; 64 usage, 69 dependency unavailable, 74 I/O error.\n";
  }

  std::string_view DomainPrefix(ba::ErrorDomain domain) {
    switch (domain) {
    case ba::ErrorDomain::IO:
      return "I/O error";
    case ba::ErrorDomain::Validation:
      return "Validation error";
    case ba::ErrorDomain::Config:
      return "Configuration error";
    case ba::ErrorDomain::Dependency:
      return "Dependency error";
    case ba::ErrorDomain::State:
      return "State error";
    case ba::ErrorDomain::Repair:
      return "Repair error";
    case ba::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  int ExitCodeFor(const ba::Error& err) {
    switch (err.domain) {
    case ba::ErrorDomain::IO:
      return kExitIO;
    case ba::ErrorDomain::Validation:
    case ba::ErrorDomain::Config:
      return kExitUsage;
    case ba::ErrorDomain::Dependency:
      return kExitUnavailable;
    case ba::ErrorDomain::Repair:
    case ba::ErrorDomain::State:
    case ba::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  void ReportError(const ba::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

    ba::orchestrator::Event event;
    event.category = ba::orchestrator::EventCategory::kDiagnostics;
    event.severity = ba::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code), true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code), true);
    }
    try {
      ba::orchestrator::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl;
    }
  }

  struct CliOptions {
    bool fail_fast{false};
    bool verify_parity{false};
    bool display{false};
    std::optional<std::string> repair_key;
  };

  void RequireBookDir(const ba::orchestrator::ArmorConfig& config) {
    std::error_code ec;
    if (!std::filesystem::is_directory(config.book_dir, ec)) {
      throw ba::Error(ba::ErrorDomain::Config, ba::errors::config::kBookDirMissing,
                      std::string(ba::errors::msg::kBookDirMissing) + ": " +
                          ba::PathToUtf8String(config.book_dir));
    }
  }

  int HandleRepair(ba::storage::RepairStore& store, const std::string& key) {
    if (!ba::storage::IsValidBookKey(key)) {
      throw ba::Error(ba::ErrorDomain::Validation, ba::errors::validation::kInvalidBookKey,
                      std::string(ba::errors::msg::kInvalidBookKey) + ": '" + key + "'");
    }
    std::cout << "Repairing " << key << " ... " << std::flush;
    const bool repaired = store.Repair(key);
    std::cout << (repaired ? "done." : "failed.") << std::endl;

    ba::orchestrator::Event event;
    event.category = ba::orchestrator::EventCategory::kRepair;
    event.severity = repaired ? ba::orchestrator::EventSeverity::kInfo
                              : ba::orchestrator::EventSeverity::kError;
    event.event_id = repaired ? "book_repaired" : "book_repair_failed";
    event.message = repaired ? "Book restored from recovery data" : "Book could not be restored";
    event.fields.emplace_back("key", key);
    ba::orchestrator::EventBus::Instance().Publish(event);
    return repaired ? kExitOk : ba::orchestrator::kStatusProtectFailure;
  }

} // namespace

int main(int argc, char** argv) {
  // Both sinks outlive every Publish below, including the error reports.
  std::unique_ptr<ba::orchestrator::JsonLineLogger> logger;
  ba::orchestrator::ConsoleReporter reporter(std::cout, std::cerr);
  try {
    CliOptions options;
    for (int index = 1; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg == "-h" || arg == "--help") {
        PrintHelp();
        return kExitOk;
      }
      if (arg == "-u" || arg == "--usage") {
        PrintUsage(std::cout);
        return kExitOk;
      }
      if (arg == "-v" || arg == "--version") {
        std::cout << kVersion << std::endl;
        return kExitOk;
      }
      if (arg == "-d" || arg == "--display") {
        options.display = true;
        continue;
      }
      if (arg == "--fail-fast") {
        options.fail_fast = true;
        continue;
      }
      if (arg == "--verify-parity") {
        options.verify_parity = true;
        continue;
      }
      if (arg.rfind("--repair=", 0) == 0) {
        options.repair_key = std::string(arg.substr(std::string_view("--repair=").size()));
        continue;
      }
      if (arg == "--repair") {
        if (index + 1 >= argc) {
          PrintUsage(std::cerr);
          return kExitUsage;
        }
        options.repair_key = std::string(argv[++index]);
        continue;
      }
      PrintUsage(std::cerr);
      return kExitUsage;
    }

    auto config = ba::orchestrator::LoadConfig(ba::orchestrator::ProcessEnvironment());
    if (options.fail_fast) {
      config.failure_policy = ba::orchestrator::FailurePolicy::kFailFast;
    }
    if (options.verify_parity) {
      config.verify_parity = true;
    }
    if (options.display) {
      std::cout << "Configuration:\n" << ba::orchestrator::DescribeConfig(config);
      return kExitOk;
    }
    RequireBookDir(config);

    if (!config.log_path.empty()) {
      logger = std::make_unique<ba::orchestrator::JsonLineLogger>(config.log_path, config.log_max_size);
      auto* sink = logger.get();
      ba::orchestrator::EventBus::Instance().Subscribe(
          [sink](const ba::orchestrator::Event& event) { sink->Log(event); });
    }
    reporter.Attach();

    ba::storage::Par2Codec codec(config.par2_binary);
    if (!codec.Available()) {
      throw ba::Error(ba::ErrorDomain::Dependency, ba::errors::dependency::kToolMissing,
                      std::string(ba::errors::msg::kToolMissing) + ": " + config.par2_binary);
    }
    ba::storage::RepairStore repair_store(config.repair_dir, codec);
    if (options.repair_key) {
      return HandleRepair(repair_store, *options.repair_key);
    }

    ba::storage::ChecksumLedger ledger(config.index_path);
    ba::storage::CatalogLog catalog(config.catalog_path);
    ba::core::Verifier verifier;

    StopSignalGuard signals;
    ba::orchestrator::EngineOptions engine_options;
    engine_options.stop_flag = &g_stop_requested;
    ba::orchestrator::ArmorEngine engine(config, ledger, catalog, repair_store, verifier,
                                         std::move(engine_options));
    const auto summary = engine.Run();
    reporter.PrintSummary(summary);
    return summary.ExitStatus();
  } catch (const ba::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
