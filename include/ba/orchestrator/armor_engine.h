#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

#include "ba/core/book_ref.h"
#include "ba/core/verifier.h"
#include "ba/orchestrator/config.h"
#include "ba/storage/catalog_log.h"
#include "ba/storage/checksum_ledger.h"
#include "ba/storage/repair_store.h"

namespace ba::orchestrator {

  enum class BookOutcome {
    kCataloged,
    kVerified,
    kMismatch,
    kProtectFailed,
    kContainerDamaged,
    kUnreadable,
    kRepairMissing,
    kParityFailed
  };

  const char* BookOutcomeToString(BookOutcome outcome);

  // Exit status bits; a run may set several.
  inline constexpr int kStatusMismatch = 0x01;
  inline constexpr int kStatusProtectFailure = 0x02;
  inline constexpr int kStatusDuplicates = 0x04;
  inline constexpr int kStatusInterrupted = 0x08;

  struct RunSummary {
    size_t books_seen{0};
    size_t cataloged{0};
    size_t verified_ok{0};
    size_t mismatches{0};
    size_t protect_failures{0};
    size_t container_failures{0};
    size_t unreadable{0};
    size_t repair_missing{0};
    size_t parity_failures{0};
    bool interrupted{false};         // stop requested before the walk finished
    bool stopped_on_failure{false};  // fail-fast ended the walk early
    ba::storage::DuplicateReport duplicates;

    [[nodiscard]] int ExitStatus() const noexcept;
  };

  struct EngineOptions {
    std::function<std::chrono::system_clock::time_point()> clock;  // defaults to system_clock::now
    const std::atomic<bool>* stop_flag{nullptr};                   // checked between books
  };

  // Classifies every book as known or unknown, catalogs and protects unknown
  // books, re-verifies known ones, then reports duplicates across the ledger.
  // Ledger and catalog write failures abort the run by exception; per-book
  // failures are recorded and handled according to the failure policy.
  class ArmorEngine {
  public:
    ArmorEngine(const ArmorConfig& config, ba::storage::ChecksumLedger& ledger,
                ba::storage::CatalogLog& catalog, ba::storage::RepairStore& repair_store,
                ba::core::Verifier& verifier, EngineOptions options = {});

    RunSummary Run();

    // Takes effect at the next book boundary.
    void RequestStop() noexcept { stop_requested_.store(true, std::memory_order_relaxed); }

  private:
    BookOutcome Process(const ba::core::BookRef& book);
    BookOutcome Catalog(const ba::core::BookRef& book);
    BookOutcome Verify(const ba::core::BookRef& book, const std::string& expected);
    void Record(BookOutcome outcome, RunSummary& summary) const;
    [[nodiscard]] bool StopRequested() const noexcept;
    [[nodiscard]] bool IsHardFailure(BookOutcome outcome) const noexcept;

    const ArmorConfig& config_;
    ba::storage::ChecksumLedger& ledger_;
    ba::storage::CatalogLog& catalog_;
    ba::storage::RepairStore& repair_store_;
    ba::core::Verifier& verifier_;
    EngineOptions options_;
    std::atomic<bool> stop_requested_{false};
  };

} // namespace ba::orchestrator
