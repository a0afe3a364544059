#include "ba/orchestrator/armor_engine.h"

#include "ba/common.h"
#include "ba/core/collection_walker.h"
#include "ba/error.h"
#include "ba/errors.h"
#include "ba/orchestrator/event_bus.h"

#include <string>
#include <utility>
#include <vector>

namespace ba::orchestrator {
namespace {

void Publish(EventCategory category, EventSeverity severity, std::string event_id,
             std::string message, std::vector<EventField> fields = {}) {
  Event event;
  event.category = category;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

std::vector<EventField> BookFields(const ba::core::BookRef& book) {
  return {EventField("key", book.key), EventField("collection", book.collection),
          EventField("name", book.name), EventField("path", ba::PathToUtf8String(book.path))};
}

EventField Count(const char* key, size_t value) {
  return EventField(key, std::to_string(value), true);
}

std::string RepairBasename(const std::filesystem::path& repair_dir) {
  auto normal = repair_dir.lexically_normal();
  if (!normal.has_filename()) {
    normal = normal.parent_path();
  }
  return normal.filename().string();
}

std::string JoinKeys(const std::vector<std::string>& keys) {
  std::string joined;
  for (const auto& key : keys) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += key;
  }
  return joined;
}

} // namespace

const char* BookOutcomeToString(BookOutcome outcome) {
  switch (outcome) {
  case BookOutcome::kCataloged:
    return "cataloged";
  case BookOutcome::kVerified:
    return "verified";
  case BookOutcome::kMismatch:
    return "mismatch";
  case BookOutcome::kProtectFailed:
    return "protect-failed";
  case BookOutcome::kContainerDamaged:
    return "container-damaged";
  case BookOutcome::kUnreadable:
    return "unreadable";
  case BookOutcome::kRepairMissing:
    return "repair-missing";
  case BookOutcome::kParityFailed:
    return "parity-failed";
  }
  return "unknown";
}

int RunSummary::ExitStatus() const noexcept {
  int status = 0;
  if (mismatches > 0) {
    status |= kStatusMismatch;
  }
  if (protect_failures > 0 || container_failures > 0 || unreadable > 0 || repair_missing > 0 ||
      parity_failures > 0) {
    status |= kStatusProtectFailure;
  }
  if (!duplicates.Empty()) {
    status |= kStatusDuplicates;
  }
  if (interrupted) {
    status |= kStatusInterrupted;
  }
  return status;
}

ArmorEngine::ArmorEngine(const ArmorConfig& config, ba::storage::ChecksumLedger& ledger,
                         ba::storage::CatalogLog& catalog, ba::storage::RepairStore& repair_store,
                         ba::core::Verifier& verifier, EngineOptions options)
    : config_(config),
      ledger_(ledger),
      catalog_(catalog),
      repair_store_(repair_store),
      verifier_(verifier),
      options_(std::move(options)) {
  if (!options_.clock) {
    options_.clock = [] { return std::chrono::system_clock::now(); };
  }
}

bool ArmorEngine::StopRequested() const noexcept {
  if (stop_requested_.load(std::memory_order_relaxed)) {
    return true;
  }
  return options_.stop_flag != nullptr && options_.stop_flag->load(std::memory_order_relaxed);
}

bool ArmorEngine::IsHardFailure(BookOutcome outcome) const noexcept {
  switch (outcome) {
  case BookOutcome::kMismatch:
  case BookOutcome::kProtectFailed:
  case BookOutcome::kContainerDamaged:
  case BookOutcome::kUnreadable:
  case BookOutcome::kParityFailed:
    return true;
  case BookOutcome::kCataloged:
  case BookOutcome::kVerified:
  case BookOutcome::kRepairMissing:
    return false;
  }
  return false;
}

RunSummary ArmorEngine::Run() {
  RunSummary summary;
  Publish(EventCategory::kLifecycle, EventSeverity::kInfo, "run_started", "Armor run started",
          {EventField("book_dir", ba::PathToUtf8String(config_.book_dir)),
           EventField("redundancy", std::to_string(config_.redundancy), true),
           EventField("failure_policy", FailurePolicyToString(config_.failure_policy))});

  ba::core::CollectionWalker walker(
      config_.book_dir, RepairBasename(config_.repair_dir),
      [](const std::filesystem::path& dir, const std::error_code& ec) {
        Publish(EventCategory::kDiagnostics, EventSeverity::kWarning, "collection_unreadable",
                "Skipping unreadable collection",
                {EventField("path", ba::PathToUtf8String(dir)), EventField("error", ec.message())});
      });

  while (auto book = walker.Next()) {
    if (StopRequested()) {
      summary.interrupted = true;
      Publish(EventCategory::kLifecycle, EventSeverity::kWarning, "run_interrupted",
              "Stop requested; remaining books left for the next run");
      break;
    }
    ++summary.books_seen;
    const auto outcome = Process(*book);
    Record(outcome, summary);
    if (config_.failure_policy == FailurePolicy::kFailFast && IsHardFailure(outcome)) {
      summary.stopped_on_failure = true;
      auto fields = BookFields(*book);
      fields.emplace_back("outcome", BookOutcomeToString(outcome));
      Publish(EventCategory::kLifecycle, EventSeverity::kError, "run_halted",
              "Stopping at first failure", std::move(fields));
      break;
    }
  }

  summary.duplicates = ledger_.FindDuplicates();
  if (!summary.duplicates.Empty()) {
    Publish(EventCategory::kCatalog, EventSeverity::kWarning, "duplicates_found", "Duplicates found",
            {Count("groups", summary.duplicates.groups.size())});
    for (const auto& group : summary.duplicates.groups) {
      Publish(EventCategory::kCatalog, EventSeverity::kWarning, "duplicate_group",
              "Books share a checksum",
              {EventField("checksum", group.checksum), EventField("keys", JoinKeys(group.keys)),
               Count("count", group.keys.size())});
    }
  }

  Publish(EventCategory::kLifecycle, EventSeverity::kInfo, "run_finished", "Armor run finished",
          {Count("books", summary.books_seen), Count("cataloged", summary.cataloged),
           Count("verified", summary.verified_ok), Count("mismatches", summary.mismatches),
           Count("protect_failures", summary.protect_failures),
           Count("container_failures", summary.container_failures),
           Count("unreadable", summary.unreadable), Count("repair_missing", summary.repair_missing),
           Count("parity_failures", summary.parity_failures),
           Count("duplicate_groups", summary.duplicates.groups.size()),
           EventField("exit_status", std::to_string(summary.ExitStatus()), true)});
  return summary;
}

void ArmorEngine::Record(BookOutcome outcome, RunSummary& summary) const {
  switch (outcome) {
  case BookOutcome::kCataloged:
    ++summary.cataloged;
    break;
  case BookOutcome::kVerified:
    ++summary.verified_ok;
    break;
  case BookOutcome::kMismatch:
    ++summary.mismatches;
    break;
  case BookOutcome::kProtectFailed:
    // Cataloged, but not protected.
    ++summary.cataloged;
    ++summary.protect_failures;
    break;
  case BookOutcome::kContainerDamaged:
    ++summary.container_failures;
    break;
  case BookOutcome::kUnreadable:
    ++summary.unreadable;
    break;
  case BookOutcome::kRepairMissing:
    ++summary.verified_ok;
    ++summary.repair_missing;
    break;
  case BookOutcome::kParityFailed:
    ++summary.verified_ok;
    ++summary.parity_failures;
    break;
  }
}

BookOutcome ArmorEngine::Process(const ba::core::BookRef& book) {
  try {
    if (auto expected = ledger_.Lookup(book.key)) {
      return Verify(book, *expected);
    }
    return Catalog(book);
  } catch (const ba::Error& err) {
    if (err.domain != ba::ErrorDomain::IO || err.code != ba::errors::io::kBookUnreadable) {
      throw;
    }
    auto fields = BookFields(book);
    fields.emplace_back("error", err.what());
    Publish(EventCategory::kVerification, EventSeverity::kError, "book_unreadable",
            "Book could not be read", std::move(fields));
    return BookOutcome::kUnreadable;
  }
}

BookOutcome ArmorEngine::Catalog(const ba::core::BookRef& book) {
  Publish(EventCategory::kCatalog, EventSeverity::kInfo, "book_cataloging", "Cataloging book",
          BookFields(book));

  // A damaged container is not cataloged, so it is examined again next run.
  const auto container = verifier_.VerifyContainerStructure(book.path);
  if (container.status != ba::core::ContainerStatus::kSkipped) {
    auto fields = BookFields(book);
    fields.emplace_back("status", ba::core::ContainerStatusToString(container.status));
    fields.emplace_back("detail", container.detail);
    if (container.status == ba::core::ContainerStatus::kFailed) {
      Publish(EventCategory::kVerification, EventSeverity::kError, "container_damaged",
              "ZIP structure test failed", std::move(fields));
      return BookOutcome::kContainerDamaged;
    }
    Publish(EventCategory::kVerification, EventSeverity::kInfo, "container_checked",
            "ZIP structure test passed", std::move(fields));
  }

  const auto checksum = verifier_.Checksum(book.path);
  ledger_.Append(book.key, checksum);
  catalog_.Append(ba::storage::FormatDate(options_.clock()), checksum, book.key);
  {
    auto fields = BookFields(book);
    fields.emplace_back("checksum", checksum);
    Publish(EventCategory::kCatalog, EventSeverity::kInfo, "book_cataloged", "Book cataloged",
            std::move(fields));
  }

  Publish(EventCategory::kRepair, EventSeverity::kInfo, "book_protecting", "Protecting book",
          BookFields(book));
  try {
    const auto set = repair_store_.Protect(book, config_.redundancy);
    auto fields = BookFields(book);
    fields.emplace_back("index", ba::PathToUtf8String(set.index));
    fields.push_back(Count("artifacts", set.artifacts.size()));
    Publish(EventCategory::kRepair, EventSeverity::kInfo, "book_protected",
            "Recovery data created and verified", std::move(fields));
  } catch (const ba::RepairCreationError& err) {
    auto fields = BookFields(book);
    fields.emplace_back("error", err.what());
    fields.emplace_back("code", std::to_string(err.code), true);
    Publish(EventCategory::kRepair, EventSeverity::kError, "protect_failed",
            "Recovery data could not be created", std::move(fields));
    return BookOutcome::kProtectFailed;
  }
  return BookOutcome::kCataloged;
}

BookOutcome ArmorEngine::Verify(const ba::core::BookRef& book, const std::string& expected) {
  Publish(EventCategory::kVerification, EventSeverity::kInfo, "book_verifying", "Verifying book",
          BookFields(book));
  const auto verdict = verifier_.VerifyChecksum(book.path, expected);
  if (!verdict.match) {
    auto fields = BookFields(book);
    fields.emplace_back("expected", verdict.expected);
    fields.emplace_back("actual", verdict.actual);
    Publish(EventCategory::kVerification, EventSeverity::kError, "checksum_mismatch",
            "Checksum does not match the ledger", std::move(fields));
    return BookOutcome::kMismatch;
  }
  Publish(EventCategory::kVerification, EventSeverity::kInfo, "book_verified", "Checksum verified",
          BookFields(book));

  if (!repair_store_.Has(book.key)) {
    Publish(EventCategory::kRepair, EventSeverity::kWarning, "repair_missing",
            "No recovery data for cataloged book", BookFields(book));
    return BookOutcome::kRepairMissing;
  }
  if (config_.verify_parity) {
    const bool recoverable = repair_store_.Verify(book.key);
    Publish(EventCategory::kRepair, recoverable ? EventSeverity::kInfo : EventSeverity::kError,
            recoverable ? "parity_verified" : "parity_failed",
            recoverable ? "Recovery data verified" : "Recovery data failed verification",
            BookFields(book));
    if (!recoverable) {
      return BookOutcome::kParityFailed;
    }
  }
  return BookOutcome::kVerified;
}

} // namespace ba::orchestrator
