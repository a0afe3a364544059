#include "ba/orchestrator/console_reporter.h"

#include <string>

namespace ba::orchestrator {

void ConsoleReporter::Attach() {
  EventBus::Instance().Subscribe([this](const Event& event) { OnEvent(event); });
}

void ConsoleReporter::OnEvent(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  const auto& id = event.event_id;
  const auto key = event.Field("key");

  if (id == "book_cataloging") {
    out_ << "Cataloging " << key << " ..." << '\n';
  } else if (id == "container_checked") {
    out_ << "ZIP check  " << key << " ... OK (" << event.Field("detail") << ")" << '\n';
  } else if (id == "container_damaged") {
    out_ << "ZIP check  " << key << " ... FAILED (" << event.Field("detail") << ")" << '\n';
  } else if (id == "book_protecting") {
    out_ << "Protecting " << key << " ..." << '\n';
  } else if (id == "book_protected" || id == "parity_verified") {
    out_ << "Verifying  " << key << " is recoverable ... yes." << '\n';
  } else if (id == "parity_failed") {
    out_ << "Verifying  " << key << " is recoverable ... no." << '\n';
  } else if (id == "protect_failed") {
    out_ << "Verifying  " << key << " is recoverable ... no." << '\n';
    err_ << "  " << event.Field("error") << '\n';
  } else if (id == "repair_missing") {
    out_ << "Verifying  " << key << " is recoverable ... no recovery data." << '\n';
  } else if (id == "book_verified") {
    out_ << "Verifying " << key << " ... OK" << '\n';
  } else if (id == "checksum_mismatch") {
    out_ << "Verifying " << key << " ... FAILED (expected " << event.Field("expected") << ", got "
         << event.Field("actual") << ")" << '\n';
  } else if (id == "book_unreadable") {
    out_ << "Reading " << key << " ... FAILED" << '\n';
    err_ << "  " << event.Field("error") << '\n';
  } else if (id == "collection_unreadable") {
    err_ << "Skipping " << event.Field("path") << ": " << event.Field("error") << '\n';
  } else if (id == "duplicates_found") {
    out_ << "Duplicates found:" << '\n';
  } else if (id == "duplicate_group") {
    out_ << "    " << event.Field("checksum") << "  " << event.Field("keys") << '\n';
  } else if (id == "run_interrupted") {
    err_ << "Interrupted; remaining books will be handled on the next run." << '\n';
  } else if (id == "run_halted") {
    err_ << "Stopping after " << key << " (" << event.Field("outcome") << ")" << '\n';
  }
  out_.flush();
}

void ConsoleReporter::PrintSummary(const RunSummary& summary) {
  std::lock_guard<std::mutex> guard(mutex_);
  out_ << "Summary: " << summary.books_seen << " books, " << summary.cataloged << " cataloged, "
       << summary.verified_ok << " verified, " << summary.mismatches << " mismatched" << '\n';
  if (summary.protect_failures > 0 || summary.container_failures > 0 || summary.unreadable > 0 ||
      summary.repair_missing > 0 || summary.parity_failures > 0) {
    out_ << "Failures: " << summary.protect_failures << " protect, " << summary.container_failures
         << " container, " << summary.unreadable << " unreadable, " << summary.repair_missing
         << " without recovery data, " << summary.parity_failures << " unrecoverable" << '\n';
  }
  if (!summary.duplicates.Empty()) {
    out_ << "Duplicate groups: " << summary.duplicates.groups.size() << '\n';
  }
  if (summary.interrupted) {
    out_ << "Run interrupted before completion." << '\n';
  } else if (summary.stopped_on_failure) {
    out_ << "Run stopped at first failure (fail-fast)." << '\n';
  }
  out_.flush();
}

} // namespace ba::orchestrator
