#include "ba/storage/checksum_ledger.h"
#include "ba/error.h"

#include "test_support.h"

#include <cassert>
#include <iostream>
#include <string>

namespace {

constexpr const char* kSumA = "0123456789abcdef0123456789abcdef";
constexpr const char* kSumB = "fedcba9876543210fedcba9876543210";
constexpr const char* kSumC = "00000000000000000000000000000001";

void TestAppendWritesMd5sumFormat() {
  ba_test::TempDir dir("ba_ledger_");
  const auto path = dir.path() / "index.md5sum";
  ba::storage::ChecksumLedger ledger(path);
  assert(std::filesystem::exists(path) && "ledger file is created on open");
  assert(ledger.Entries().empty());

  ledger.Append("Fiction/a.epub", kSumA);
  ledger.Append("NonFiction/b.pdf", kSumB);
  const auto lines = ba_test::ReadLines(path);
  assert(lines.size() == 2);
  assert(lines[0] == std::string(kSumA) + "  Fiction/a.epub");
  assert(lines[1] == std::string(kSumB) + "  NonFiction/b.pdf");
}

void TestLookupIsExactNotSubstring() {
  ba_test::TempDir dir("ba_ledger_");
  ba::storage::ChecksumLedger ledger(dir.path() / "index.md5sum");
  ledger.Append("Fiction/data.epub", kSumA);

  assert(ledger.Contains("Fiction/data.epub"));
  assert(!ledger.Contains("Fiction/a.epub"));
  assert(!ledger.Contains("data.epub"));
  assert(!ledger.Lookup("Fiction/ata.epub").has_value());
  assert(ledger.Lookup("Fiction/data.epub").value() == kSumA);
}

void TestReloadAndFirstEntryWins() {
  ba_test::TempDir dir("ba_ledger_");
  const auto path = dir.path() / "index.md5sum";
  ba_test::WriteFile(path, std::string(kSumA) + "  Fiction/a.epub\n" +
                               "not a ledger line\n" +
                               std::string(kSumB) + " *Fiction/binary.pdf\n" +
                               std::string(kSumC) + "  Fiction/a.epub\n");
  ba::storage::ChecksumLedger ledger(path);
  assert(ledger.Entries().size() == 3);
  assert(ledger.MalformedLines() == 1);
  assert(ledger.Lookup("Fiction/a.epub").value() == kSumA);
  assert(ledger.Lookup("Fiction/binary.pdf").value() == kSumB);

  ba::storage::ChecksumLedger reopened(path);
  reopened.Append("Poetry/c.txt", kSumC);
  ledger.Reload();
  assert(ledger.Contains("Poetry/c.txt"));
}

void TestEscapedKeysRoundTrip() {
  ba_test::TempDir dir("ba_ledger_");
  const auto path = dir.path() / "index.md5sum";
  ba::storage::ChecksumLedger ledger(path);
  const std::string odd = "Odd/back\\slash\nnewline.txt";
  ledger.Append(odd, kSumA);

  const auto raw = ba_test::ReadFile(path);
  assert(raw == "\\" + std::string(kSumA) + "  Odd/back\\\\slash\\nnewline.txt\n");

  ba::storage::ChecksumLedger reopened(path);
  assert(reopened.Lookup(odd).value() == kSumA);

  // A name ending in CR must survive the CRLF tolerance of the reader.
  const std::string trailing_cr = "Fiction/cr\r";
  reopened.Append(trailing_cr, kSumB);
  const auto lines = ba_test::ReadLines(path);
  assert(lines.size() == 2);
  assert(lines[1] == "\\" + std::string(kSumB) + "  Fiction/cr\\r");
  reopened.Reload();
  assert(reopened.Lookup(trailing_cr).value() == kSumB);
  assert(!reopened.Contains("Fiction/cr"));
  assert(reopened.MalformedLines() == 0);
}

void TestValidation() {
  ba_test::TempDir dir("ba_ledger_");
  ba::storage::ChecksumLedger ledger(dir.path() / "index.md5sum");

  bool threw = false;
  try {
    ledger.Append("Fiction/a.epub", "ABCDEF0123456789ABCDEF0123456789");
  } catch (const ba::Error& err) {
    threw = err.domain == ba::ErrorDomain::Validation &&
            err.code == ba::errors::validation::kMalformedChecksum;
  }
  assert(threw && "uppercase checksum must be rejected");

  threw = false;
  try {
    ledger.Append("loose-file.txt", kSumA);
  } catch (const ba::Error& err) {
    threw = err.code == ba::errors::validation::kInvalidBookKey;
  }
  assert(threw && "keys must name a collection");
  assert(ledger.Entries().empty());
}

void TestDuplicates() {
  ba_test::TempDir dir("ba_ledger_");
  ba::storage::ChecksumLedger ledger(dir.path() / "index.md5sum");
  ledger.Append("A/x.epub", kSumA);
  ledger.Append("B/y.epub", kSumA);
  ledger.Append("A/z.pdf", kSumB);
  ledger.Append("C/x.epub", kSumC);

  const auto report = ledger.FindDuplicates();
  assert(report.groups.size() == 1);
  assert(report.groups[0].checksum == kSumA);
  assert(report.groups[0].keys.size() == 2);
  assert(report.groups[0].keys[0] == "A/x.epub");
  assert(report.groups[0].keys[1] == "B/y.epub");

  ba::storage::ChecksumLedger distinct(dir.path() / "other.md5sum");
  distinct.Append("A/x.epub", kSumA);
  distinct.Append("A/y.epub", kSumB);
  assert(distinct.FindDuplicates().Empty());
}

void TestUnwritableLedgerIsIoError() {
  ba_test::TempDir dir("ba_ledger_");
  const auto blocker = dir.path() / "file";
  ba_test::WriteFile(blocker, "x");
  bool threw = false;
  try {
    ba::storage::ChecksumLedger ledger(blocker / "index.md5sum");
  } catch (const ba::Error& err) {
    threw = err.domain == ba::ErrorDomain::IO && err.code == ba::errors::io::kLedgerUnreadable;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAppendWritesMd5sumFormat();
  TestLookupIsExactNotSubstring();
  TestReloadAndFirstEntryWins();
  TestEscapedKeysRoundTrip();
  TestValidation();
  TestDuplicates();
  TestUnwritableLedgerIsIoError();
  std::cout << "checksum ledger tests ok\n";
  return 0;
}
