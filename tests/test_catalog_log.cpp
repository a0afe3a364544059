#include "ba/storage/catalog_log.h"
#include "ba/error.h"

#include "test_support.h"

#include <cassert>
#include <iostream>
#include <string>

namespace {

void TestAppendAndRead() {
  ba_test::TempDir dir("ba_catalog_");
  const auto path = dir.path() / "index.csv";
  ba::storage::CatalogLog log(path);
  assert(std::filesystem::exists(path));

  const auto date = ba::storage::FormatDate(ba_test::FixedTime());
  assert(date == "2024-03-05");

  log.Append(date, "0123456789abcdef0123456789abcdef", "Fiction/a.epub");
  log.Append(date, "fedcba9876543210fedcba9876543210", "Fiction/tab\tname.pdf");

  const auto lines = ba_test::ReadLines(path);
  assert(lines.size() == 2);
  assert(lines[0] == "2024-03-05\t0123456789abcdef0123456789abcdef\tFiction/a.epub");

  const auto records = log.Records();
  assert(records.size() == 2);
  assert(records[0].date == "2024-03-05");
  assert(records[0].key == "Fiction/a.epub");
  assert(records[1].key == "Fiction/tab\tname.pdf");
  assert(records[1].checksum == "fedcba9876543210fedcba9876543210");
}

void TestRecordsSkipPartialLines() {
  ba_test::TempDir dir("ba_catalog_");
  const auto path = dir.path() / "index.csv";
  ba_test::WriteFile(path, "2024-01-01\tonly-two-fields\n2024-01-02\tabc\tA/b.txt\n");
  ba::storage::CatalogLog log(path);
  const auto records = log.Records();
  assert(records.size() == 1);
  assert(records[0].key == "A/b.txt");
}

void TestUnwritableCatalog() {
  ba_test::TempDir dir("ba_catalog_");
  ba_test::WriteFile(dir.path() / "file", "x");
  bool threw = false;
  try {
    ba::storage::CatalogLog log(dir.path() / "file" / "index.csv");
  } catch (const ba::Error& err) {
    threw = err.domain == ba::ErrorDomain::IO && err.code == ba::errors::io::kCatalogUnreadable;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAppendAndRead();
  TestRecordsSkipPartialLines();
  TestUnwritableCatalog();
  std::cout << "catalog log tests ok\n";
  return 0;
}
