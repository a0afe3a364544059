#include "ba/orchestrator/io_util.h"

#include "test_support.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

constexpr int kTestCode = ba::errors::io::kLedgerWriteFailed;

void TestAppendCreatesAndAppends() {
  ba_test::TempDir dir("ba_io_util_");
  const auto target = dir.path() / "nested" / "log.txt";
  std::filesystem::create_directories(target.parent_path());

  ba::orchestrator::AppendRecord(target, "first\n", kTestCode);
  ba::orchestrator::AppendRecord(target, "second\n", kTestCode);
  assert(ba_test::ReadFile(target) == "first\nsecond\n");
}

void TestAppendFailureCarriesCode() {
  ba_test::TempDir dir("ba_io_util_");
  const auto blocker = dir.path() / "not_a_dir";
  ba_test::WriteFile(blocker, "x");

  bool threw = false;
  try {
    ba::orchestrator::AppendRecord(blocker / "log.txt", "record\n", kTestCode);
  } catch (const ba::Error& err) {
    threw = err.domain == ba::ErrorDomain::IO && err.code == kTestCode && err.native_code.has_value();
    assert(!err.context.empty() && "context stack should be attached");
  }
  assert(threw && "append under a regular file must fail");
}

void TestEnsureFileExists() {
  ba_test::TempDir dir("ba_io_util_");
  const auto target = dir.path() / "a" / "b" / "index.md5sum";
  ba::orchestrator::EnsureFileExists(target, kTestCode);
  assert(std::filesystem::is_regular_file(target));
  assert(std::filesystem::file_size(target) == 0);

  ba_test::WriteFile(target, "keep\n");
  ba::orchestrator::EnsureFileExists(target, kTestCode);
  assert(ba_test::ReadFile(target) == "keep\n");

  bool threw = false;
  try {
    ba::orchestrator::EnsureFileExists(dir.path() / "a", kTestCode);
  } catch (const ba::Error& err) {
    threw = err.code == kTestCode;
  }
  assert(threw && "a directory is not a usable file");
}

void TestNumberedBackupMove() {
  ba_test::TempDir dir("ba_io_util_");
  const auto src_dir = dir.path() / "src";
  const auto dest_dir = dir.path() / "dest";
  std::filesystem::create_directories(dest_dir);

  ba_test::WriteFile(src_dir / "book.par2", "one");
  auto placed = ba::orchestrator::MoveWithNumberedBackup(src_dir / "book.par2", dest_dir);
  assert(placed == dest_dir / "book.par2");
  assert(!std::filesystem::exists(src_dir / "book.par2"));

  ba_test::WriteFile(src_dir / "book.par2", "two");
  ba::orchestrator::MoveWithNumberedBackup(src_dir / "book.par2", dest_dir);
  ba_test::WriteFile(src_dir / "book.par2", "three");
  ba::orchestrator::MoveWithNumberedBackup(src_dir / "book.par2", dest_dir);

  assert(ba_test::ReadFile(dest_dir / "book.par2") == "three");
  assert(ba_test::ReadFile(dest_dir / "book.par2.~1~") == "one");
  assert(ba_test::ReadFile(dest_dir / "book.par2.~2~") == "two");
}

void TestBackupExisting() {
  ba_test::TempDir dir("ba_io_util_");
  const auto target = dir.path() / "novel.epub";
  ba_test::WriteFile(target, "damaged");
  const auto backup = ba::orchestrator::BackupExisting(target);
  assert(backup == dir.path() / "novel.epub.~1~");
  assert(!std::filesystem::exists(target));
  assert(ba_test::ReadFile(backup) == "damaged");
}

} // namespace

int main() {
  TestAppendCreatesAndAppends();
  TestAppendFailureCarriesCode();
  TestEnsureFileExists();
  TestNumberedBackupMove();
  TestBackupExisting();
  std::cout << "io_util tests ok\n";
  return 0;
}
