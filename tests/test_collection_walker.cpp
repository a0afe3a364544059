#include "ba/core/collection_walker.h"
#include "ba/error.h"

#include "test_support.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> DrainKeys(ba::core::CollectionWalker& walker) {
  std::vector<std::string> keys;
  while (auto book = walker.Next()) {
    assert(book->path.is_absolute());
    assert(book->key == book->collection + "/" + book->name);
    keys.push_back(book->key);
  }
  return keys;
}

void TestClassification() {
  ba_test::TempDir dir("ba_walker_");
  const auto root = dir.path();
  ba_test::WriteFile(root / "readme.txt", "not a book");
  ba_test::WriteFile(root / "Fiction" / "b.epub", "b");
  ba_test::WriteFile(root / "Fiction" / "a.epub", "a");
  ba_test::WriteFile(root / "Fiction" / ".hidden.epub", "h");
  ba_test::WriteFile(root / "Fiction" / "nested" / "deep.pdf", "d");
  ba_test::WriteFile(root / "NonFiction" / "c.pdf", "c");
  ba_test::WriteFile(root / "repair" / "a.epub.par2", "p");
  ba_test::WriteFile(root / ".Trash" / "gone.epub", "g");
  std::filesystem::create_directories(root / "Empty");
  std::filesystem::create_symlink(root / "Fiction" / "a.epub", root / "NonFiction" / "link.epub");
  std::filesystem::create_symlink(root / "missing", root / "NonFiction" / "dangling.epub");

  ba::core::CollectionWalker walker(root, "repair");
  assert((walker.Collections() == std::vector<std::string>{"Empty", "Fiction", "NonFiction"}));
  const auto keys = DrainKeys(walker);
  const std::vector<std::string> expected{"Fiction/a.epub", "Fiction/b.epub", "NonFiction/c.pdf",
                                          "NonFiction/link.epub"};
  assert(keys == expected);
  assert(!walker.Next().has_value() && "sequence stays exhausted");
}

void TestDoesNotChangeWorkingDirectory() {
  ba_test::TempDir dir("ba_walker_");
  ba_test::WriteFile(dir.path() / "Poetry" / "odes.txt", "o");
  const auto before = std::filesystem::current_path();
  ba::core::CollectionWalker walker(dir.path(), "repair");
  auto book = walker.Next();
  assert(book.has_value());
  assert(book->path == dir.path() / "Poetry" / "odes.txt");
  assert(std::filesystem::current_path() == before);
}

void TestMissingBookDirThrows() {
  ba_test::TempDir dir("ba_walker_");
  bool threw = false;
  try {
    ba::core::CollectionWalker walker(dir.path() / "nope", "repair");
  } catch (const ba::Error& err) {
    threw = err.domain == ba::ErrorDomain::IO && err.code == ba::errors::io::kBookDirUnreadable;
  }
  assert(threw);
}

} // namespace

int main() {
  TestClassification();
  TestDoesNotChangeWorkingDirectory();
  TestMissingBookDirThrows();
  std::cout << "collection walker tests ok\n";
  return 0;
}
