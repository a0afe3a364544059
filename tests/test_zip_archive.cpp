#include "ba/core/verifier.h"
#include "ba/core/zip_archive.h"

#include "ba/error.h"

#include "test_support.h"

#include <cassert>
#include <iostream>
#include <string>

namespace {

std::vector<ba_test::ZipMember> SampleMembers() {
  std::string chapter;
  for (int i = 0; i < 500; ++i) {
    chapter += "It was a dark and stormy night, paragraph " + std::to_string(i) + ".\n";
  }
  return {{"mimetype", "application/epub+zip", false},
          {"META-INF/container.xml", "<container/>", true},
          {"OEBPS/chapter1.xhtml", chapter, true}};
}

void TestValidArchivePasses() {
  ba_test::TempDir dir("ba_zip_");
  const auto path = dir.path() / "novel.epub";
  ba_test::WriteBytes(path, ba_test::BuildZip(SampleMembers()));

  assert(ba::core::LooksLikeZip(path));
  const auto report = ba::core::TestZipArchive(path);
  assert(report.ok);
  assert(report.entries_tested == 3);
  assert(report.entries_skipped == 0);
  assert(report.error.empty());
}

void TestFlippedByteFails() {
  ba_test::TempDir dir("ba_zip_");
  const auto path = dir.path() / "comic.cbz";
  auto bytes = ba_test::BuildZip(SampleMembers());
  // Well inside the deflated chapter, past its local header and name.
  const std::string name = "OEBPS/chapter1.xhtml";
  const size_t target = ba_test::FindBytes(bytes, name) + name.size() + 64;
  bytes[target] ^= 0x5A;
  ba_test::WriteBytes(path, bytes);

  const auto report = ba::core::TestZipArchive(path);
  assert(!report.ok);
  assert(!report.error.empty());

  ba::core::Verifier verifier;
  const auto check = verifier.VerifyContainerStructure(path);
  assert(check.status == ba::core::ContainerStatus::kFailed);
}

void TestStoredCrcMismatchFails() {
  ba_test::TempDir dir("ba_zip_");
  const auto path = dir.path() / "stored.zip";
  auto bytes = ba_test::BuildZip({{"plain.txt", "stored payload", false}});
  bytes[ba_test::FindBytes(bytes, "stored payload")] = static_cast<uint8_t>('S');
  ba_test::WriteBytes(path, bytes);

  const auto report = ba::core::TestZipArchive(path);
  assert(!report.ok);
  assert(report.error.find("CRC") != std::string::npos);
}

void TestTruncatedArchiveFails() {
  ba_test::TempDir dir("ba_zip_");
  const auto path = dir.path() / "cut.epub";
  auto bytes = ba_test::BuildZip(SampleMembers());
  bytes.resize(bytes.size() - 30);
  ba_test::WriteBytes(path, bytes);
  assert(ba::core::LooksLikeZip(path));
  assert(!ba::core::TestZipArchive(path).ok);
}

void TestEmptyArchive() {
  ba_test::TempDir dir("ba_zip_");
  const auto path = dir.path() / "empty.zip";
  ba_test::WriteBytes(path, ba_test::BuildZip({}));
  assert(ba::core::LooksLikeZip(path));
  const auto report = ba::core::TestZipArchive(path);
  assert(report.ok && report.entries_tested == 0);
}

void TestPrefixedArchivePasses() {
  ba_test::TempDir dir("ba_zip_");
  const auto path = dir.path() / "selfextract.epub";
  const std::string stub = "#!/bin/sh\n# unpack with unzip\nexit 0\n" + std::string(40, ' ');
  ba_test::WriteBytes(path, ba_test::PrependStub(ba_test::BuildZip(SampleMembers()), stub));

  assert(ba::core::LooksLikeZip(path));
  const auto report = ba::core::TestZipArchive(path);
  assert(report.ok);
  assert(report.entries_tested == 3);

  ba::core::Verifier verifier;
  assert(verifier.VerifyContainerStructure(path).status == ba::core::ContainerStatus::kPassed);
}

void TestUnreadableFileThrows() {
  ba_test::TempDir dir("ba_zip_");
  bool threw = false;
  try {
    ba::core::TestZipArchive(dir.path() / "missing.cbz");
  } catch (const ba::Error& err) {
    threw = err.domain == ba::ErrorDomain::IO && err.code == ba::errors::io::kBookUnreadable;
  }
  assert(threw);
}

void TestNonZipIsSkipped() {
  ba_test::TempDir dir("ba_zip_");
  const auto pdf = dir.path() / "paper.pdf";
  ba_test::WriteFile(pdf, "%PDF-1.7\n...");
  const auto tiny = dir.path() / "tiny.txt";
  ba_test::WriteFile(tiny, "PK");

  assert(!ba::core::LooksLikeZip(pdf));
  assert(!ba::core::LooksLikeZip(tiny));

  ba::core::Verifier verifier;
  assert(verifier.VerifyContainerStructure(pdf).status == ba::core::ContainerStatus::kSkipped);

  // Extension does not matter; content does.
  const auto disguised = dir.path() / "book.txt";
  ba_test::WriteBytes(disguised, ba_test::BuildZip(SampleMembers()));
  assert(verifier.VerifyContainerStructure(disguised).status == ba::core::ContainerStatus::kPassed);
}

} // namespace

int main() {
  TestValidArchivePasses();
  TestFlippedByteFails();
  TestStoredCrcMismatchFails();
  TestTruncatedArchiveFails();
  TestEmptyArchive();
  TestPrefixedArchivePasses();
  TestUnreadableFileThrows();
  TestNonZipIsSkipped();
  std::cout << "zip archive tests ok\n";
  return 0;
}
