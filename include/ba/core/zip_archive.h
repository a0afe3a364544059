#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace ba::core {

  struct ZipTestReport {
    bool ok{false};
    size_t entries_tested{0};
    size_t entries_skipped{0};  // encrypted members or unsupported compression
    std::string error;          // first problem found when !ok
  };

  // True when the file starts with a ZIP local-header or empty-archive
  // signature, or when libzip can open it as an archive (self-extracting
  // stubs and other prefixed archives). Throws ba::Error (IO) when the file
  // cannot be read.
  bool LooksLikeZip(const std::filesystem::path& path);

  // Opens the archive with libzip's consistency checks and reads every member
  // through to the end, letting libzip verify each CRC-32. Structural damage
  // is reported in the result; only a file that cannot be opened or read
  // throws ba::Error (IO).
  ZipTestReport TestZipArchive(const std::filesystem::path& path);

} // namespace ba::core
