#include "ba/core/zip_archive.h"

#include "ba/common.h"
#include "ba/error.h"
#include "ba/errors.h"

#include <zip.h>

#include <cerrno>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ba::core {
namespace {

constexpr std::string_view kLocalHeaderMagic{"PK\x03\x04", 4};
constexpr std::string_view kEmptyArchiveMagic{"PK\x05\x06", 4};

constexpr size_t kChunkSize = 64 * 1024;

class ArchiveCloser {
public:
  void operator()(zip_t* archive) const noexcept { zip_discard(archive); }
};

class MemberCloser {
public:
  void operator()(zip_file_t* member) const noexcept { zip_fclose(member); }
};

using ArchivePtr = std::unique_ptr<zip_t, ArchiveCloser>;
using MemberPtr = std::unique_ptr<zip_file_t, MemberCloser>;

[[noreturn]] void ThrowUnreadable(const std::filesystem::path& path, std::string_view what,
                                  std::optional<int> native = std::nullopt) {
  throw ba::Error(ba::ErrorDomain::IO, ba::errors::io::kBookUnreadable,
                  std::string(ba::errors::msg::kBookUnreadable) + " (" + std::string(what) +
                      "): " + ba::PathToUtf8String(path),
                  native);
}

std::string DescribeZipError(int code) {
  zip_error_t error;
  zip_error_init_with_code(&error, code);
  std::string text = zip_error_strerror(&error);
  zip_error_fini(&error);
  return text;
}

// Errors that mean the file itself could not be read, as opposed to an
// archive that was read and found damaged.
bool IsAccessError(int code) {
  return code == ZIP_ER_NOENT || code == ZIP_ER_OPEN || code == ZIP_ER_READ;
}

ArchivePtr OpenArchive(const std::filesystem::path& path, int flags, int& error_code) {
  error_code = ZIP_ER_OK;
  return ArchivePtr(zip_open(path.c_str(), flags, &error_code));
}

// Leading bytes of the file; fewer than requested when the file is shorter.
std::string ReadPrefix(const std::filesystem::path& path, size_t length) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    ThrowUnreadable(path, "open", errno);
  }
  std::string prefix(length, '\0');
  in.read(prefix.data(), static_cast<std::streamsize>(length));
  if (in.bad()) {
    ThrowUnreadable(path, "read");
  }
  prefix.resize(static_cast<size_t>(in.gcount()));
  return prefix;
}

bool IsSkippable(const zip_stat_t& stat) {
  if ((stat.valid & ZIP_STAT_ENCRYPTION_METHOD) != 0 && stat.encryption_method != ZIP_EM_NONE) {
    return true;
  }
  return (stat.valid & ZIP_STAT_COMP_METHOD) != 0 &&
         !zip_compression_method_supported(stat.comp_method, 0);
}

// Reads one member to the end. libzip checks the CRC-32 once the last byte
// has been delivered. Returns the problem found, if any.
std::optional<std::string> ReadMember(zip_t* archive, zip_uint64_t index, const zip_stat_t& stat,
                                      std::vector<char>& buffer) {
  const std::string name = (stat.valid & ZIP_STAT_NAME) != 0 && stat.name != nullptr
                               ? std::string(stat.name)
                               : "#" + std::to_string(index);
  MemberPtr member(zip_fopen_index(archive, index, 0));
  if (!member) {
    return "member " + name + ": " + zip_error_strerror(zip_get_error(archive));
  }
  zip_uint64_t total = 0;
  for (;;) {
    const zip_int64_t got = zip_fread(member.get(), buffer.data(), buffer.size());
    if (got < 0) {
      return "member " + name + ": " + zip_error_strerror(zip_file_get_error(member.get()));
    }
    if (got == 0) {
      break;
    }
    total += static_cast<zip_uint64_t>(got);
  }
  if ((stat.valid & ZIP_STAT_SIZE) != 0 && total != stat.size) {
    return "member " + name + ": size mismatch, expected " + std::to_string(stat.size) +
           ", got " + std::to_string(total);
  }
  return std::nullopt;
}

} // namespace

bool LooksLikeZip(const std::filesystem::path& path) {
  const auto prefix = ReadPrefix(path, kLocalHeaderMagic.size());
  if (prefix.size() < kLocalHeaderMagic.size()) {
    return false;  // libzip would open an empty file as an empty archive
  }
  if (prefix == kLocalHeaderMagic || prefix == kEmptyArchiveMagic) {
    return true;
  }
  int error_code = ZIP_ER_OK;
  return OpenArchive(path, ZIP_RDONLY, error_code) != nullptr;
}

ZipTestReport TestZipArchive(const std::filesystem::path& path) {
  ZipTestReport report;
  ReadPrefix(path, 1);  // surfaces an unreadable file as an IO error

  int error_code = ZIP_ER_OK;
  auto archive = OpenArchive(path, ZIP_RDONLY | ZIP_CHECKCONS, error_code);
  if (!archive) {
    if (IsAccessError(error_code)) {
      ThrowUnreadable(path, DescribeZipError(error_code));
    }
    report.error = DescribeZipError(error_code);
    return report;
  }

  const zip_int64_t count = zip_get_num_entries(archive.get(), 0);
  if (count < 0) {
    report.error = zip_error_strerror(zip_get_error(archive.get()));
    return report;
  }

  std::vector<char> buffer(kChunkSize);
  for (zip_uint64_t index = 0; index < static_cast<zip_uint64_t>(count); ++index) {
    zip_stat_t stat;
    zip_stat_init(&stat);
    if (zip_stat_index(archive.get(), index, 0, &stat) != 0) {
      report.error = "member #" + std::to_string(index) + ": " +
                     zip_error_strerror(zip_get_error(archive.get()));
      return report;
    }
    if (IsSkippable(stat)) {
      ++report.entries_skipped;
      continue;
    }
    if (auto problem = ReadMember(archive.get(), index, stat, buffer)) {
      report.error = std::move(*problem);
      return report;
    }
    ++report.entries_tested;
  }
  report.ok = true;
  return report;
}

} // namespace ba::core
