#include "ba/storage/checksum_ledger.h"

#include "ba/common.h"
#include "ba/error.h"
#include "ba/errors.h"
#include "ba/orchestrator/io_util.h"

#include <cerrno>
#include <fstream>
#include <map>
#include <string>

namespace ba::storage {
namespace {

constexpr size_t kChecksumLength = 32;

bool IsLowerHex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

std::string EscapeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size() + 4);
  for (char c : key) {
    if (c == '\\') {
      out += "\\\\";
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::optional<std::string> UnescapeKey(std::string_view escaped) {
  std::string out;
  out.reserve(escaped.size());
  for (size_t i = 0; i < escaped.size(); ++i) {
    if (escaped[i] != '\\') {
      out.push_back(escaped[i]);
      continue;
    }
    if (i + 1 >= escaped.size()) {
      return std::nullopt;
    }
    const char next = escaped[++i];
    if (next == '\\') {
      out.push_back('\\');
    } else if (next == 'n') {
      out.push_back('\n');
    } else if (next == 'r') {
      out.push_back('\r');
    } else {
      return std::nullopt;
    }
  }
  return out;
}

} // namespace

bool IsValidChecksum(std::string_view checksum) {
  if (checksum.size() != kChecksumLength) {
    return false;
  }
  for (char c : checksum) {
    if (!IsLowerHex(c)) {
      return false;
    }
  }
  return true;
}

bool IsValidBookKey(std::string_view key) {
  const auto slash = key.find('/');
  return slash != std::string_view::npos && slash > 0 && slash + 1 < key.size() &&
         key.find('/', slash + 1) == std::string_view::npos;
}

std::string FormatLedgerLine(const std::string& checksum, const std::string& key) {
  const bool needs_escape = key.find_first_of("\\\n\r") != std::string::npos;
  std::string line;
  if (needs_escape) {
    line.push_back('\\');
  }
  line += checksum;
  line += "  ";
  line += needs_escape ? EscapeKey(key) : key;
  line.push_back('\n');
  return line;
}

std::optional<ChecksumEntry> ParseLedgerLine(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  bool escaped = false;
  if (!line.empty() && line.front() == '\\') {
    escaped = true;
    line.remove_prefix(1);
  }
  // "<md5>  <key>" in text mode, "<md5> *<key>" in binary mode.
  if (line.size() < kChecksumLength + 3 || line[kChecksumLength] != ' ' ||
      (line[kChecksumLength + 1] != ' ' && line[kChecksumLength + 1] != '*')) {
    return std::nullopt;
  }
  auto checksum = line.substr(0, kChecksumLength);
  if (!IsValidChecksum(checksum)) {
    return std::nullopt;
  }
  auto raw_key = line.substr(kChecksumLength + 2);
  ChecksumEntry entry;
  entry.checksum = std::string(checksum);
  if (escaped) {
    auto key = UnescapeKey(raw_key);
    if (!key) {
      return std::nullopt;
    }
    entry.key = std::move(*key);
  } else {
    entry.key = std::string(raw_key);
  }
  if (entry.key.empty()) {
    return std::nullopt;
  }
  return entry;
}

ChecksumLedger::ChecksumLedger(std::filesystem::path path) : path_(std::move(path)) {
  ba::orchestrator::EnsureFileExists(path_, ba::errors::io::kLedgerUnreadable);
  Reload();
}

void ChecksumLedger::Reload() {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    const int saved_errno = errno;
    throw ba::Error(ba::ErrorDomain::IO, ba::errors::io::kLedgerUnreadable,
                    std::string(ba::errors::msg::kLedgerUnreadable) + ": " +
                        ba::PathToUtf8String(path_),
                    saved_errno);
  }
  entries_.clear();
  first_checksum_.clear();
  malformed_lines_ = 0;

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    auto entry = ParseLedgerLine(line);
    if (!entry) {
      ++malformed_lines_;
      continue;
    }
    Index(*entry);
    entries_.push_back(std::move(*entry));
  }
  if (in.bad()) {
    throw ba::Error(ba::ErrorDomain::IO, ba::errors::io::kLedgerUnreadable,
                    std::string(ba::errors::msg::kLedgerUnreadable) + ": read error on " +
                        ba::PathToUtf8String(path_));
  }
}

void ChecksumLedger::Index(const ChecksumEntry& entry) {
  // First entry wins; later duplicates of the same key do not shadow it.
  first_checksum_.emplace(entry.key, entry.checksum);
}

bool ChecksumLedger::Contains(const std::string& key) const {
  return first_checksum_.find(key) != first_checksum_.end();
}

std::optional<std::string> ChecksumLedger::Lookup(const std::string& key) const {
  auto it = first_checksum_.find(key);
  if (it == first_checksum_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void ChecksumLedger::Append(const std::string& key, const std::string& checksum) {
  if (!IsValidChecksum(checksum)) {
    throw ba::Error(ba::ErrorDomain::Validation, ba::errors::validation::kMalformedChecksum,
                    std::string(ba::errors::msg::kMalformedChecksum) + ": '" + checksum + "'");
  }
  if (!IsValidBookKey(key)) {
    throw ba::Error(ba::ErrorDomain::Validation, ba::errors::validation::kInvalidBookKey,
                    std::string(ba::errors::msg::kInvalidBookKey) + ": '" + key + "'");
  }
  ba::orchestrator::AppendRecord(path_, FormatLedgerLine(checksum, key),
                                 ba::errors::io::kLedgerWriteFailed);
  ChecksumEntry entry{key, checksum};
  Index(entry);
  entries_.push_back(std::move(entry));
}

DuplicateReport ChecksumLedger::FindDuplicates() const {
  std::map<std::string, std::vector<std::string>> by_checksum;
  for (const auto& entry : entries_) {
    by_checksum[entry.checksum].push_back(entry.key);
  }
  DuplicateReport report;
  for (auto& [checksum, keys] : by_checksum) {
    if (keys.size() > 1) {
      report.groups.push_back(DuplicateGroup{checksum, std::move(keys)});
    }
  }
  return report;
}

} // namespace ba::storage
