#include "ba/storage/catalog_log.h"

#include "ba/common.h"
#include "ba/error.h"
#include "ba/errors.h"
#include "ba/orchestrator/io_util.h"

#include <cerrno>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace ba::storage {
namespace {

// Tabs and line breaks inside a key would break the record framing.
std::string EscapeField(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out.push_back(c);
      break;
    }
  }
  return out;
}

std::string UnescapeField(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size()) {
      const char next = value[++i];
      out.push_back(next == 't' ? '\t' : next == 'n' ? '\n' : next == 'r' ? '\r' : next);
    } else {
      out.push_back(value[i]);
    }
  }
  return out;
}

} // namespace

std::string FormatDate(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d");
  return oss.str();
}

CatalogLog::CatalogLog(std::filesystem::path path) : path_(std::move(path)) {
  ba::orchestrator::EnsureFileExists(path_, ba::errors::io::kCatalogUnreadable);
}

void CatalogLog::Append(const std::string& date, const std::string& checksum,
                        const std::string& key) {
  std::string record;
  record.reserve(date.size() + checksum.size() + key.size() + 3);
  record.append(date).push_back('\t');
  record.append(checksum).push_back('\t');
  record.append(EscapeField(key)).push_back('\n');
  ba::orchestrator::AppendRecord(path_, record, ba::errors::io::kCatalogWriteFailed);
}

std::vector<CatalogRecord> CatalogLog::Records() const {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    const int saved_errno = errno;
    throw ba::Error(ba::ErrorDomain::IO, ba::errors::io::kCatalogUnreadable,
                    std::string(ba::errors::msg::kCatalogUnreadable) + ": " +
                        ba::PathToUtf8String(path_),
                    saved_errno);
  }
  std::vector<CatalogRecord> records;
  std::string line;
  while (std::getline(in, line)) {
    std::string_view view(line);
    const auto first = view.find('\t');
    if (first == std::string_view::npos) {
      continue;
    }
    const auto second = view.find('\t', first + 1);
    if (second == std::string_view::npos) {
      continue;
    }
    CatalogRecord record;
    record.date = std::string(view.substr(0, first));
    record.checksum = std::string(view.substr(first + 1, second - first - 1));
    record.key = UnescapeField(view.substr(second + 1));
    records.push_back(std::move(record));
  }
  return records;
}

} // namespace ba::storage
