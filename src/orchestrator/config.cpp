#include "ba/orchestrator/config.h"

#include "ba/common.h"
#include "ba/error.h"
#include "ba/errors.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>

namespace ba::orchestrator {
namespace {

constexpr uint32_t kMinRedundancy = 1;
constexpr uint32_t kMaxRedundancy = 100;

[[noreturn]] void ThrowConfigError(int code, std::string_view message, const std::string& key,
                                   const std::string& value) {
  throw ba::Error(ba::ErrorDomain::Config, code,
                  std::string(message) + " (" + key + "=" + value + ")");
}

std::string Lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// Unset and empty are treated alike, as a shell `${VAR:-default}` would.
std::optional<std::string> NonEmpty(const EnvironmentLookup& env, const std::string& key) {
  auto value = env(key);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  return value;
}

uint32_t ParseRedundancy(const std::string& value) {
  uint32_t parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size() || parsed < kMinRedundancy ||
      parsed > kMaxRedundancy) {
    ThrowConfigError(ba::errors::config::kInvalidRedundancy, ba::errors::msg::kInvalidRedundancy,
                     "REDUNDANCY", value);
  }
  return parsed;
}

size_t ParseSize(const std::string& value) {
  unsigned long long parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size() || parsed == 0) {
    ThrowConfigError(ba::errors::config::kInvalidSize, ba::errors::msg::kInvalidSize,
                     "ARMOR_LOG_MAX_SIZE", value);
  }
  return static_cast<size_t>(parsed);
}

bool ParseBoolean(const std::string& key, const std::string& value) {
  const auto lowered = Lowercase(value);
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  ThrowConfigError(ba::errors::config::kInvalidBoolean, ba::errors::msg::kInvalidBoolean, key,
                   value);
}

FailurePolicy ParsePolicy(const std::string& value) {
  const auto lowered = Lowercase(value);
  if (lowered == "accumulate") {
    return FailurePolicy::kAccumulate;
  }
  if (lowered == "fail-fast" || lowered == "failfast") {
    return FailurePolicy::kFailFast;
  }
  ThrowConfigError(ba::errors::config::kInvalidPolicy, ba::errors::msg::kInvalidPolicy,
                   "FAILURE_POLICY", value);
}

} // namespace

EnvironmentLookup ProcessEnvironment() {
  return [](const std::string& key) -> std::optional<std::string> {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

ArmorConfig LoadConfig(const EnvironmentLookup& env) {
  ArmorConfig config;

  if (auto value = NonEmpty(env, "REDUNDANCY")) {
    config.redundancy = ParseRedundancy(*value);
  }

  if (auto value = NonEmpty(env, "BOOK_DIR")) {
    config.book_dir = *value;
  } else {
    auto home = NonEmpty(env, "HOME");
    if (!home) {
      throw ba::Error(ba::ErrorDomain::Config, ba::errors::config::kMissingHome,
                      std::string(ba::errors::msg::kMissingHome));
    }
    config.book_dir = std::filesystem::path(*home) / "Desktop" / "Ebooks";
  }

  auto path_or = [&](const char* key, const char* file_name) {
    if (auto value = NonEmpty(env, key)) {
      return std::filesystem::path(*value);
    }
    return config.book_dir / file_name;
  };
  config.index_path = path_or("INDEX", "index.md5sum");
  config.catalog_path = path_or("CSV", "index.csv");
  config.repair_dir = path_or("REPAIR", "repair");

  if (auto value = NonEmpty(env, "FAILURE_POLICY")) {
    config.failure_policy = ParsePolicy(*value);
  }
  if (auto value = NonEmpty(env, "VERIFY_PARITY")) {
    config.verify_parity = ParseBoolean("VERIFY_PARITY", *value);
  }
  if (auto value = NonEmpty(env, "PAR2")) {
    config.par2_binary = *value;
  }

  // Set-but-empty ARMOR_LOG turns the audit log off.
  if (auto value = env("ARMOR_LOG")) {
    config.log_path = *value;
  } else {
    config.log_path = config.book_dir / "armor.log";
  }
  if (auto value = NonEmpty(env, "ARMOR_LOG_MAX_SIZE")) {
    config.log_max_size = ParseSize(*value);
  }
  return config;
}

const char* FailurePolicyToString(FailurePolicy policy) {
  switch (policy) {
  case FailurePolicy::kAccumulate:
    return "accumulate";
  case FailurePolicy::kFailFast:
    return "fail-fast";
  }
  return "accumulate";
}

std::string DescribeConfig(const ArmorConfig& config) {
  std::ostringstream oss;
  oss << "REDUNDANCY=" << config.redundancy << '\n';
  oss << "BOOK_DIR=" << ba::PathToUtf8String(config.book_dir) << '\n';
  oss << "INDEX=" << ba::PathToUtf8String(config.index_path) << '\n';
  oss << "CSV=" << ba::PathToUtf8String(config.catalog_path) << '\n';
  oss << "REPAIR=" << ba::PathToUtf8String(config.repair_dir) << '\n';
  oss << "FAILURE_POLICY=" << FailurePolicyToString(config.failure_policy) << '\n';
  oss << "VERIFY_PARITY=" << (config.verify_parity ? "yes" : "no") << '\n';
  oss << "PAR2=" << config.par2_binary << '\n';
  oss << "ARMOR_LOG=" << ba::PathToUtf8String(config.log_path) << '\n';
  oss << "ARMOR_LOG_MAX_SIZE=" << config.log_max_size << '\n';
  return oss.str();
}

} // namespace ba::orchestrator
