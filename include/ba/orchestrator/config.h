#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace ba::orchestrator {

  enum class FailurePolicy { kAccumulate, kFailFast };

  inline constexpr uint32_t kDefaultRedundancy = 10;
  inline constexpr size_t kDefaultLogMaxSize = 10 * 1024 * 1024;

  struct ArmorConfig {
    uint32_t redundancy{kDefaultRedundancy};
    std::filesystem::path book_dir;
    std::filesystem::path index_path;
    std::filesystem::path catalog_path;
    std::filesystem::path repair_dir;
    FailurePolicy failure_policy{FailurePolicy::kAccumulate};
    bool verify_parity{false};
    std::string par2_binary{"par2"};
    std::filesystem::path log_path;  // empty disables the JSON-lines log
    size_t log_max_size{kDefaultLogMaxSize};
  };

  // Returns the variable's value, or nullopt when it is unset.
  using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

  EnvironmentLookup ProcessEnvironment();

  // Reads every setting once. Throws ba::Error (Config) on an invalid value.
  ArmorConfig LoadConfig(const EnvironmentLookup& env);

  const char* FailurePolicyToString(FailurePolicy policy);

  // Multi-line `KEY=value` rendering used by `--display`.
  std::string DescribeConfig(const ArmorConfig& config);

} // namespace ba::orchestrator
