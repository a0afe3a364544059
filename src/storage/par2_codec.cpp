#include "ba/storage/parity_codec.h"

#include "ba/common.h"
#include "ba/error.h"
#include "ba/errors.h"
#include "ba/platform/subprocess.h"

#include <algorithm>
#include <system_error>

namespace ba::storage {
namespace {

constexpr const char* kIndexSuffix = ".par2";

// par2 names its volumes "<file>.volNN+MM.par2".
bool IsArtifactOf(const std::string& candidate, const std::string& file_name) {
  const std::string index = file_name + kIndexSuffix;
  if (candidate == index) {
    return true;
  }
  const std::string volume_prefix = file_name + ".vol";
  return candidate.size() > volume_prefix.size() + 5 &&
         candidate.compare(0, volume_prefix.size(), volume_prefix) == 0 &&
         candidate.compare(candidate.size() - 5, 5, kIndexSuffix) == 0;
}

[[noreturn]] void ThrowToolMissing(const std::string& binary) {
  throw ba::Error(ba::ErrorDomain::Dependency, ba::errors::dependency::kToolMissing,
                  std::string(ba::errors::msg::kToolMissing) + ": " + binary);
}

} // namespace

Par2Codec::Par2Codec(std::string binary) : binary_(std::move(binary)) {}

std::string Par2Codec::IndexFileName(const std::string& file_name) const {
  return file_name + kIndexSuffix;
}

std::vector<std::filesystem::path> Par2Codec::Create(const std::filesystem::path& working_dir,
                                                     const std::string& file_name,
                                                     uint32_t redundancy_percent) {
  const auto result = ba::platform::RunProcess(
      {binary_, "create", "-qq", "-u", "-r" + std::to_string(redundancy_percent), "--", file_name},
      working_dir);
  if (result.ProgramMissing()) {
    ThrowToolMissing(binary_);
  }
  if (!result.Succeeded()) {
    throw ba::Error(ba::ErrorDomain::Dependency, ba::errors::dependency::kToolFailed,
                    std::string(ba::errors::msg::kParityGenerationFailed) + ": " + file_name +
                        " (exit status " + std::to_string(result.exit_status) + ")",
                    result.signaled ? std::optional<int>(result.term_signal)
                                    : std::optional<int>(result.exit_status));
  }

  std::vector<std::filesystem::path> artifacts;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(working_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (IsArtifactOf(name, file_name)) {
      artifacts.push_back(it->path());
    }
  }
  if (ec) {
    throw ba::Error(ba::ErrorDomain::IO, ba::errors::io::kBookDirUnreadable,
                    std::string(ba::errors::msg::kBookDirUnreadable) + ": " +
                        ba::PathToUtf8String(working_dir),
                    ec.value());
  }
  std::sort(artifacts.begin(), artifacts.end());
  return artifacts;
}

bool Par2Codec::Verify(const std::filesystem::path& working_dir, const std::string& file_name) {
  const auto result =
      ba::platform::RunProcess({binary_, "verify", "-qq", "--", IndexFileName(file_name)}, working_dir);
  if (result.ProgramMissing()) {
    ThrowToolMissing(binary_);
  }
  return result.Succeeded();
}

bool Par2Codec::Repair(const std::filesystem::path& working_dir, const std::string& file_name) {
  const auto result =
      ba::platform::RunProcess({binary_, "repair", "-qq", "--", IndexFileName(file_name)}, working_dir);
  if (result.ProgramMissing()) {
    ThrowToolMissing(binary_);
  }
  return result.Succeeded();
}

bool Par2Codec::Available() const {
  try {
    const auto result = ba::platform::RunProcess({binary_, "-V"}, std::filesystem::temp_directory_path());
    return !result.ProgramMissing() && !result.signaled;
  } catch (const ba::Error&) {
    return false;
  }
}

} // namespace ba::storage
