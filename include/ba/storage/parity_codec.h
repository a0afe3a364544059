#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ba::storage {

  // Erasure-coding primitive behind the repair store. Every call names the
  // directory it operates in; implementations must not rely on the process
  // working directory.
  class ParityCodec {
  public:
    virtual ~ParityCodec() = default;

    // Generates recovery data for `file_name` inside `working_dir` and returns
    // the paths of every artifact produced. Throws ba::Error on failure.
    virtual std::vector<std::filesystem::path> Create(const std::filesystem::path& working_dir,
                                                      const std::string& file_name,
                                                      uint32_t redundancy_percent) = 0;

    // True when the recovery set in `working_dir` can reconstruct `file_name`.
    virtual bool Verify(const std::filesystem::path& working_dir, const std::string& file_name) = 0;

    // Rewrites `file_name` from its recovery set. True on success.
    virtual bool Repair(const std::filesystem::path& working_dir, const std::string& file_name) = 0;

    // Name of the index artifact for `file_name`.
    [[nodiscard]] virtual std::string IndexFileName(const std::string& file_name) const = 0;
  };

  // Drives par2cmdline as a child process.
  class Par2Codec final : public ParityCodec {
  public:
    explicit Par2Codec(std::string binary = "par2");

    std::vector<std::filesystem::path> Create(const std::filesystem::path& working_dir,
                                              const std::string& file_name,
                                              uint32_t redundancy_percent) override;
    bool Verify(const std::filesystem::path& working_dir, const std::string& file_name) override;
    bool Repair(const std::filesystem::path& working_dir, const std::string& file_name) override;
    [[nodiscard]] std::string IndexFileName(const std::string& file_name) const override;

    // True when the binary can be started (runs `par2 -V`).
    [[nodiscard]] bool Available() const;

  private:
    std::string binary_;
  };

} // namespace ba::storage
