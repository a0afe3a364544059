#pragma once
#include <array>
#include <bit>
#include <cstdint>
#include <cstring>
#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace ba {
namespace detail {
// Portable byte swapping helpers.
template <class T>
[[nodiscard]] constexpr T ManualByteSwap(T value) noexcept {
  static_assert(std::is_trivially_copyable_v<T>, "ManualByteSwap requires trivially copyable types");
  auto source = std::bit_cast<std::array<std::uint8_t, sizeof(T)>>(value);
  std::array<std::uint8_t, sizeof(T)> reversed{};
  for (std::size_t i = 0; i < source.size(); ++i) {
    reversed[i] = source[source.size() - 1U - i];
  }
  return std::bit_cast<T>(reversed);
}

[[nodiscard]] constexpr std::uint16_t ByteSwap16(std::uint16_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap16(value);
#else
  return ManualByteSwap(value);
#endif
}

[[nodiscard]] constexpr std::uint32_t ByteSwap32(std::uint32_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap32(value);
#else
  return ManualByteSwap(value);
#endif
}

[[nodiscard]] constexpr std::uint64_t ByteSwap64(std::uint64_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap64(value);
#else
  return ManualByteSwap(value);
#endif
}
}  // namespace detail

inline constexpr bool kIsLittleEndian = std::endian::native == std::endian::little;

inline constexpr std::uint16_t FromLittleEndian16(std::uint16_t value) noexcept {
  return kIsLittleEndian ? value : detail::ByteSwap16(value);
}

inline constexpr std::uint32_t FromLittleEndian32(std::uint32_t value) noexcept {
  return kIsLittleEndian ? value : detail::ByteSwap32(value);
}

inline constexpr std::uint64_t FromLittleEndian64(std::uint64_t value) noexcept {
  return kIsLittleEndian ? value : detail::ByteSwap64(value);
}

// Little-endian field readers for on-disk structures that are not naturally aligned.
inline std::uint16_t LoadLittleEndian16(std::span<const std::uint8_t> bytes, std::size_t offset) noexcept {
  std::uint16_t raw = 0;
  std::memcpy(&raw, bytes.data() + offset, sizeof(raw));
  return FromLittleEndian16(raw);
}

inline std::uint32_t LoadLittleEndian32(std::span<const std::uint8_t> bytes, std::size_t offset) noexcept {
  std::uint32_t raw = 0;
  std::memcpy(&raw, bytes.data() + offset, sizeof(raw));
  return FromLittleEndian32(raw);
}

inline std::uint64_t LoadLittleEndian64(std::span<const std::uint8_t> bytes, std::size_t offset) noexcept {
  std::uint64_t raw = 0;
  std::memcpy(&raw, bytes.data() + offset, sizeof(raw));
  return FromLittleEndian64(raw);
}

inline std::string HexEncode(std::span<const std::uint8_t> bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string encoded;
  encoded.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    encoded.push_back(kHex[(byte >> 4) & 0x0F]);
    encoded.push_back(kHex[byte & 0x0F]);
  }
  return encoded;
}

inline std::string PathToUtf8String(const std::filesystem::path& path) {
  return path.string();
}
} // namespace ba
