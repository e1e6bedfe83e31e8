#ifndef MARKLEX_CORE_CONFIG_H
#define MARKLEX_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace marklex::core::config {

inline constexpr std::uint32_t kDefaultTabWidth = 4;
inline constexpr std::uint32_t kAlternateTabWidth = 8;

// Provisional record layout: low 24 bits length, 7 bits shape, 1 open-ended bit.
inline constexpr std::uint32_t kMaxRecordLength = 0xFFFFFF;

// Width of the run-length field carried in token flags.
inline constexpr std::uint32_t kMaxRunLength = 63;

// RawText/RCDATA elements cannot nest, so the stack only needs a little slack.
inline constexpr std::size_t kMaxModeDepth = 4;

inline constexpr std::size_t kMaxOrderedListDigits = 9;
inline constexpr std::size_t kMaxMarkerIndent = 3;
inline constexpr std::size_t kMaxAtxLevel = 6;
inline constexpr std::size_t kMinFenceLength = 3;

// Longest HTML5 entity name is 31 characters.
inline constexpr std::size_t kMaxEntityNameLength = 32;

inline constexpr const char kScannerModule[] = "scanner";

}  // namespace marklex::core::config

#endif  // MARKLEX_CORE_CONFIG_H
