#pragma once
#include <marklex/core/config.h>

#include <cstddef>
#include <cstdint>

namespace marklex::scan {

// Coarse surface shape assigned by the provisional pass.
enum class RecordShape : std::uint8_t {
    None = 0,
    Text = 1,
    Whitespace = 2,
    Newline = 3,
    Punctuation = 4,
    Entity = 5,
    Escape = 6,
    HtmlTag = 7,
    HtmlComment = 8,
    HtmlCData = 9,
    HtmlDoctype = 10,
    HtmlProcessingInstruction = 11,
    Autolink = 12,
    RawText = 13,
    CodeLine = 14,
};

// Packed layout:
//   bits  0-23  length in bytes
//   bits 24-30  RecordShape
//   bit  31     open ended (construct ran into the end of the scanned span)
namespace record_layout {
inline constexpr std::uint32_t kLengthMask = core::config::kMaxRecordLength;
inline constexpr std::uint32_t kShapeShift = 24;
inline constexpr std::uint32_t kShapeMask = 0x7Fu << kShapeShift;
inline constexpr std::uint32_t kOpenEndedBit = 1u << 31;
} // namespace record_layout

struct ProvisionalRecord {
    std::uint32_t length = 0;
    RecordShape shape = RecordShape::None;
    bool open_ended = false;
};

inline constexpr std::uint32_t pack_record(RecordShape shape, std::uint32_t length,
                                           bool open_ended = false) {
    return (length & record_layout::kLengthMask) |
           ((static_cast<std::uint32_t>(shape) << record_layout::kShapeShift) &
            record_layout::kShapeMask) |
           (open_ended ? record_layout::kOpenEndedBit : 0u);
}

inline constexpr std::uint32_t record_length(std::uint32_t packed) {
    return packed & record_layout::kLengthMask;
}

inline constexpr RecordShape record_shape(std::uint32_t packed) {
    return static_cast<RecordShape>((packed & record_layout::kShapeMask) >>
                                    record_layout::kShapeShift);
}

inline constexpr bool record_open_ended(std::uint32_t packed) {
    return (packed & record_layout::kOpenEndedBit) != 0;
}

inline constexpr ProvisionalRecord unpack_record(std::uint32_t packed) {
    return ProvisionalRecord{record_length(packed), record_shape(packed),
                             record_open_ended(packed)};
}

// Adds `extra` bytes to a record in place. Callers check the cap first.
inline constexpr std::uint32_t grow_record(std::uint32_t packed, std::uint32_t extra) {
    return (packed & ~record_layout::kLengthMask) |
           ((record_length(packed) + extra) & record_layout::kLengthMask);
}

inline constexpr bool record_can_grow(std::uint32_t packed, std::uint32_t extra) {
    return record_length(packed) + static_cast<std::uint64_t>(extra) <=
           record_layout::kLengthMask;
}

const char* record_shape_name(RecordShape shape);

} // namespace marklex::scan
