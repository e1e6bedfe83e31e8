#pragma once
#include <marklex/core/config.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace marklex::scan {

enum class LexicalMode : uint8_t {
    Normal,
    RawText,  // script, style: content is verbatim
    Rcdata,   // textarea, title: entities decode, markup does not
};

enum class ModeTag : uint8_t {
    None,
    Script,
    Style,
    Textarea,
    Title,
};

struct ModeFrame {
    LexicalMode mode = LexicalMode::Normal;
    ModeTag tag = ModeTag::None;
    size_t entered_at = 0;  // offset just past the opening tag

    bool operator==(const ModeFrame& other) const {
        return mode == other.mode && tag == other.tag && entered_at == other.entered_at;
    }
};

// Mode a start tag switches to, if any. Case-insensitive.
std::optional<ModeFrame> mode_for_start_tag(std::string_view tag_name, size_t entered_at);

const char* mode_tag_name(ModeTag tag);
const char* lexical_mode_name(LexicalMode mode);

// True when `source` at `pos` holds the end tag that closes `tag`:
// "</name" (any case) followed by '>', whitespace, '/' or the end of input.
bool matches_end_tag(std::string_view source, size_t pos, size_t end, ModeTag tag);

// Fixed-capacity stack so that scanner snapshots stay allocation free.
class ModeStack {
public:
    // Returns false when the stack is full; the mode is then left unchanged.
    bool push(const ModeFrame& frame);
    void pop();
    void clear() { depth_ = 0; }

    LexicalMode mode() const;
    const ModeFrame* top() const;
    size_t depth() const { return depth_; }
    bool empty() const { return depth_ == 0; }

    // Drops every frame entered after `position`.
    void unwind_to(size_t position);

    bool operator==(const ModeStack& other) const;
    bool operator!=(const ModeStack& other) const { return !(*this == other); }

private:
    std::array<ModeFrame, core::config::kMaxModeDepth> frames_{};
    size_t depth_ = 0;
};

} // namespace marklex::scan
