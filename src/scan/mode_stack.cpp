#include <marklex/scan/mode_stack.h>
#include <marklex/scan/char_codes.h>

namespace marklex::scan {

static bool equals_ignore_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (to_ascii_lower(a[i]) != to_ascii_lower(b[i])) return false;
    }
    return true;
}

std::optional<ModeFrame> mode_for_start_tag(std::string_view tag_name, size_t entered_at) {
    ModeFrame frame;
    frame.entered_at = entered_at;
    if (equals_ignore_case(tag_name, "script")) {
        frame.mode = LexicalMode::RawText;
        frame.tag = ModeTag::Script;
    } else if (equals_ignore_case(tag_name, "style")) {
        frame.mode = LexicalMode::RawText;
        frame.tag = ModeTag::Style;
    } else if (equals_ignore_case(tag_name, "textarea")) {
        frame.mode = LexicalMode::Rcdata;
        frame.tag = ModeTag::Textarea;
    } else if (equals_ignore_case(tag_name, "title")) {
        frame.mode = LexicalMode::Rcdata;
        frame.tag = ModeTag::Title;
    } else {
        return std::nullopt;
    }
    return frame;
}

const char* mode_tag_name(ModeTag tag) {
    switch (tag) {
        case ModeTag::Script:   return "script";
        case ModeTag::Style:    return "style";
        case ModeTag::Textarea: return "textarea";
        case ModeTag::Title:    return "title";
        case ModeTag::None:     break;
    }
    return "";
}

const char* lexical_mode_name(LexicalMode mode) {
    switch (mode) {
        case LexicalMode::Normal:  return "Normal";
        case LexicalMode::RawText: return "RawText";
        case LexicalMode::Rcdata:  return "RCDATA";
    }
    return "Normal";
}

bool matches_end_tag(std::string_view source, size_t pos, size_t end, ModeTag tag) {
    std::string_view name = mode_tag_name(tag);
    if (name.empty()) return false;
    if (pos + 2 + name.size() > end) return false;
    if (source[pos] != '<' || source[pos + 1] != '/') return false;
    if (!equals_ignore_case(source.substr(pos + 2, name.size()), name)) return false;

    size_t after = pos + 2 + name.size();
    if (after >= end) return true;
    char c = source[after];
    return c == '>' || c == '/' || is_whitespace(c);
}

bool ModeStack::push(const ModeFrame& frame) {
    if (depth_ >= frames_.size()) return false;
    frames_[depth_++] = frame;
    return true;
}

void ModeStack::pop() {
    if (depth_ > 0) --depth_;
}

LexicalMode ModeStack::mode() const {
    return depth_ == 0 ? LexicalMode::Normal : frames_[depth_ - 1].mode;
}

const ModeFrame* ModeStack::top() const {
    return depth_ == 0 ? nullptr : &frames_[depth_ - 1];
}

void ModeStack::unwind_to(size_t position) {
    while (depth_ > 0 && frames_[depth_ - 1].entered_at > position) {
        --depth_;
    }
}

bool ModeStack::operator==(const ModeStack& other) const {
    if (depth_ != other.depth_) return false;
    for (size_t i = 0; i < depth_; ++i) {
        if (!(frames_[i] == other.frames_[i])) return false;
    }
    return true;
}

} // namespace marklex::scan
