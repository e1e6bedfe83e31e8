#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace marklex::scan {

enum class EntityForm : uint8_t {
    Named,    // &name;
    Decimal,  // &#123;
    Hex,      // &#x7B; or &#X7B;
};

struct EntityMatch {
    size_t length = 0;          // bytes from '&' through ';'
    EntityForm form = EntityForm::Named;
    bool known = false;         // named form only: name is in the table
    uint32_t code_point = 0;    // numeric forms, already sanitized
    std::string_view value;     // named form, known: UTF-8 replacement text
};

inline constexpr uint32_t kReplacementCharacter = 0xFFFD;

// Tries to match a character reference starting at the '&' at `pos`. All
// forms require the terminating ';'. Nothing is consumed on failure.
std::optional<EntityMatch> match_entity(std::string_view source, size_t pos, size_t end);

// UTF-8 text of a named entity, or nullopt when the name is not in the table.
std::optional<std::string_view> lookup_named_entity(std::string_view name);

// Maps 0, surrogate halves and values above U+10FFFF to U+FFFD.
uint32_t sanitize_code_point(uint64_t value);

std::string encode_utf8(uint32_t code_point);
void append_utf8(std::string& out, uint32_t code_point);

// Appends the decoded form of `match`. Unknown names append `raw` unchanged.
void append_decoded(std::string& out, const EntityMatch& match, std::string_view raw);

size_t named_entity_count();

} // namespace marklex::scan
