#include <marklex/scan/entity_resolver.h>
#include <marklex/core/config.h>
#include <marklex/scan/char_codes.h>

#include <unordered_map>

namespace marklex::scan {

namespace {

const std::unordered_map<std::string_view, std::string_view>& entity_table() {
    static const std::unordered_map<std::string_view, std::string_view> table = {
        // Markup-significant
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},

        // Latin-1 Supplement
        {"nbsp", "\xC2\xA0"}, {"iexcl", "\xC2\xA1"}, {"cent", "\xC2\xA2"},
        {"pound", "\xC2\xA3"}, {"curren", "\xC2\xA4"}, {"yen", "\xC2\xA5"},
        {"brvbar", "\xC2\xA6"}, {"sect", "\xC2\xA7"}, {"uml", "\xC2\xA8"},
        {"copy", "\xC2\xA9"}, {"ordf", "\xC2\xAA"}, {"laquo", "\xC2\xAB"},
        {"not", "\xC2\xAC"}, {"shy", "\xC2\xAD"}, {"reg", "\xC2\xAE"}, {"macr", "\xC2\xAF"},
        {"deg", "\xC2\xB0"}, {"plusmn", "\xC2\xB1"}, {"sup2", "\xC2\xB2"},
        {"sup3", "\xC2\xB3"}, {"acute", "\xC2\xB4"}, {"micro", "\xC2\xB5"},
        {"para", "\xC2\xB6"}, {"middot", "\xC2\xB7"}, {"cedil", "\xC2\xB8"},
        {"sup1", "\xC2\xB9"}, {"ordm", "\xC2\xBA"}, {"raquo", "\xC2\xBB"},
        {"frac14", "\xC2\xBC"}, {"frac12", "\xC2\xBD"}, {"frac34", "\xC2\xBE"},
        {"iquest", "\xC2\xBF"}, {"Agrave", "\xC3\x80"}, {"Aacute", "\xC3\x81"},
        {"Acirc", "\xC3\x82"}, {"Atilde", "\xC3\x83"}, {"Auml", "\xC3\x84"},
        {"Aring", "\xC3\x85"}, {"AElig", "\xC3\x86"}, {"Ccedil", "\xC3\x87"},
        {"Egrave", "\xC3\x88"}, {"Eacute", "\xC3\x89"}, {"Ecirc", "\xC3\x8A"},
        {"Euml", "\xC3\x8B"}, {"Igrave", "\xC3\x8C"}, {"Iacute", "\xC3\x8D"},
        {"Icirc", "\xC3\x8E"}, {"Iuml", "\xC3\x8F"}, {"ETH", "\xC3\x90"},
        {"Ntilde", "\xC3\x91"}, {"Ograve", "\xC3\x92"}, {"Oacute", "\xC3\x93"},
        {"Ocirc", "\xC3\x94"}, {"Otilde", "\xC3\x95"}, {"Ouml", "\xC3\x96"},
        {"times", "\xC3\x97"}, {"Oslash", "\xC3\x98"}, {"Ugrave", "\xC3\x99"},
        {"Uacute", "\xC3\x9A"}, {"Ucirc", "\xC3\x9B"}, {"Uuml", "\xC3\x9C"},
        {"Yacute", "\xC3\x9D"}, {"THORN", "\xC3\x9E"}, {"szlig", "\xC3\x9F"},
        {"agrave", "\xC3\xA0"}, {"aacute", "\xC3\xA1"}, {"acirc", "\xC3\xA2"},
        {"atilde", "\xC3\xA3"}, {"auml", "\xC3\xA4"}, {"aring", "\xC3\xA5"},
        {"aelig", "\xC3\xA6"}, {"ccedil", "\xC3\xA7"}, {"egrave", "\xC3\xA8"},
        {"eacute", "\xC3\xA9"}, {"ecirc", "\xC3\xAA"}, {"euml", "\xC3\xAB"},
        {"igrave", "\xC3\xAC"}, {"iacute", "\xC3\xAD"}, {"icirc", "\xC3\xAE"},
        {"iuml", "\xC3\xAF"}, {"eth", "\xC3\xB0"}, {"ntilde", "\xC3\xB1"},
        {"ograve", "\xC3\xB2"}, {"oacute", "\xC3\xB3"}, {"ocirc", "\xC3\xB4"},
        {"otilde", "\xC3\xB5"}, {"ouml", "\xC3\xB6"}, {"divide", "\xC3\xB7"},
        {"oslash", "\xC3\xB8"}, {"ugrave", "\xC3\xB9"}, {"uacute", "\xC3\xBA"},
        {"ucirc", "\xC3\xBB"}, {"uuml", "\xC3\xBC"}, {"yacute", "\xC3\xBD"},
        {"thorn", "\xC3\xBE"}, {"yuml", "\xC3\xBF"},

        // Latin Extended, spacing modifiers
        {"OElig", "\xC5\x92"}, {"oelig", "\xC5\x93"}, {"Scaron", "\xC5\xA0"},
        {"scaron", "\xC5\xA1"}, {"Yuml", "\xC5\xB8"}, {"fnof", "\xC6\x92"},
        {"circ", "\xCB\x86"}, {"tilde", "\xCB\x9C"},

        // Greek
        {"Alpha", "\xCE\x91"}, {"Beta", "\xCE\x92"}, {"Gamma", "\xCE\x93"},
        {"Delta", "\xCE\x94"}, {"Epsilon", "\xCE\x95"}, {"Zeta", "\xCE\x96"},
        {"Eta", "\xCE\x97"}, {"Theta", "\xCE\x98"}, {"Iota", "\xCE\x99"},
        {"Kappa", "\xCE\x9A"}, {"Lambda", "\xCE\x9B"}, {"Mu", "\xCE\x9C"},
        {"Nu", "\xCE\x9D"}, {"Xi", "\xCE\x9E"}, {"Omicron", "\xCE\x9F"}, {"Pi", "\xCE\xA0"},
        {"Rho", "\xCE\xA1"}, {"Sigma", "\xCE\xA3"}, {"Tau", "\xCE\xA4"},
        {"Upsilon", "\xCE\xA5"}, {"Phi", "\xCE\xA6"}, {"Chi", "\xCE\xA7"},
        {"Psi", "\xCE\xA8"}, {"Omega", "\xCE\xA9"}, {"alpha", "\xCE\xB1"},
        {"beta", "\xCE\xB2"}, {"gamma", "\xCE\xB3"}, {"delta", "\xCE\xB4"},
        {"epsilon", "\xCE\xB5"}, {"zeta", "\xCE\xB6"}, {"eta", "\xCE\xB7"},
        {"theta", "\xCE\xB8"}, {"iota", "\xCE\xB9"}, {"kappa", "\xCE\xBA"},
        {"lambda", "\xCE\xBB"}, {"mu", "\xCE\xBC"}, {"nu", "\xCE\xBD"}, {"xi", "\xCE\xBE"},
        {"omicron", "\xCE\xBF"}, {"pi", "\xCF\x80"}, {"rho", "\xCF\x81"},
        {"sigmaf", "\xCF\x82"}, {"sigma", "\xCF\x83"}, {"tau", "\xCF\x84"},
        {"upsilon", "\xCF\x85"}, {"phi", "\xCF\x86"}, {"chi", "\xCF\x87"},
        {"psi", "\xCF\x88"}, {"omega", "\xCF\x89"}, {"thetasym", "\xCF\x91"},
        {"upsih", "\xCF\x92"}, {"piv", "\xCF\x96"},

        // General punctuation
        {"ensp", "\xE2\x80\x82"}, {"emsp", "\xE2\x80\x83"}, {"thinsp", "\xE2\x80\x89"},
        {"zwnj", "\xE2\x80\x8C"}, {"zwj", "\xE2\x80\x8D"}, {"lrm", "\xE2\x80\x8E"},
        {"rlm", "\xE2\x80\x8F"}, {"ndash", "\xE2\x80\x93"}, {"mdash", "\xE2\x80\x94"},
        {"lsquo", "\xE2\x80\x98"}, {"rsquo", "\xE2\x80\x99"}, {"sbquo", "\xE2\x80\x9A"},
        {"ldquo", "\xE2\x80\x9C"}, {"rdquo", "\xE2\x80\x9D"}, {"bdquo", "\xE2\x80\x9E"},
        {"dagger", "\xE2\x80\xA0"}, {"Dagger", "\xE2\x80\xA1"}, {"bull", "\xE2\x80\xA2"},
        {"hellip", "\xE2\x80\xA6"}, {"mldr", "\xE2\x80\xA6"}, {"permil", "\xE2\x80\xB0"},
        {"prime", "\xE2\x80\xB2"}, {"Prime", "\xE2\x80\xB3"}, {"lsaquo", "\xE2\x80\xB9"},
        {"rsaquo", "\xE2\x80\xBA"}, {"oline", "\xE2\x80\xBE"}, {"frasl", "\xE2\x81\x84"},
        {"euro", "\xE2\x82\xAC"},

        // Letterlike, arrows
        {"image", "\xE2\x84\x91"}, {"weierp", "\xE2\x84\x98"}, {"real", "\xE2\x84\x9C"},
        {"trade", "\xE2\x84\xA2"}, {"alefsym", "\xE2\x84\xB5"}, {"larr", "\xE2\x86\x90"},
        {"uarr", "\xE2\x86\x91"}, {"rarr", "\xE2\x86\x92"}, {"darr", "\xE2\x86\x93"},
        {"harr", "\xE2\x86\x94"}, {"crarr", "\xE2\x86\xB5"}, {"lArr", "\xE2\x87\x90"},
        {"uArr", "\xE2\x87\x91"}, {"rArr", "\xE2\x87\x92"}, {"dArr", "\xE2\x87\x93"},
        {"hArr", "\xE2\x87\x94"},

        // Mathematical operators
        {"forall", "\xE2\x88\x80"}, {"part", "\xE2\x88\x82"}, {"exist", "\xE2\x88\x83"},
        {"empty", "\xE2\x88\x85"}, {"nabla", "\xE2\x88\x87"}, {"isin", "\xE2\x88\x88"},
        {"notin", "\xE2\x88\x89"}, {"ni", "\xE2\x88\x8B"}, {"prod", "\xE2\x88\x8F"},
        {"sum", "\xE2\x88\x91"}, {"minus", "\xE2\x88\x92"}, {"lowast", "\xE2\x88\x97"},
        {"radic", "\xE2\x88\x9A"}, {"prop", "\xE2\x88\x9D"}, {"infin", "\xE2\x88\x9E"},
        {"ang", "\xE2\x88\xA0"}, {"and", "\xE2\x88\xA7"}, {"or", "\xE2\x88\xA8"},
        {"cap", "\xE2\x88\xA9"}, {"cup", "\xE2\x88\xAA"}, {"int", "\xE2\x88\xAB"},
        {"there4", "\xE2\x88\xB4"}, {"sim", "\xE2\x88\xBC"}, {"cong", "\xE2\x89\x85"},
        {"asymp", "\xE2\x89\x88"}, {"ne", "\xE2\x89\xA0"}, {"equiv", "\xE2\x89\xA1"},
        {"le", "\xE2\x89\xA4"}, {"ge", "\xE2\x89\xA5"}, {"sub", "\xE2\x8A\x82"},
        {"sup", "\xE2\x8A\x83"}, {"nsub", "\xE2\x8A\x84"}, {"sube", "\xE2\x8A\x86"},
        {"supe", "\xE2\x8A\x87"}, {"oplus", "\xE2\x8A\x95"}, {"otimes", "\xE2\x8A\x97"},
        {"perp", "\xE2\x8A\xA5"}, {"sdot", "\xE2\x8B\x85"}, {"lceil", "\xE2\x8C\x88"},
        {"rceil", "\xE2\x8C\x89"}, {"lfloor", "\xE2\x8C\x8A"}, {"rfloor", "\xE2\x8C\x8B"},
        {"lang", "\xE2\x9F\xA8"}, {"rang", "\xE2\x9F\xA9"},

        // Shapes
        {"loz", "\xE2\x97\x8A"}, {"spades", "\xE2\x99\xA0"}, {"clubs", "\xE2\x99\xA3"},
        {"hearts", "\xE2\x99\xA5"}, {"diams", "\xE2\x99\xA6"}, {"check", "\xE2\x9C\x93"},

        // ASCII punctuation
        {"Tab", "\t"}, {"NewLine", "\n"}, {"excl", "!"}, {"num", "#"}, {"dollar", "$"},
        {"percnt", "%"}, {"lpar", "("}, {"rpar", ")"}, {"ast", "*"}, {"plus", "+"},
        {"comma", ","}, {"period", "."}, {"sol", "/"}, {"colon", ":"}, {"semi", ";"},
        {"equals", "="}, {"quest", "?"}, {"commat", "@"}, {"lsqb", "["}, {"lbrack", "["},
        {"bsol", "\\"}, {"rsqb", "]"}, {"rbrack", "]"}, {"Hat", "^"}, {"lowbar", "_"},
        {"grave", "`"}, {"lcub", "{"}, {"lbrace", "{"}, {"verbar", "|"}, {"vert", "|"},
        {"rcub", "}"}, {"rbrace", "}"},
    };
    return table;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Anything past this is out of range anyway; clamping keeps the sum from wrapping.
constexpr uint64_t kSaturatedCodePoint = 0x110000;

std::optional<EntityMatch> match_numeric(std::string_view source, size_t pos, size_t end) {
    // pos is at '#'
    size_t i = pos + 1;
    EntityForm form = EntityForm::Decimal;
    if (i < end && (source[i] == 'x' || source[i] == 'X')) {
        form = EntityForm::Hex;
        ++i;
    }

    size_t digits_start = i;
    uint64_t value = 0;
    while (i < end) {
        char c = source[i];
        int digit = -1;
        if (form == EntityForm::Hex) {
            digit = hex_value(c);
        } else if (is_ascii_digit(c)) {
            digit = c - '0';
        }
        if (digit < 0) break;
        value = value * (form == EntityForm::Hex ? 16 : 10) + static_cast<uint64_t>(digit);
        if (value > kSaturatedCodePoint) value = kSaturatedCodePoint;
        ++i;
    }

    if (i == digits_start || i >= end || source[i] != ';') return std::nullopt;

    EntityMatch match;
    match.form = form;
    match.length = i + 1 - (pos - 1);
    match.known = true;
    match.code_point = sanitize_code_point(value);
    return match;
}

} // namespace

std::optional<EntityMatch> match_entity(std::string_view source, size_t pos, size_t end) {
    if (end > source.size()) end = source.size();
    if (pos + 1 >= end || source[pos] != '&') return std::nullopt;

    if (source[pos + 1] == '#') {
        return match_numeric(source, pos + 1, end);
    }

    if (!is_ascii_letter(source[pos + 1])) return std::nullopt;

    size_t i = pos + 1;
    while (i < end && is_ascii_alnum(source[i]) &&
           i - (pos + 1) < core::config::kMaxEntityNameLength) {
        ++i;
    }
    if (i >= end || source[i] != ';') return std::nullopt;

    std::string_view name = source.substr(pos + 1, i - (pos + 1));
    EntityMatch match;
    match.form = EntityForm::Named;
    match.length = i + 1 - pos;
    if (auto value = lookup_named_entity(name)) {
        match.known = true;
        match.value = *value;
    }
    return match;
}

std::optional<std::string_view> lookup_named_entity(std::string_view name) {
    const auto& table = entity_table();
    auto it = table.find(name);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

uint32_t sanitize_code_point(uint64_t value) {
    if (value == 0 || value > 0x10FFFF) return kReplacementCharacter;
    if (value >= 0xD800 && value <= 0xDFFF) return kReplacementCharacter;
    return static_cast<uint32_t>(value);
}

void append_utf8(std::string& out, uint32_t code_point) {
    if (code_point > 0x10FFFF) code_point = kReplacementCharacter;
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

std::string encode_utf8(uint32_t code_point) {
    std::string out;
    append_utf8(out, code_point);
    return out;
}

void append_decoded(std::string& out, const EntityMatch& match, std::string_view raw) {
    if (match.form != EntityForm::Named) {
        append_utf8(out, match.code_point);
    } else if (match.known) {
        out += match.value;
    } else {
        out += raw;
    }
}

size_t named_entity_count() {
    return entity_table().size();
}

} // namespace marklex::scan
