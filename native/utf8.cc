#include "utf8.hh"

#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace {

// Decodes the code point starting at text[index] and advances index. Returns
// false on any malformed, overlong, surrogate or out of range sequence.
bool next_code_point(absl::string_view text, size_t& index, uint32_t& result) {
    const uint8_t lead = static_cast<uint8_t>(text[index]);

    size_t extra;
    uint32_t minimum;
    if (lead < 0x80) {
        result = lead;
        index += 1;
        return true;
    } else if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        minimum = 0x80;
        result = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        minimum = 0x800;
        result = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        minimum = 0x10000;
        result = lead & 0x07;
    } else {
        return false;
    }

    if (index + extra >= text.size()) {
        return false;
    }

    for (size_t i = 1; i <= extra; i++) {
        uint8_t next = static_cast<uint8_t>(text[index + i]);
        if ((next & 0xC0) != 0x80) {
            return false;
        }
        result = (result << 6) | (next & 0x3F);
    }

    if (result < minimum || result > 0x10FFFF ||
        (result >= 0xD800 && result <= 0xDFFF)) {
        return false;
    }

    index += extra + 1;
    return true;
}

}  // namespace

bool is_valid_utf8(absl::string_view text) {
    size_t index = 0;
    uint32_t cp;
    while (index < text.size()) {
        if (!next_code_point(text, index, cp)) {
            return false;
        }
    }
    return true;
}

size_t code_point_length(absl::string_view text) {
    size_t count = 0;
    for (char c : text) {
        if ((static_cast<uint8_t>(c) & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

std::string to_lower(absl::string_view text) {
    icu::UnicodeString unicode = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    unicode.toLower(icu::Locale::getRoot());

    std::string result;
    unicode.toUTF8String(result);
    return result;
}
