#pragma once

#include <cstddef>
#include <string>

namespace kunai {

// 1-based line and column of a byte in a text buffer
struct TextPosition {
    int line = 1;
    int column = 1;
};

// Position of the character at zero-based byte `offset`; offsets past the end
// map to the position just after the last character.
TextPosition text_position(const std::string& text, std::size_t offset);

// Position reported by nlohmann::json::parse_error::byte, which counts the
// characters read so far (the offending character is the last one read).
TextPosition parse_error_position(const std::string& text, std::size_t error_byte);

// Position of the value addressed by an RFC 6901 JSON pointer, e.g.
// "/foo/updateScheme/type". For members this is the start of the member's key.
// Falls back to the start of the text when the pointer cannot be located.
TextPosition locate_json_pointer(const std::string& text, const std::string& pointer);

// Well-formed UTF-8 (no overlong forms, surrogates or code points past
// U+10FFFF), i.e. text that can be written into a JSON document as is.
bool is_valid_utf8(const std::string& text);

} // namespace kunai
