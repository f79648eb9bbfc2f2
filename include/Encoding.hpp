#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sqlquote {

// What the quoting functions accept inside a quoted fragment.
// Valid UTF-8 is passed through unchanged; nothing is ever substituted.
struct EncodingPolicy {
    bool strictUtf8 = true;       // reject malformed UTF-8
    bool allowLineBreaks = true;  // TAB, LF and CR may appear verbatim in string literals
};

namespace encoding {

// Length of the UTF-8 sequence starting at pos, 0 if it is malformed.
// Rejects overlong forms, surrogates and code points above U+10FFFF.
size_t sequenceLength(std::string_view text, size_t pos);

bool isValidUtf8(std::string_view text);

// NUL, C0 controls and DEL
bool isControl(unsigned char c);

// U+0080..U+009F, encoded as C2 80..C2 9F
bool isC1Control(std::string_view text, size_t pos);

// Throws EncodingError for the first character that cannot appear verbatim
// inside a quoted fragment. Characters listed in `rendered` are escaped by
// the caller and are therefore allowed, as are C1 controls when
// `renderedC1` is set.
void checkText(std::string_view text, const EncodingPolicy& policy,
               std::string_view rendered = {}, bool renderedC1 = false);

// As checkText, but TAB, LF and CR are never accepted in an identifier
void checkIdentifier(std::string_view text, const EncodingPolicy& policy);

// "0x1B" style byte name for error messages
std::string describeByte(unsigned char c);

}  // namespace encoding

}  // namespace sqlquote
