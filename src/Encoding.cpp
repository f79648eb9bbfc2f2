#include "Encoding.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>

namespace sqlquote {
namespace encoding {

namespace {

bool isTrail(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool isLineBreak(unsigned char c) {
    return c == '\t' || c == '\n' || c == '\r';
}

}  // namespace

size_t sequenceLength(std::string_view text, size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t trail;
    uint32_t cp;

    if (lead <= 0x7F) {
        return 1;
    } else if (lead <= 0xBF) {
        return 0;  // Continuation byte
    } else if (lead <= 0xDF) {
        trail = 1;
        cp = lead & 0x1F;
    } else if (lead <= 0xEF) {
        trail = 2;
        cp = lead & 0x0F;
    } else if (lead <= 0xF7) {
        trail = 3;
        cp = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + trail >= text.size()) {
        return 0;  // Truncated
    }

    for (size_t i = 1; i <= trail; ++i) {
        const auto c = static_cast<unsigned char>(text[pos + i]);
        if (!isTrail(c)) {
            return 0;
        }
        cp = (cp << 6) | (c & 0x3F);
    }

    // Minimal length coding
    if (trail == 1 && cp <= 0x7F) return 0;
    if (trail == 2 && cp <= 0x7FF) return 0;
    if (trail == 3 && cp <= 0xFFFF) return 0;
    // UTF-16 surrogates and the end of the Unicode range
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
    if (cp > 0x10FFFF) return 0;

    return trail + 1;
}

bool isValidUtf8(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = sequenceLength(text, pos);
        if (len == 0) {
            return false;
        }
        pos += len;
    }
    return true;
}

bool isControl(unsigned char c) {
    return c < 0x20 || c == 0x7F;
}

bool isC1Control(std::string_view text, size_t pos) {
    return pos + 1 < text.size() &&
           static_cast<unsigned char>(text[pos]) == 0xC2 &&
           static_cast<unsigned char>(text[pos + 1]) >= 0x80 &&
           static_cast<unsigned char>(text[pos + 1]) <= 0x9F;
}

void checkText(std::string_view text, const EncodingPolicy& policy,
               std::string_view rendered, bool renderedC1) {
    size_t pos = 0;
    while (pos < text.size()) {
        const auto c = static_cast<unsigned char>(text[pos]);

        if (c >= 0x80) {
            if (!policy.strictUtf8) {
                ++pos;
                continue;
            }
            size_t len = sequenceLength(text, pos);
            if (len == 0) {
                spdlog::debug("Rejected malformed UTF-8 at byte {}", pos);
                throw EncodingError("invalid UTF-8 sequence at byte " + std::to_string(pos),
                                    pos);
            }
            if (!renderedC1 && isC1Control(text, pos)) {
                const auto cp = static_cast<unsigned char>(text[pos + 1]);
                spdlog::debug("Rejected C1 control {} at byte {}", describeByte(cp), pos);
                throw EncodingError("control character U+00" + describeByte(cp).substr(2) +
                                    " at byte " + std::to_string(pos) +
                                    " cannot appear in quoted SQL", pos);
            }
            pos += len;
            continue;
        }

        if (isControl(c) && rendered.find(static_cast<char>(c)) == std::string_view::npos) {
            if (!(policy.allowLineBreaks && isLineBreak(c))) {
                spdlog::debug("Rejected control character {} at byte {}", describeByte(c), pos);
                throw EncodingError("control character " + describeByte(c) +
                                    " at byte " + std::to_string(pos) +
                                    " cannot appear in quoted SQL", pos);
            }
        }
        ++pos;
    }
}

void checkIdentifier(std::string_view text, const EncodingPolicy& policy) {
    EncodingPolicy identifier = policy;
    identifier.allowLineBreaks = false;
    checkText(text, identifier);
}

std::string describeByte(unsigned char c) {
    static const char* hex = "0123456789ABCDEF";
    std::string out = "0x";
    out += hex[c >> 4];
    out += hex[c & 0x0F];
    return out;
}

}  // namespace encoding
}  // namespace sqlquote
