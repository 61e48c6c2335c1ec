#include "util/utf8decode.hpp"

using namespace yamlview;

namespace {

bool
is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

}  // namespace

char32_t
yamlview::utf8_next(const std::string& s, std::string::size_type* offset) {
    const auto size = s.size();
    auto i = *offset;
    if (i >= size) {
        return kReplacementCharacter;
    }

    const unsigned char lead = static_cast<unsigned char>(s[i]);
    int length = 0;
    char32_t codepoint = 0;
    char32_t minimum = 0;

    if (lead < 0x80) {
        *offset = i + 1;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        codepoint = lead & 0x1F;
        minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        codepoint = lead & 0x0F;
        minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        codepoint = lead & 0x07;
        minimum = 0x10000;
    } else {
        *offset = i + 1;
        return kReplacementCharacter;
    }

    if (i + static_cast<std::string::size_type>(length) > size) {
        *offset = i + 1;
        return kReplacementCharacter;
    }

    for (int k = 1; k < length; k++) {
        const unsigned char c = static_cast<unsigned char>(s[i + k]);
        if (!is_continuation(c)) {
            *offset = i + 1;
            return kReplacementCharacter;
        }
        codepoint = (codepoint << 6) | (c & 0x3F);
    }

    // Overlong encodings and surrogates are malformed.
    if (codepoint < minimum || codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        *offset = i + 1;
        return kReplacementCharacter;
    }

    *offset = i + static_cast<std::string::size_type>(length);
    return codepoint;
}

int64_t
yamlview::utf8_len(const std::string& s, std::string::size_type start, std::string::size_type end) {
    int64_t count = 0;
    auto offset = start;
    while (offset < end && offset < s.size()) {
        utf8_next(s, &offset);
        count++;
    }
    return count;
}

int64_t
yamlview::utf8_len(const std::string& s) {
    return utf8_len(s, 0, s.size());
}

std::string::size_type
yamlview::utf8_advance_by(const std::string& s, std::string::size_type start, std::size_t index) {
    auto offset = start;
    for (std::size_t i = 0; i < index && offset < s.size(); i++) {
        utf8_next(s, &offset);
    }
    return offset;
}

std::u32string
yamlview::utf8_decode(const std::string& s) {
    std::u32string result;
    result.reserve(s.size());
    std::string::size_type offset = 0;
    while (offset < s.size()) {
        result.push_back(utf8_next(s, &offset));
    }
    return result;
}

void
yamlview::utf8_append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        utf8_append(out, kReplacementCharacter);
    }
}

std::string
yamlview::utf8_encode(const std::u32string& s) {
    std::string result;
    result.reserve(s.size());
    for (char32_t cp : s) {
        utf8_append(result, cp);
    }
    return result;
}
