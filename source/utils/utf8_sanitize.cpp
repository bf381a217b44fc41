#include "utils/utf8_sanitize.hpp"

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD
const char kEllipsis[] = "...";

// Length of the well-formed sequence starting at position, or 0 if the bytes
// there do not form one (bad lead, truncated tail, bad continuation).
size_t sequence_length(const std::string &text, size_t position) {
    unsigned char lead = static_cast<unsigned char>(text[position]);
    size_t length = 0;
    if (lead < 0x80u) {
        return 1;
    } else if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead >= 0xE0u && lead <= 0xEFu) {
        length = 3;
    } else if (lead >= 0xF0u && lead <= 0xF4u) {
        length = 4;
    } else {
        return 0;
    }

    if (position + length > text.size()) {
        return 0;
    }
    for (size_t offset = 1; offset < length; ++offset) {
        unsigned char continuation = static_cast<unsigned char>(text[position + offset]);
        if ((continuation & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

} // namespace

bool is_valid(const std::string &text) {
    size_t position = 0;
    while (position < text.size()) {
        size_t length = sequence_length(text, position);
        if (length == 0) {
            return false;
        }
        position += length;
    }
    return true;
}

void sanitize(std::string &text) {
    if (is_valid(text)) {
        return;
    }

    std::string result;
    result.reserve(text.size() + 8);
    size_t position = 0;
    while (position < text.size()) {
        size_t length = sequence_length(text, position);
        if (length == 0) {
            result += kReplacement;
            ++position;
            continue;
        }
        result.append(text, position, length);
        position += length;
    }
    text = std::move(result);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

std::string truncate(const std::string &text, size_t max_bytes) {
    std::string clean = sanitize(text);
    if (clean.size() <= max_bytes) {
        return clean;
    }

    size_t keep = 0;
    while (keep < clean.size()) {
        size_t length = sequence_length(clean, keep);
        if (length == 0 || keep + length > max_bytes) {
            break;
        }
        keep += length;
    }
    return clean.substr(0, keep) + kEllipsis;
}

} // namespace utf8_sanitize
