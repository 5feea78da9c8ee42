#include "utils/utf8_sanitize.hpp"

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD";

bool in_range(unsigned char byte, unsigned char low, unsigned char high) {
    return byte >= low && byte <= high;
}

} // namespace

size_t valid_sequence_length(const unsigned char *begin, const unsigned char *end) {
    if (begin >= end) {
        return 0;
    }
    unsigned char lead = begin[0];
    if (lead < 0x80u) {
        return 1;
    }

    size_t length = 0;
    // Allowed range of the second byte narrows for E0, ED, F0 and F4.
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;
    if (in_range(lead, 0xC2u, 0xDFu)) {
        length = 2;
    } else if (in_range(lead, 0xE0u, 0xEFu)) {
        length = 3;
        if (lead == 0xE0u) {
            second_low = 0xA0u;
        } else if (lead == 0xEDu) {
            second_high = 0x9Fu;
        }
    } else if (in_range(lead, 0xF0u, 0xF4u)) {
        length = 4;
        if (lead == 0xF0u) {
            second_low = 0x90u;
        } else if (lead == 0xF4u) {
            second_high = 0x8Fu;
        }
    } else {
        return 0;
    }

    if (static_cast<size_t>(end - begin) < length) {
        return 0;
    }
    if (!in_range(begin[1], second_low, second_high)) {
        return 0;
    }
    for (size_t index = 2; index < length; ++index) {
        if (!in_range(begin[index], 0x80u, 0xBFu)) {
            return 0;
        }
    }
    return length;
}

void sanitize_in_place(std::string &text) {
    const unsigned char *cursor = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = cursor + text.size();

    // Fast path: most text is already valid.
    const unsigned char *scan = cursor;
    while (scan < end) {
        size_t length = valid_sequence_length(scan, end);
        if (length == 0) {
            break;
        }
        scan += length;
    }
    if (scan == end) {
        return;
    }

    std::string cleaned(reinterpret_cast<const char *>(cursor), static_cast<size_t>(scan - cursor));
    cleaned.reserve(text.size() + 8);
    while (scan < end) {
        size_t length = valid_sequence_length(scan, end);
        if (length == 0) {
            cleaned += kReplacement;
            ++scan;
            continue;
        }
        cleaned.append(reinterpret_cast<const char *>(scan), length);
        scan += length;
    }
    text.swap(cleaned);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize_in_place(copy);
    return copy;
}

} // namespace utf8_sanitize
