#ifndef CAPBRIDGE_UTF8_SANITIZE_HPP
#define CAPBRIDGE_UTF8_SANITIZE_HPP

// UTF-8 hygiene for text crossing the trust boundary (clipboard contents,
// console arguments). nlohmann::json refuses to dump invalid UTF-8.

#include <cstddef>
#include <string>

namespace utf8_sanitize {

// Length of the well-formed sequence starting at begin, or 0 if it is not one.
// Rejects overlong forms, surrogates and code points above U+10FFFF.
size_t valid_sequence_length(const unsigned char *begin, const unsigned char *end);

// Replaces each invalid byte with U+FFFD, in place.
void sanitize_in_place(std::string &text);

// Copying variant of sanitize_in_place.
std::string sanitize(const std::string &text);

} // namespace utf8_sanitize

#endif // CAPBRIDGE_UTF8_SANITIZE_HPP
