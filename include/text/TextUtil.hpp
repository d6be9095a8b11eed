#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace textutil {

std::string trim_copy(const std::string& s);

// ASCII only; multi-byte UTF-8 sequences pass through untouched
std::string to_lower_copy(std::string s);

// first max_chars code points of a UTF-8 string (never cuts a sequence in half)
std::string utf8_prefix(const std::string& s, size_t max_chars);

// lowercase, keep letters/digits, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text into tokens, drop tokens shorter than min_len
std::vector<std::string> tokenize(const std::string& normalized, size_t min_len = 3);

bool starts_with(const std::string& s, const std::string& prefix);

}
