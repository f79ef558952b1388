#pragma once



#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>



namespace mediarip
{

void trim_inplace(std::string &s);
std::string trim(std::string s);
std::string extend_left(std::string s, char c, size_t width);
std::string str_lowercase(const std::string &s);
std::string str_uppercase(const std::string &s);
std::vector<std::string> tokenize(const std::string &str, const char *delimiters, const char *quotes);
std::string replace_nonprint(std::string s, char r);
std::string normalize_string(const std::string &s);

std::optional<uint64_t> str_to_uint64(std::string::const_iterator str_begin, std::string::const_iterator str_end);
std::optional<uint64_t> str_to_uint64(const std::string &str);
uint64_t str_to_uint(const std::string &str);

// "a-b:c-d" with inclusive ends <=> half-open [start, end) pairs
std::vector<std::pair<uint64_t, uint64_t>> string_to_ranges(const std::string &str);
std::string ranges_to_string(const std::vector<std::pair<uint64_t, uint64_t>> &ranges);

}
