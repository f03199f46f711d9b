// ============= include/utils.hpp =============
#pragma once
#include <string>
#include <vector>
#include <cstdint>

// Lowercase ASCII plus the Latin-1 letters used in Spanish (Á É Í Ó Ú Ñ Ü ...)
std::string to_lower_utf8(const std::string& text);

bool contains_icase(const std::string& haystack, const std::string& needle);

// Case-insensitive prefix test (ASCII only, used for tag markers)
bool starts_with_icase(const std::string& text, size_t pos, const std::string& prefix);

std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

std::vector<std::string> split(const std::string& s, char sep);

// Comparison time does not depend on where the first mismatch is
bool constant_time_equals(const std::string& a, const std::string& b);

std::string base64_encode(const std::string& data);

// Throws std::invalid_argument on malformed input
std::string base64_decode(const std::string& encoded);

// UUID v4 string, used for session and request ids
std::string new_uuid();

int64_t now_ms();

std::string format_timestamp(int64_t epoch_ms);
