#pragma once

#include <cstdint>
#include <string>

// String utility functions

// Check if a string ends with a suffix
bool endsWith(const std::string &str, const std::string &suffix);

// Convert string to lowercase (returns a copy)
std::string lowercase_copy(const std::string &s);

// Final segment of a path; both '/' and '\' separate segments
std::string file_name_component(const std::string &path);

// Number of terminal columns a UTF-8 string occupies (one per code point)
size_t display_width(const std::string &utf8);

// Format a second count as mm:ss; minutes are not wrapped at the hour
std::string format_clock(int64_t seconds);
