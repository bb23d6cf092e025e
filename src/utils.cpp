#include "utils.h"
#include <algorithm>
#include <cctype>
#include <cstdio>

// Check if a string ends with a suffix
bool endsWith(const std::string &str, const std::string &suffix)
{
    if (suffix.size() > str.size())
        return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Convert string to lowercase (returns a copy)
std::string lowercase_copy(const std::string &s)
{
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string file_name_component(const std::string &path)
{
    size_t sep = path.find_last_of("/\\");
    if (sep == std::string::npos)
        return path;
    return path.substr(sep + 1);
}

size_t display_width(const std::string &utf8)
{
    // Count every byte that is not a UTF-8 continuation byte (10xxxxxx)
    size_t width = 0;
    for (unsigned char c : utf8)
    {
        if ((c & 0xC0) != 0x80)
            ++width;
    }
    return width;
}

std::string format_clock(int64_t seconds)
{
    if (seconds < 0)
        seconds = 0;
    char b[32];
    std::snprintf(b, sizeof(b), "%02lld:%02lld",
                  static_cast<long long>(seconds / 60),
                  static_cast<long long>(seconds % 60));
    return b;
}
