#include "metadata_extractor.h"
#include "utils.h"

#include <cmath>

extern "C"
{
#include <libavutil/eval.h>
}

static bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

// Match "HH:MM:SS.ff" at pos: two digits per field and at least two
// fractional digits. Returns the length of the matched token, 0 if none.
// Fraction digits past the second are left in the line and ignored.
static size_t match_clock_token(const std::string &line, size_t pos)
{
    static const char kShape[] = "dd:dd:dd.dd";
    const size_t len = sizeof(kShape) - 1;
    if (pos + len > line.size())
        return 0;

    for (size_t i = 0; i < len; ++i)
    {
        const char want = kShape[i];
        const char got = line[pos + i];
        if (want == 'd' ? !is_digit(got) : got != want)
            return 0;
    }
    return len;
}

static int64_t two_digits(const std::string &line, size_t pos)
{
    return (line[pos] - '0') * 10 + (line[pos + 1] - '0');
}

// Whole seconds of the first "<label>HH:MM:SS.ff" occurrence on the line.
// Fields are taken as printed; minutes and seconds are not range checked.
static std::optional<int64_t> clock_after_label(const std::string &line, const std::string &label)
{
    for (size_t pos = line.find(label); pos != std::string::npos; pos = line.find(label, pos + 1))
    {
        const size_t start = pos + label.size();
        if (match_clock_token(line, start) == 0)
            continue;

        const int64_t hours = two_digits(line, start);
        const int64_t minutes = two_digits(line, start + 3);
        const int64_t seconds = two_digits(line, start + 6);
        return (hours * 60 + minutes) * 60 + seconds;
    }
    return std::nullopt;
}

std::optional<int64_t> parse_duration(const std::string &line)
{
    return clock_after_label(line, "Duration: ");
}

std::optional<int64_t> parse_progress_time(const std::string &line)
{
    return clock_after_label(line, "time=");
}

std::optional<std::string> parse_source_name(const std::string &line)
{
    static const std::string kOpen = "from '";

    const size_t open = line.find(kOpen);
    if (open == std::string::npos)
        return std::nullopt;

    // The quoted path runs to the last "':" so quotes inside it survive
    const size_t begin = open + kOpen.size();
    const size_t close = line.rfind("':");
    if (close == std::string::npos || close < begin)
        return std::nullopt;

    return file_name_component(line.substr(begin, close - begin));
}

std::optional<int64_t> parse_frame_rate(const std::string &line)
{
    static const std::string kUnit = " fps";

    for (size_t pos = line.find(kUnit); pos != std::string::npos; pos = line.find(kUnit, pos + 1))
    {
        const size_t end = pos;
        size_t begin = end;
        while (begin > 0 && is_digit(line[begin - 1]))
            --begin;
        if (begin == end)
            continue;

        // Optional integer part: "<digits>.<digits>"
        if (begin >= 2 && line[begin - 1] == '.' && is_digit(line[begin - 2]))
        {
            size_t whole = begin - 1;
            while (whole > 0 && is_digit(line[whole - 1]))
                --whole;
            begin = whole;
        }

        // The first number found is the rate, even one that rounds to 0
        const std::string number = line.substr(begin, end - begin);
        const double rate = av_strtod(number.c_str(), nullptr);

        // nearbyint uses the current rounding mode: nearest, ties to even
        return static_cast<int64_t>(std::nearbyint(rate));
    }
    return std::nullopt;
}
