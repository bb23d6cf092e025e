#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Scanners for the diagnostic lines ffmpeg prints on stderr. Each one looks
// for a single fixed pattern and returns an empty optional when the line does
// not carry it, which is what happens for most lines.

// "  Duration: 01:02:03.45, start: ..." -> 3723 (fraction dropped)
std::optional<int64_t> parse_duration(const std::string &line);

// "frame= 250 ... time=00:00:10.00 bitrate=..." -> 10
std::optional<int64_t> parse_progress_time(const std::string &line);

// "Input #0, mov,mp4,m4a, from '/media/in.mp4':" -> "in.mp4"
std::optional<std::string> parse_source_name(const std::string &line);

// "... 1920x1080, 29.97 fps, 29.97 tbr ..." -> 30 (nearest, ties to even)
std::optional<int64_t> parse_frame_rate(const std::string &line);
