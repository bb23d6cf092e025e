#pragma once

#include <string>

// Splits a character stream into completed lines. '\r' and '\n' both end a
// line, so ffmpeg's in-place status updates arrive as separate lines.
//
// ffmpeg asks "File 'out.mp4' already exists. Overwrite? [y/N] " without a
// trailing newline and then blocks on stdin. A partial line ending in
// "[y/N] " is therefore completed on the spot and reported as a prompt so
// the caller can show it before the user is expected to answer.
class LineAccumulator
{
public:
    enum class Event
    {
        None,   // character buffered, nothing completed
        Line,   // a line terminator completed text()
        Prompt  // an interactive prompt completed text()
    };

    struct Result
    {
        Event event = Event::None;
        std::string text;
    };

    Result processChar(char c);

    // Most recent completed line (prompts included); empty if none yet
    const std::string &lastLine() const { return m_lastLine; }

    // Text received since the last completed line
    const std::string &pending() const { return m_buffer; }

private:
    std::string completeLine();

    std::string m_buffer;
    std::string m_lastLine;
};
