#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <ostream>
#include <string>

/**
 * Single-line terminal progress bar, repainted in place on every update:
 *
 *   in.mp4: 42% |████████░░░░░░░░░░░░| 1260/3000 frames [00:12<00:16]
 *
 * advance() and close() may be called from different threads; every
 * repaint happens under one mutex so partial lines never interleave.
 * Output failures are swallowed, a broken terminal never stops the caller.
 */
class ProgressBar
{
public:
    using Clock = std::chrono::steady_clock;

    // Total for inputs of unknown length: counts only, no percentage or ETA
    static constexpr int64_t kUnbounded = std::numeric_limits<int64_t>::max();

    struct Options
    {
        std::string title;                      // "<title>: " prefix when not empty
        std::string unit;                       // appended after the counts when not empty
        int fixedWidth = 0;                     // bar cells; 0 follows the terminal width
        bool asciiGlyphs = false;               // '#'/'-' instead of block glyphs
        std::function<int()> columns;           // width query, terminal_columns() if empty
        std::function<Clock::time_point()> now; // time source, Clock::now() if empty
    };

    ProgressBar(int64_t totalTicks, std::ostream &out, Options options);
    ~ProgressBar();

    ProgressBar(const ProgressBar &) = delete;
    ProgressBar &operator=(const ProgressBar &) = delete;

    // Move forward by delta ticks, clamped to the total. Non-positive
    // deltas and calls after close() are ignored.
    void advance(int64_t delta);

    // Jump to the total (when bounded), paint once more and end the line.
    // Idempotent.
    void close();

    int64_t currentTick() const;
    int64_t totalTicks() const { return m_totalTicks; }
    bool isClosed() const;

    // Number of bar cells for the current terminal
    int barWidth() const;

    // Compose the status line for a given position and elapsed time
    std::string composeLine(int64_t current, double elapsedSeconds, int width) const;

private:
    void renderLocked(bool endLine = false);
    Clock::time_point now() const;

    static constexpr int kFallbackWidth = 20;
    static constexpr int kMinWidth = 20;
    static constexpr int kMaxWidth = 60;
    static constexpr int kReservedColumns = 50; // percentage, counts and times

    const int64_t m_totalTicks;
    std::ostream &m_out;
    const Options m_options;
    const Clock::time_point m_start;

    mutable std::mutex m_mutex;
    int64_t m_currentTick = 0;
    std::string m_lastRendered;
    bool m_closed = false;
};
