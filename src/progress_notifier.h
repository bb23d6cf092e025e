#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include "line_accumulator.h"
#include "progress_bar.h"

// A value that can be set once; later writes are ignored
template <typename T>
class Latch
{
public:
    // Returns true if this call set the value
    bool setIfUnset(std::optional<T> value)
    {
        if (m_value || !value)
            return false;
        m_value = std::move(value);
        return true;
    }

    bool isSet() const { return m_value.has_value(); }
    const std::optional<T> &get() const { return m_value; }

private:
    std::optional<T> m_value;
};

/**
 * Turns ffmpeg's stderr, one character at a time, into progress bar
 * updates.
 *
 * Duration, source name and frame rate are latched from the first line that
 * carries them; a header printed again later cannot disturb a bar that is
 * already running. The bar is created on the first "time=" marker and counts
 * frames when a frame rate is known, seconds otherwise.
 */
class ProgressNotifier
{
public:
    struct Options
    {
        int barWidth = 0;         // 0 follows the terminal width
        bool asciiGlyphs = false;
        std::function<int()> columns;
        std::function<ProgressBar::Clock::time_point()> now;
    };

    static constexpr const char *kFallbackTitle = "Processing";

    explicit ProgressNotifier(std::ostream &out);
    ProgressNotifier(std::ostream &out, Options options);
    ~ProgressNotifier();

    ProgressNotifier(const ProgressNotifier &) = delete;
    ProgressNotifier &operator=(const ProgressNotifier &) = delete;

    void processChar(char c);

    // Apply one completed line: latch metadata, then move the bar
    void processLine(const std::string &line);

    // Last completed line from the child, for failure reports
    const std::string &lastLine() const { return m_lines.lastLine(); }

    // Finish the bar if one was started. Idempotent.
    void close();

    const std::optional<int64_t> &durationSeconds() const { return m_duration.get(); }
    const std::optional<int64_t> &framesPerSecond() const { return m_fps.get(); }
    const std::optional<std::string> &sourceName() const { return m_source.get(); }

    // Null until the first progress marker
    const ProgressBar *progressBar() const { return m_bar.get(); }

private:
    void showPrompt(const std::string &prompt);
    void updateProgress(const std::string &line);

    std::ostream &m_out;
    Options m_options;
    LineAccumulator m_lines;

    Latch<int64_t> m_duration;
    Latch<std::string> m_source;
    Latch<int64_t> m_fps;

    std::unique_ptr<ProgressBar> m_bar;
};
