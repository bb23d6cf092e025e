#include "progress_bar.h"
#include "logger.h"
#include "terminal.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <exception>

static const char kFilledGlyph[] = "\xE2\x96\x88"; // U+2588 FULL BLOCK
static const char kEmptyGlyph[] = "\xE2\x96\x91";  // U+2591 LIGHT SHADE

ProgressBar::ProgressBar(int64_t totalTicks, std::ostream &out, Options options)
    : m_totalTicks(totalTicks), m_out(out), m_options(std::move(options)), m_start(now())
{
    std::lock_guard<std::mutex> lock(m_mutex);
    renderLocked();
}

ProgressBar::~ProgressBar()
{
    close();
}

ProgressBar::Clock::time_point ProgressBar::now() const
{
    return m_options.now ? m_options.now() : Clock::now();
}

void ProgressBar::advance(int64_t delta)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed || delta <= 0)
        return;

    // Written this way round so kUnbounded cannot overflow
    if (delta >= m_totalTicks - m_currentTick)
        m_currentTick = m_totalTicks;
    else
        m_currentTick += delta;

    renderLocked();
}

void ProgressBar::close()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed)
        return;

    if (m_totalTicks != kUnbounded && m_currentTick < m_totalTicks)
        m_currentTick = m_totalTicks;

    renderLocked(true);
    m_closed = true;
}

int64_t ProgressBar::currentTick() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentTick;
}

bool ProgressBar::isClosed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

int ProgressBar::barWidth() const
{
    if (m_options.fixedWidth > 0)
        return m_options.fixedWidth;

    int columns = -1;
    try
    {
        columns = m_options.columns ? m_options.columns() : terminal_columns();
    }
    catch (const std::exception &ex)
    {
        LOG_DEBUG("Terminal width query failed: %s", ex.what());
    }
    if (columns <= 0)
        return kFallbackWidth;

    const int reserved = static_cast<int>(display_width(m_options.title)) + kReservedColumns;
    return std::min(kMaxWidth, std::max(kMinWidth, columns - reserved));
}

std::string ProgressBar::composeLine(int64_t current, double elapsedSeconds, int width) const
{
    const bool bounded = m_totalTicks != kUnbounded && m_totalTicks > 0;
    const double progress = bounded ? static_cast<double>(current) / static_cast<double>(m_totalTicks) : 0.0;

    std::string line;
    if (!m_options.title.empty())
    {
        line += m_options.title;
        line += ": ";
    }

    line += std::to_string(std::lround(progress * 100.0));
    line += "% |";

    const int filled = std::min(width, std::max(0, static_cast<int>(progress * width)));
    const char *fill = m_options.asciiGlyphs ? "#" : kFilledGlyph;
    const char *empty = m_options.asciiGlyphs ? "-" : kEmptyGlyph;
    for (int i = 0; i < filled; ++i)
        line += fill;
    for (int i = filled; i < width; ++i)
        line += empty;
    line += '|';

    line += ' ';
    line += std::to_string(current);
    if (bounded)
    {
        line += '/';
        line += std::to_string(m_totalTicks);
    }

    if (!m_options.unit.empty())
    {
        line += ' ';
        line += m_options.unit;
    }

    if (elapsedSeconds > 0.0)
    {
        line += " [";
        line += format_clock(static_cast<int64_t>(elapsedSeconds));
        if (bounded && progress > 0.0)
        {
            const double remaining = elapsedSeconds / progress - elapsedSeconds;
            if (remaining > 0.0)
            {
                line += '<';
                line += format_clock(static_cast<int64_t>(remaining));
            }
        }
        line += ']';
    }

    return line;
}

void ProgressBar::renderLocked(bool endLine)
{
    try
    {
        const double elapsed = std::chrono::duration<double>(now() - m_start).count();
        std::string line = composeLine(m_currentTick, elapsed, barWidth());

        // Blank out whatever the previous paint left behind, then redraw
        const size_t blank = std::max(display_width(m_lastRendered), display_width(line));
        std::string paint;
        paint.reserve(blank + line.size() + 3);
        paint += '\r';
        paint.append(blank, ' ');
        paint += '\r';
        paint += line;
        if (endLine)
            paint += '\n';

        m_lastRendered = std::move(line);
        m_out << paint;
        m_out.flush();
    }
    catch (const std::exception &ex)
    {
        LOG_DEBUG("Progress render failed: %s", ex.what());
    }
}
