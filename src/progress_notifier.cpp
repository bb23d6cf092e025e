#include "progress_notifier.h"
#include "logger.h"
#include "metadata_extractor.h"

ProgressNotifier::ProgressNotifier(std::ostream &out)
    : ProgressNotifier(out, Options())
{
}

ProgressNotifier::ProgressNotifier(std::ostream &out, Options options)
    : m_out(out), m_options(std::move(options))
{
}

ProgressNotifier::~ProgressNotifier()
{
    close();
}

void ProgressNotifier::processChar(char c)
{
    LineAccumulator::Result result = m_lines.processChar(c);
    switch (result.event)
    {
    case LineAccumulator::Event::Line:
        processLine(result.text);
        break;
    case LineAccumulator::Event::Prompt:
        showPrompt(result.text);
        break;
    case LineAccumulator::Event::None:
        break;
    }
}

void ProgressNotifier::showPrompt(const std::string &prompt)
{
    // Move off the bar so the next repaint does not overwrite the question
    if (m_bar)
        m_out << '\n';
    m_out << prompt;
    m_out.flush();
}

void ProgressNotifier::processLine(const std::string &line)
{
    if (!m_duration.isSet() && m_duration.setIfUnset(parse_duration(line)))
        LOG_VERBOSE("Input duration: %lld s", static_cast<long long>(*m_duration.get()));

    if (!m_source.isSet() && m_source.setIfUnset(parse_source_name(line)))
        LOG_VERBOSE("Input source: %s", m_source.get()->c_str());

    if (!m_fps.isSet() && m_fps.setIfUnset(parse_frame_rate(line)))
        LOG_VERBOSE("Input frame rate: %lld fps", static_cast<long long>(*m_fps.get()));

    updateProgress(line);
}

void ProgressNotifier::updateProgress(const std::string &line)
{
    std::optional<int64_t> seconds = parse_progress_time(line);
    if (!seconds)
        return;

    int64_t current = *seconds;
    std::optional<int64_t> total = m_duration.get();
    if (m_fps.isSet())
    {
        const int64_t fps = *m_fps.get();
        current *= fps;
        if (total)
            *total *= fps;
    }

    if (!m_bar)
    {
        ProgressBar::Options barOptions;
        barOptions.title = m_source.get().value_or(kFallbackTitle);
        barOptions.unit = m_fps.isSet() ? "frames" : "seconds";
        barOptions.fixedWidth = m_options.barWidth;
        barOptions.asciiGlyphs = m_options.asciiGlyphs;
        barOptions.columns = m_options.columns;
        barOptions.now = m_options.now;

        LOG_DEBUG("Starting progress bar: total=%lld %s",
                  static_cast<long long>(total.value_or(-1)), barOptions.unit.c_str());
        m_bar = std::make_unique<ProgressBar>(total.value_or(ProgressBar::kUnbounded), m_out, std::move(barOptions));
    }

    const int64_t delta = current - m_bar->currentTick();
    if (delta > 0)
        m_bar->advance(delta);
}

void ProgressNotifier::close()
{
    if (m_bar)
        m_bar->close();
}
