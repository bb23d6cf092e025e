#include "line_accumulator.h"
#include "utils.h"

static const char kPromptSuffix[] = "[y/N] ";

LineAccumulator::Result LineAccumulator::processChar(char c)
{
    Result result;

    if (c == '\r' || c == '\n')
    {
        result.event = Event::Line;
        result.text = completeLine();
        return result;
    }

    m_buffer.push_back(c);

    if (m_buffer.size() >= sizeof(kPromptSuffix) - 1 && endsWith(m_buffer, kPromptSuffix))
    {
        result.event = Event::Prompt;
        result.text = completeLine();
    }

    return result;
}

std::string LineAccumulator::completeLine()
{
    m_lastLine = m_buffer;
    m_buffer.clear();
    return m_lastLine;
}
