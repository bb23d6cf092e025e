#include "terminal.h"
#include "logger.h"

#include <atomic>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <conio.h>
#else
#include <sys/ioctl.h>
#include <sys/select.h>
#include <termios.h>
#include <unistd.h>
#endif

#ifdef _WIN32

int terminal_columns()
{
    const DWORD handles[] = {STD_ERROR_HANDLE, STD_OUTPUT_HANDLE};
    for (DWORD which : handles)
    {
        CONSOLE_SCREEN_BUFFER_INFO csbi;
        HANDLE h = GetStdHandle(which);
        if (h != INVALID_HANDLE_VALUE && GetConsoleScreenBufferInfo(h, &csbi))
        {
            int width = csbi.srWindow.Right - csbi.srWindow.Left + 1;
            if (width > 0)
                return width;
        }
    }
    return -1;
}

ConsoleKeySource::ConsoleKeySource() = default;

ConsoleKeySource::~ConsoleKeySource() = default;

bool ConsoleKeySource::keyAvailable()
{
    return _kbhit() != 0;
}

int ConsoleKeySource::readKey()
{
    int ch = _getche();
    // Extended keys arrive as a 0x00 or 0xE0 prefix followed by a scan code
    if (ch == 0 || ch == 0xE0)
    {
        _getch();
        return kNoKey;
    }
    return ch & 0xFF;
}

void restore_console_input()
{
}

#else

static struct termios s_savedMode;
static std::atomic<bool> s_modeChanged{false};

int terminal_columns()
{
    const int fds[] = {STDERR_FILENO, STDOUT_FILENO};
    for (int fd : fds)
    {
        struct winsize ws;
        std::memset(&ws, 0, sizeof(ws));
        if (isatty(fd) && ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
            return ws.ws_col;
    }
    return -1;
}

ConsoleKeySource::ConsoleKeySource()
{
    if (!isatty(STDIN_FILENO))
        return;

    struct termios mode;
    if (tcgetattr(STDIN_FILENO, &mode) != 0)
    {
        LOG_DEBUG("tcgetattr failed: %s", std::strerror(errno));
        return;
    }

    s_savedMode = mode;
    mode.c_lflag &= ~ICANON;
    mode.c_cc[VMIN] = 1;
    mode.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &mode) != 0)
    {
        LOG_DEBUG("tcsetattr failed: %s", std::strerror(errno));
        return;
    }
    s_modeChanged.store(true);
}

ConsoleKeySource::~ConsoleKeySource()
{
    restore_console_input();
}

bool ConsoleKeySource::keyAvailable()
{
    if (m_endOfInput)
        return false;

    fd_set set;
    struct timeval timeout;

    FD_ZERO(&set);
    FD_SET(STDIN_FILENO, &set);

    timeout.tv_sec = 0;
    timeout.tv_usec = 0;

    return select(STDIN_FILENO + 1, &set, nullptr, nullptr, &timeout) > 0;
}

int ConsoleKeySource::readKey()
{
    if (m_endOfInput)
        return kEndOfInput;

    unsigned char ch = 0;
    ssize_t n;
    do
    {
        n = read(STDIN_FILENO, &ch, 1);
    } while (n < 0 && errno == EINTR);

    if (n == 1)
        return ch;

    if (n < 0)
        LOG_DEBUG("Reading stdin failed: %s", std::strerror(errno));
    m_endOfInput = true;
    return kEndOfInput;
}

void restore_console_input()
{
    if (s_modeChanged.exchange(false))
        tcsetattr(STDIN_FILENO, TCSANOW, &s_savedMode);
}

#endif
