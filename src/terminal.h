#pragma once

// Width in columns of the terminal the progress bar is drawn on (stderr,
// then stdout), or -1 when neither is a terminal or the query fails.
int terminal_columns();

// Source of single keystrokes to forward to the child process.
class IKeySource
{
public:
    static constexpr int kEndOfInput = -1;
    static constexpr int kNoKey = -2;

    virtual ~IKeySource() = default;

    // Non-blocking check that readKey() has something to return
    virtual bool keyAvailable() = 0;

    // Next key as an unsigned char value, kEndOfInput once input is
    // exhausted, or kNoKey for keys with no character (arrows, F-keys).
    virtual int readKey() = 0;
};

// Keys from the wrapper's own console. Keys are echoed as they are read.
//
// On POSIX terminals stdin is switched to non-canonical mode for the
// lifetime of the object so a key is delivered without waiting for Enter;
// the saved mode is put back on destruction or by restore_console_input().
class ConsoleKeySource : public IKeySource
{
public:
    ConsoleKeySource();
    ~ConsoleKeySource() override;

    ConsoleKeySource(const ConsoleKeySource &) = delete;
    ConsoleKeySource &operator=(const ConsoleKeySource &) = delete;

    bool keyAvailable() override;
    int readKey() override;

private:
    bool m_endOfInput = false;
};

// Restore the console input mode changed by ConsoleKeySource. Idempotent;
// the interrupt path calls it before terminating the process.
void restore_console_input();
