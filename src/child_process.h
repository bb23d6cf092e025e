#pragma once

#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <sys/types.h>
#endif

// Raised when the child cannot be launched or one of its pipes fails
class ProcessError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// An external program launched without a shell. Its stderr and stdin are
// pipes owned by this object; stdout is shared with the wrapper so ffmpeg
// can still write media to a pipe.
//
// readErrorChar() and writeInput() touch different pipes and may run on
// different threads. Exit status queries are serialized internally.
class ChildProcess
{
public:
    enum class ReadStatus
    {
        Char,
        EndOfStream
    };

    // args excludes the program name
    ChildProcess(std::string program, std::vector<std::string> args);
    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    // Throws ProcessError if the process cannot be created or the program
    // cannot be executed
    void start();

    // Blocks until a character of the child's stderr is available or the
    // stream ends
    ReadStatus readErrorChar(char &c);

    // Write to the child's stdin; the pipe is unbuffered so the data is
    // visible to the child on return
    void writeInput(const std::string &data);

    // Non-blocking exit check
    bool hasExited();

    // Blocks until the child exits. A child killed by a signal reports
    // 128 + signal, the way shells do.
    int waitForExit();

    const std::string &program() const { return m_program; }

private:
    void closePipes();

    std::string m_program;
    std::vector<std::string> m_args;

    std::vector<char> m_readBuffer;
    size_t m_readPos = 0;
    size_t m_readLen = 0;

    std::mutex m_statusMutex;
    bool m_started = false;
    bool m_exited = false;
    int m_exitCode = 0;

#ifdef _WIN32
    HANDLE m_process = nullptr;
    HANDLE m_errorRead = nullptr;
    HANDLE m_inputWrite = nullptr;
#else
    pid_t m_pid = -1;
    int m_errorFd = -1;
    int m_inputFd = -1;
#endif
};
