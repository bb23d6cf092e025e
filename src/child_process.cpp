#include "child_process.h"
#include "logger.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>

#ifndef _WIN32
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

static const size_t kReadChunk = 4096;

ChildProcess::ChildProcess(std::string program, std::vector<std::string> args)
    : m_program(std::move(program)), m_args(std::move(args)), m_readBuffer(kReadChunk)
{
}

ChildProcess::~ChildProcess()
{
    closePipes();
#ifdef _WIN32
    if (m_process)
        CloseHandle(m_process);
#endif
}

#ifdef _WIN32

// Find an executable on the system PATH, trying the name as given and with
// ".exe" appended
static std::string find_on_path(const std::string &name)
{
    const char *path_env = std::getenv("PATH");
    if (!path_env)
        return {};

    std::vector<std::string> candidates{name};
    if (name.size() < 4 || _stricmp(name.c_str() + name.size() - 4, ".exe") != 0)
        candidates.insert(candidates.begin(), name + ".exe");

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(';', start);
        std::string dir = path_str.substr(start, end == std::string::npos ? std::string::npos : end - start);

        // Clean up directory path
        dir.erase(std::remove(dir.begin(), dir.end(), '"'), dir.end());
        auto first = dir.find_first_not_of(" \t");
        if (first == std::string::npos)
        {
            dir.clear();
        }
        else
        {
            auto last = dir.find_last_not_of(" \t");
            dir = dir.substr(first, last - first + 1);
        }

        if (!dir.empty() && dir != "." && dir != ".\\" && dir != "./")
        {
            for (const auto &exe_name : candidates)
            {
                std::filesystem::path candidate = std::filesystem::path(dir) / exe_name;
                std::error_code ec;
                if (std::filesystem::exists(candidate, ec) && !std::filesystem::is_directory(candidate, ec))
                {
                    return candidate.string();
                }
            }
        }

        if (end == std::string::npos)
            break;
        start = end + 1;
    }

    return {};
}

// Quote a Windows command-line argument properly
static std::string quote_windows_arg(const std::string &arg)
{
    if (arg.empty())
        return "\"\"";

    bool needs_quotes = arg.find_first_of(" \t\"") != std::string::npos;
    if (!needs_quotes)
        return arg;

    std::string result;
    result.reserve(arg.size() + 2);
    result.push_back('"');

    size_t backslash_count = 0;
    for (char ch : arg)
    {
        if (ch == '\\')
        {
            ++backslash_count;
        }
        else if (ch == '"')
        {
            result.append(backslash_count * 2 + 1, '\\');
            result.push_back('"');
            backslash_count = 0;
        }
        else
        {
            if (backslash_count > 0)
            {
                result.append(backslash_count, '\\');
                backslash_count = 0;
            }
            result.push_back(ch);
        }
    }

    if (backslash_count > 0)
    {
        result.append(backslash_count * 2, '\\');
    }

    result.push_back('"');
    return result;
}

// Format Windows error code to human-readable string
static std::string format_windows_error(DWORD error_code)
{
    if (error_code == 0)
        return "";

    LPSTR buffer = nullptr;
    DWORD size = FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr,
        error_code,
        MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
        reinterpret_cast<LPSTR>(&buffer),
        0,
        nullptr);

    std::string message;
    if (size != 0 && buffer)
    {
        message.assign(buffer, size);
        while (!message.empty() && (message.back() == '\r' || message.back() == '\n'))
            message.pop_back();
    }
    else
    {
        message = "Unknown error";
    }

    if (buffer)
        LocalFree(buffer);

    return message;
}

static ProcessError last_error(const std::string &what)
{
    DWORD err = GetLastError();
    char code[16];
    std::snprintf(code, sizeof(code), "0x%08lX", static_cast<unsigned long>(err));
    return ProcessError(what + ": " + format_windows_error(err) + " (" + code + ")");
}

static void close_handle(HANDLE &h)
{
    if (h)
    {
        CloseHandle(h);
        h = nullptr;
    }
}

void ChildProcess::closePipes()
{
    close_handle(m_errorRead);
    close_handle(m_inputWrite);
}

void ChildProcess::start()
{
    std::string application = m_program;
    bool use_absolute = false;
    if (m_program.find_first_of("/\\") == std::string::npos)
    {
        if (auto resolved = find_on_path(m_program); !resolved.empty())
        {
            application = std::move(resolved);
            use_absolute = true;
        }
    }

    std::string command_line;
    command_line.reserve(256);
    command_line.append(quote_windows_arg(application));
    for (const auto &arg : m_args)
    {
        command_line.push_back(' ');
        command_line.append(quote_windows_arg(arg));
    }

    std::vector<char> command_line_buffer(command_line.begin(), command_line.end());
    command_line_buffer.push_back('\0');

    SECURITY_ATTRIBUTES sa;
    ZeroMemory(&sa, sizeof(sa));
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE err_read = nullptr, err_write = nullptr;
    HANDLE in_read = nullptr, in_write = nullptr;
    if (!CreatePipe(&err_read, &err_write, &sa, 0))
        throw last_error("Failed to create stderr pipe");
    if (!CreatePipe(&in_read, &in_write, &sa, 0))
    {
        ProcessError error = last_error("Failed to create stdin pipe");
        close_handle(err_read);
        close_handle(err_write);
        throw error;
    }

    // Only the child's ends may be inherited
    SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(in_write, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    ZeroMemory(&pi, sizeof(pi));
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = in_read;
    si.hStdOutput = GetStdHandle(STD_OUTPUT_HANDLE);
    si.hStdError = err_write;

    BOOL success = CreateProcessA(
        use_absolute ? application.c_str() : nullptr,
        command_line_buffer.data(),
        nullptr,
        nullptr,
        TRUE, // the pipe ends and stdout must be inherited
        CREATE_NO_WINDOW,
        nullptr,
        nullptr,
        &si,
        &pi);

    if (!success)
    {
        ProcessError error = last_error("Failed to launch '" + application + "'");
        close_handle(err_read);
        close_handle(err_write);
        close_handle(in_read);
        close_handle(in_write);
        throw error;
    }

    close_handle(err_write);
    close_handle(in_read);
    CloseHandle(pi.hThread);

    m_process = pi.hProcess;
    m_errorRead = err_read;
    m_inputWrite = in_write;
    m_started = true;
    LOG_DEBUG("Launched '%s' (pid %lu)", application.c_str(), static_cast<unsigned long>(pi.dwProcessId));
}

ChildProcess::ReadStatus ChildProcess::readErrorChar(char &c)
{
    if (m_readPos < m_readLen)
    {
        c = m_readBuffer[m_readPos++];
        return ReadStatus::Char;
    }

    DWORD n = 0;
    if (!ReadFile(m_errorRead, m_readBuffer.data(), static_cast<DWORD>(m_readBuffer.size()), &n, nullptr))
    {
        if (GetLastError() == ERROR_BROKEN_PIPE)
            return ReadStatus::EndOfStream;
        throw last_error("Failed to read child stderr");
    }
    if (n == 0)
        return ReadStatus::EndOfStream;

    m_readLen = n;
    m_readPos = 0;
    c = m_readBuffer[m_readPos++];
    return ReadStatus::Char;
}

void ChildProcess::writeInput(const std::string &data)
{
    size_t offset = 0;
    while (offset < data.size())
    {
        DWORD written = 0;
        if (!WriteFile(m_inputWrite, data.data() + offset, static_cast<DWORD>(data.size() - offset), &written, nullptr))
            throw last_error("Failed to write child stdin");
        offset += written;
    }
}

bool ChildProcess::hasExited()
{
    std::lock_guard<std::mutex> lock(m_statusMutex);
    if (m_exited || !m_started)
        return m_exited;

    if (WaitForSingleObject(m_process, 0) != WAIT_OBJECT_0)
        return false;

    DWORD exit_code = 0;
    if (!GetExitCodeProcess(m_process, &exit_code))
        throw last_error("Failed to retrieve child exit code");
    m_exitCode = static_cast<int>(exit_code);
    m_exited = true;
    return true;
}

int ChildProcess::waitForExit()
{
    std::lock_guard<std::mutex> lock(m_statusMutex);
    if (m_exited)
        return m_exitCode;
    if (!m_started)
        throw ProcessError("Process was never started");

    if (WaitForSingleObject(m_process, INFINITE) == WAIT_FAILED)
        throw last_error("Failed waiting for child process");

    DWORD exit_code = 0;
    if (!GetExitCodeProcess(m_process, &exit_code))
        throw last_error("Failed to retrieve child exit code");
    m_exitCode = static_cast<int>(exit_code);
    m_exited = true;
    return m_exitCode;
}

#else

static ProcessError errno_error(const std::string &what, int err)
{
    return ProcessError(what + ": " + std::strerror(err));
}

// Pipe with FD_CLOEXEC on both ends; dup2 in the child clears it again for
// the descriptors the child is meant to keep
static void make_pipe(int fds[2], const char *what)
{
    if (pipe(fds) != 0)
        throw errno_error(std::string("Failed to create ") + what + " pipe", errno);
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
}

static void close_fd(int &fd)
{
    if (fd >= 0)
    {
        close(fd);
        fd = -1;
    }
}

static int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return 1;
}

void ChildProcess::closePipes()
{
    close_fd(m_errorFd);
    close_fd(m_inputFd);
}

void ChildProcess::start()
{
    // Writing to a child that already exited must fail with EPIPE instead
    // of killing the wrapper
    static std::once_flag s_ignoreSigpipe;
    std::call_once(s_ignoreSigpipe, []
                   { std::signal(SIGPIPE, SIG_IGN); });

    // Build argument list with the program as first argument
    std::vector<std::string> forwarded_args_storage;
    forwarded_args_storage.reserve(m_args.size() + 1);
    forwarded_args_storage.emplace_back(m_program);
    forwarded_args_storage.insert(forwarded_args_storage.end(), m_args.begin(), m_args.end());

    std::vector<char *> child_argv;
    child_argv.reserve(forwarded_args_storage.size() + 1);
    for (auto &stored : forwarded_args_storage)
    {
        child_argv.push_back(const_cast<char *>(stored.c_str()));
    }
    child_argv.push_back(nullptr);

    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1}; // carries errno back if execvp fails
    try
    {
        make_pipe(err_pipe, "stderr");
        make_pipe(in_pipe, "stdin");
        make_pipe(exec_pipe, "exec status");
    }
    catch (const ProcessError &)
    {
        for (int *fd : {&err_pipe[0], &err_pipe[1], &in_pipe[0], &in_pipe[1], &exec_pipe[0], &exec_pipe[1]})
            close_fd(*fd);
        throw;
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        for (int *fd : {&err_pipe[0], &err_pipe[1], &in_pipe[0], &in_pipe[1], &exec_pipe[0], &exec_pipe[1]})
            close_fd(*fd);
        throw errno_error("Failed to fork", err);
    }
    if (pid == 0)
    {
        // The wrapper blocks and ignores signals for its own purposes; the
        // child starts from the defaults
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        std::signal(SIGPIPE, SIG_DFL);

        dup2(in_pipe[0], STDIN_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        execvp(child_argv[0], child_argv.data());

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do
    {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        int status = 0;
        waitpid(pid, &status, 0);
        close_fd(in_pipe[1]);
        close_fd(err_pipe[0]);
        throw errno_error("Failed to exec '" + m_program + "'", exec_errno);
    }

    m_pid = pid;
    m_errorFd = err_pipe[0];
    m_inputFd = in_pipe[1];
    m_started = true;
    LOG_DEBUG("Launched '%s' (pid %d)", m_program.c_str(), static_cast<int>(pid));
}

ChildProcess::ReadStatus ChildProcess::readErrorChar(char &c)
{
    if (m_readPos < m_readLen)
    {
        c = m_readBuffer[m_readPos++];
        return ReadStatus::Char;
    }

    ssize_t n;
    do
    {
        n = read(m_errorFd, m_readBuffer.data(), m_readBuffer.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0)
        throw errno_error("Failed to read child stderr", errno);
    if (n == 0)
        return ReadStatus::EndOfStream;

    m_readLen = static_cast<size_t>(n);
    m_readPos = 0;
    c = m_readBuffer[m_readPos++];
    return ReadStatus::Char;
}

void ChildProcess::writeInput(const std::string &data)
{
    size_t offset = 0;
    while (offset < data.size())
    {
        ssize_t n = write(m_inputFd, data.data() + offset, data.size() - offset);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw errno_error("Failed to write child stdin", errno);
        }
        offset += static_cast<size_t>(n);
    }
}

bool ChildProcess::hasExited()
{
    std::lock_guard<std::mutex> lock(m_statusMutex);
    if (m_exited || !m_started)
        return m_exited;

    int status = 0;
    pid_t r = waitpid(m_pid, &status, WNOHANG);
    if (r == 0)
        return false;
    if (r < 0)
    {
        if (errno == EINTR)
            return false;
        throw errno_error("Failed to poll child process", errno);
    }

    m_exitCode = decode_wait_status(status);
    m_exited = true;
    return true;
}

int ChildProcess::waitForExit()
{
    std::lock_guard<std::mutex> lock(m_statusMutex);
    if (m_exited)
        return m_exitCode;
    if (!m_started)
        throw ProcessError("Process was never started");

    int status = 0;
    pid_t r;
    do
    {
        r = waitpid(m_pid, &status, 0);
    } while (r < 0 && errno == EINTR);

    if (r < 0)
        throw errno_error("Failed to wait for child process", errno);

    m_exitCode = decode_wait_status(status);
    m_exited = true;
    return m_exitCode;
}

#endif
