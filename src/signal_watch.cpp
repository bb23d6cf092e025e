#include "signal_watch.h"
#include "logger.h"
#include "terminal.h"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <pthread.h>
#endif

static void announce_exit()
{
    restore_console_input();
    std::fputs("\nExiting.\n", stderr);
    std::fflush(stderr);
}

#ifdef _WIN32

static BOOL WINAPI console_ctrl_handler(DWORD type)
{
    if (type != CTRL_C_EVENT && type != CTRL_BREAK_EVENT)
        return FALSE;

    announce_exit();
    ExitProcess(static_cast<UINT>(interrupted_exit_code(SIGINT)));
    return TRUE;
}

static void install_handler()
{
    if (!SetConsoleCtrlHandler(console_ctrl_handler, TRUE))
        LOG_WARN("Failed to install Ctrl+C handler (0x%08lX)", static_cast<unsigned long>(GetLastError()));
}

#else

static void wait_for_interrupt(sigset_t set)
{
    while (true)
    {
        int signal_number = 0;
        if (sigwait(&set, &signal_number) != 0)
            continue;

        LOG_DEBUG("Received signal %d", signal_number);
        announce_exit();
        std::_Exit(interrupted_exit_code(signal_number));
    }
}

static void install_handler()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);

    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0)
    {
        LOG_WARN("Failed to block interrupt signals: %s", std::strerror(rc));
        return;
    }

    std::thread(wait_for_interrupt, set).detach();
}

#endif

void install_interrupt_watch()
{
    static std::once_flag s_once;
    std::call_once(s_once, install_handler);
}
