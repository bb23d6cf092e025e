#pragma once

// Exit status for a run cut short by a signal, the way shells report it
inline int interrupted_exit_code(int signal_number)
{
    return 128 + signal_number;
}

// Ctrl+C handling for the wrapper. SIGINT and SIGTERM (Ctrl+C and
// Ctrl+Break on Windows) print "Exiting." and end the process immediately
// with interrupted_exit_code(); the console input mode is restored, nothing
// else is cleaned up.
//
// POSIX: the signals are blocked in the calling thread and waited for on a
// detached thread, so this must run before any other thread is started.
// Only the first call has an effect.
void install_interrupt_watch();
