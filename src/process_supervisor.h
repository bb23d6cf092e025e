#pragma once

#include <atomic>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "config.h"
#include "progress_notifier.h"

class ChildProcess;
class IKeySource;

/**
 * Runs ffmpeg under a progress bar.
 *
 *   Starting -> Running -> Draining -> Exited
 *
 * While Running, three activities proceed independently:
 * - the calling thread reads the child's stderr one character at a time and
 *   feeds the ProgressNotifier;
 * - a worker thread polls the key source and forwards keys to the child's
 *   stdin (so ffmpeg's "q" and "[y/N]" answers still work);
 * - with WrapperConfig::watchSignals, Ctrl+C ends the whole program (see
 *   install_interrupt_watch()).
 * Once the child has exited and its stderr is drained, the key forwarder
 * gets WrapperConfig::drainGraceMs to stop before it is abandoned.
 */
class ProcessSupervisor
{
public:
    enum class State
    {
        Starting,
        Running,
        Draining,
        Exited
    };

    // keys may be null, in which case nothing is forwarded to the child
    ProcessSupervisor(const WrapperConfig &config, std::ostream &out, std::shared_ptr<IKeySource> keys);

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    // Launch the configured binary with args (passed through untouched) and
    // return its exit code, or 1 if it could not be started.
    int run(const std::vector<std::string> &args);

    State state() const { return m_state.load(); }

    // Options handed to the ProgressNotifier; tests use this to pin the
    // terminal width and clock
    ProgressNotifier::Options &notifierOptions() { return m_notifierOptions; }

private:
    void setState(State state);
    void pumpErrorStream(ChildProcess &child, ProgressNotifier &notifier);

    WrapperConfig m_config;
    std::ostream &m_out;
    std::shared_ptr<IKeySource> m_keys;
    ProgressNotifier::Options m_notifierOptions;
    std::atomic<State> m_state{State::Starting};
};

const char *to_string(ProcessSupervisor::State state);
