#include "process_supervisor.h"
#include "child_process.h"
#include "logger.h"
#include "signal_watch.h"
#include "terminal.h"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

// Shared with the key forwarding thread, which may outlive run() if it
// misses the drain deadline
struct InputPumpState
{
    std::atomic<bool> childExited{false};

    std::mutex mutex;
    std::condition_variable finishedCv;
    bool finished = false;
};

static void forward_keys(std::shared_ptr<ChildProcess> child,
                         std::shared_ptr<IKeySource> keys,
                         std::shared_ptr<InputPumpState> pump,
                         int pollMs)
{
    while (!pump->childExited.load())
    {
        try
        {
            while (!pump->childExited.load() && keys->keyAvailable())
            {
                int key = keys->readKey();
                if (key < 0)
                    break;

                // Enter ends a line for the child whatever the console sent
                if (key == '\r' || key == '\n')
                    child->writeInput("\n");
                else
                    child->writeInput(std::string(1, static_cast<char>(key)));
            }
        }
        catch (const std::exception &ex)
        {
            // Once draining starts this thread may outlive main and the logger
            if (!pump->childExited.load())
                LOG_DEBUG("Key forwarding failed: %s", ex.what());
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(pollMs));
    }

    {
        std::lock_guard<std::mutex> lock(pump->mutex);
        pump->finished = true;
    }
    pump->finishedCv.notify_all();
}

const char *to_string(ProcessSupervisor::State state)
{
    switch (state)
    {
    case ProcessSupervisor::State::Starting:
        return "Starting";
    case ProcessSupervisor::State::Running:
        return "Running";
    case ProcessSupervisor::State::Draining:
        return "Draining";
    case ProcessSupervisor::State::Exited:
        return "Exited";
    default:
        return "Unknown";
    }
}

ProcessSupervisor::ProcessSupervisor(const WrapperConfig &config, std::ostream &out, std::shared_ptr<IKeySource> keys)
    : m_config(config), m_out(out), m_keys(std::move(keys))
{
    m_notifierOptions.barWidth = m_config.barWidth;
    m_notifierOptions.asciiGlyphs = m_config.asciiBar;
}

void ProcessSupervisor::setState(State state)
{
    LOG_DEBUG("Supervisor: %s -> %s", to_string(m_state.load()), to_string(state));
    m_state.store(state);
}

void ProcessSupervisor::pumpErrorStream(ChildProcess &child, ProgressNotifier &notifier)
{
    try
    {
        char c = 0;
        while (true)
        {
            if (child.readErrorChar(c) == ChildProcess::ReadStatus::Char)
            {
                notifier.processChar(c);
                continue;
            }

            if (child.hasExited())
                break;

            // Stream closed but the process lives on; look again shortly
            std::this_thread::sleep_for(std::chrono::milliseconds(m_config.stderrRetryMs));
        }
    }
    catch (const std::exception &ex)
    {
        LOG_DEBUG("stderr reader stopped: %s", ex.what());
    }
}

int ProcessSupervisor::run(const std::vector<std::string> &args)
{
    setState(State::Starting);

    // Must precede every thread this run starts
    if (m_config.watchSignals)
        install_interrupt_watch();

    auto child = std::make_shared<ChildProcess>(m_config.ffmpegPath, args);
    try
    {
        child->start();
    }
    catch (const ProcessError &ex)
    {
        m_out << "Failed to start ffmpeg process: " << ex.what() << '\n';
        m_out.flush();
        setState(State::Exited);
        return 1;
    }
    LOG_VERBOSE("Started %s with %zu argument(s)", m_config.ffmpegPath.c_str(), args.size());

    setState(State::Running);
    ProgressNotifier notifier(m_out, m_notifierOptions);

    auto pump = std::make_shared<InputPumpState>();
    std::thread input_thread;
    if (m_keys)
        input_thread = std::thread(forward_keys, child, m_keys, pump, m_config.stdinPollMs);

    pumpErrorStream(*child, notifier);

    setState(State::Draining);
    pump->childExited.store(true);
    if (input_thread.joinable())
    {
        bool stopped;
        {
            std::unique_lock<std::mutex> lock(pump->mutex);
            stopped = pump->finishedCv.wait_for(lock, std::chrono::milliseconds(m_config.drainGraceMs),
                                                [&pump]
                                                { return pump->finished; });
        }
        if (stopped)
        {
            input_thread.join();
        }
        else
        {
            LOG_DEBUG("Key forwarding still busy after %d ms, leaving it behind", m_config.drainGraceMs);
            input_thread.detach();
        }
    }

    int exit_code = child->waitForExit();
    setState(State::Exited);

    notifier.close();
    if (exit_code != 0)
    {
        m_out << notifier.lastLine() << '\n';
        m_out.flush();
    }

    LOG_VERBOSE("ffmpeg exited with code %d", exit_code);
    return exit_code;
}
