#pragma once

#include <string>

// Settings of the wrapper itself. The command line belongs to ffmpeg, so
// these come from FFPB_* environment variables (see print_help).
struct WrapperConfig
{
    bool verbose = false;
    bool debug = false;

    std::string ffmpegPath = "ffmpeg";

    int barWidth = 0; // bar cells; 0 follows the terminal width
#ifdef _WIN32
    bool asciiBar = true;
#else
    bool asciiBar = false;
#endif

    // Ctrl+C / SIGINT / SIGTERM handling; tests run without it
    bool watchSignals = true;

    int stdinPollMs = 50;   // keystroke polling interval
    int stderrRetryMs = 10; // pause after end of stream while the child lives
    int drainGraceMs = 1000; // time for key forwarding to stop after exit
};

// Print usage/help information
void print_help(const char *argv0);

// Overlay FFPB_* environment variables on cfg. Invalid values are reported
// and leave the current value in place.
void load_config_from_env(WrapperConfig *cfg);
