#include "config.h"
#include "logger.h"
#include "utils.h"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

extern "C"
{
#include <libavutil/avutil.h>
}

#ifndef BUILD_VERSION
#define BUILD_VERSION "dev"
#endif

// Helper function: get environment variable as string
static const char *get_env_var(const char *name)
{
    const char *value = std::getenv(name);
    if (value && *value == '\0')
        return nullptr;
    return value;
}

// Helper function: get environment variable as integer with default
static int get_env_int(const char *name, int default_value)
{
    const char *value = get_env_var(name);
    if (!value)
        return default_value;
    try
    {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (value[used] != '\0')
            throw std::invalid_argument(value);
        return parsed;
    }
    catch (const std::logic_error &)
    {
        LOG_WARN("Invalid integer value for %s: %s (using default: %d)", name, value, default_value);
        return default_value;
    }
}

// Helper function: get environment variable as boolean (1/true/yes = true, 0/false/no = false)
static bool get_env_bool(const char *name, bool default_value)
{
    const char *value = get_env_var(name);
    if (!value)
        return default_value;
    std::string lower = lowercase_copy(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
        return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
        return false;
    LOG_WARN("Invalid boolean value for %s: %s (using default: %s)",
             name, value, default_value ? "true" : "false");
    return default_value;
}

void print_help(const char *argv0)
{
    const char *name = argv0 ? argv0 : "ffpb";
    fprintf(stdout, "ffpb v%s (libavutil %s)\n", BUILD_VERSION, av_version_info());
    fprintf(stdout, "A progress bar wrapper for ffmpeg\n");
    fprintf(stdout, "\nUsage:\n");
    fprintf(stdout, "  %s [ffmpeg options]\n", name);
    fprintf(stdout, "\nExamples:\n");
    fprintf(stdout, "  %s -i input.mp4 -c:v libx264 -crf 23 output.mp4\n", name);
    fprintf(stdout, "  %s -i input.avi -c:v copy -c:a aac output.mp4\n", name);
    fprintf(stdout, "  %s -i input.mov -vf scale=1280:720 -c:v libx264 output.mp4\n", name);
    fprintf(stdout, "\nThis tool wraps ffmpeg and displays a progress bar during conversion.\n");
    fprintf(stdout, "All ffmpeg options are supported - just pass them as arguments.\n");
    fprintf(stdout, "\nEnvironment:\n");
    fprintf(stdout, "  FFPB_FFMPEG     ffmpeg binary to run (default: ffmpeg)\n");
    fprintf(stdout, "  FFPB_BAR_WIDTH  Fixed bar width, 0 follows the terminal (default: 0)\n");
    fprintf(stdout, "  FFPB_ASCII      Draw the bar with '#' and '-' (default: %s)\n",
            WrapperConfig().asciiBar ? "1" : "0");
    fprintf(stdout, "  FFPB_VERBOSE    Enable verbose logging\n");
    fprintf(stdout, "  FFPB_DEBUG      Enable debug logging\n");
}

void load_config_from_env(WrapperConfig *cfg)
{
    if (!cfg)
        throw std::invalid_argument("load_config_from_env: null config");

    cfg->verbose = get_env_bool("FFPB_VERBOSE", cfg->verbose);
    cfg->debug = get_env_bool("FFPB_DEBUG", cfg->debug);

    if (const char *ffmpeg = get_env_var("FFPB_FFMPEG"))
        cfg->ffmpegPath = ffmpeg;

    int width = get_env_int("FFPB_BAR_WIDTH", cfg->barWidth);
    if (width < 0)
    {
        LOG_WARN("FFPB_BAR_WIDTH must not be negative: %d (using default: %d)", width, cfg->barWidth);
    }
    else
    {
        cfg->barWidth = width;
    }

    cfg->asciiBar = get_env_bool("FFPB_ASCII", cfg->asciiBar);
}
