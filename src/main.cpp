#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "logger.h"
#include "process_supervisor.h"
#include "terminal.h"

int main(int argc, char **argv)
{
#ifdef _WIN32
    // Match ffmpeg behavior: minimal console handling
    setvbuf(stderr, NULL, _IONBF, 0); /* win32 runtime needs this */
#endif

    if (argc <= 1)
    {
        print_help(argv[0]);
        return 0;
    }

    try
    {
        WrapperConfig cfg;
        load_config_from_env(&cfg);

        Logger::instance().setVerbose(cfg.verbose);
        Logger::instance().setDebug(cfg.debug);

        // Everything after the program name belongs to ffmpeg
        std::vector<std::string> args(argv + 1, argv + argc);

        auto keys = std::make_shared<ConsoleKeySource>();
        ProcessSupervisor supervisor(cfg, std::cerr, keys);
        int ret = supervisor.run(args);

        restore_console_input();
        return ret;
    }
    catch (const std::exception &ex)
    {
        restore_console_input();
        fprintf(stderr, "Unexpected exception: %s\n", ex.what());
        return 1;
    }
}
