#include "app/CliApplication.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace
{

std::string FindConfigPath(int argc, char** argv)
{
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::strcmp(argv[i], "--config") == 0)
            return argv[i + 1];
    }
    return "strscan.toml";
}

} // namespace

int main(int argc, char** argv)
{
    // Logging comes up before the rest of the config so config errors get logged
    utils::LogManager::LoggerConfig main_log{ .name = "main",
                                              .filepath = "logs/strscan.log",
                                              .append_override = std::nullopt,
                                              .level_override = std::nullopt,
                                              .max_file_size = 5 * 1024 * 1024,
                                              .backup_count = 2,
                                              .console_override = std::nullopt };
    if (!utils::LogManager::Initialize(FindConfigPath(argc, argv)) || !utils::LogManager::RegisterLogger<0>(main_log))
    {
        std::cerr << "strscan: file logging disabled\n";
    }

#if STRSCAN_PROFILING_LEVEL >= 1
    utils::LogManager::LoggerConfig profiling_log{ .name = "profiling",
                                                   .filepath = "logs/profiling.log",
                                                   .append_override = std::nullopt,
                                                   .level_override = plog::debug,
                                                   .max_file_size = 5 * 1024 * 1024,
                                                   .backup_count = 2,
                                                   .console_override = false };
    if (!utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>(profiling_log))
    {
        std::cerr << "strscan: profiling log disabled\n";
    }
#endif

    std::vector<std::string> args(argv + 1, argv + argc);
    int exit_code = CliApplication{ std::move(args), std::cout, std::cerr }.run();

    utils::LogManager::Shutdown();
    return exit_code;
}
