#include "util/logger.hpp"
#include "util/upgrader_config.hpp"
#include "vfsup/upgrade_orchestrator.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <getopt.h>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [-v]\n"
        "\n"
        "Options:\n"
        "  -c, --config    Upgrader config file (default %s)\n"
        "  -v, --verbose   Also print log records to stderr\n"
        "  -h, --help      Show this help\n",
        argv, vfsup::config::kDefaultConfigPath);
}

std::string NewLogFileName(const std::string& log_dir) {
    char stamp[32]{};
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) != nullptr) {
        std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);
    }
    return (std::filesystem::path(log_dir) / ("upgrade_" + std::string(stamp) + ".log")).string();
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path = vfsup::config::kDefaultConfigPath;
    bool config_from_cli = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                config_from_cli = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind < argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    vfsup::config::UpgraderConfig cfg;
    std::error_code ec;
    if (config_from_cli || std::filesystem::exists(config_path, ec)) {
        auto r = vfsup::config::UpgraderConfig::LoadFromFile(config_path, cfg);
        if (!r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
    }

    auto& logger = vfsup::Logger::Instance();
    logger.SetLevel(verbose ? vfsup::LogLevel::Debug : cfg.log_level);
    logger.SetConsoleEnabled(verbose);

    std::filesystem::create_directories(cfg.log_directory, ec);
    if (auto r = logger.OpenLogFile(NewLogFileName(cfg.log_directory)); !r.is_ok()) {
        std::fprintf(stderr, "WARN: %s (continuing without a log file)\n", r.msg.c_str());
    }

    auto orchestrator = vfsup::UpgradeOrchestrator::CreateDefault(cfg);
    const vfsup::UpgradeOutcome outcome = orchestrator->Execute();

    logger.CloseLogFile();
    return outcome.ExitCode();
}
