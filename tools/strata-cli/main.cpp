#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <strata/cli/strata_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr so --json output on stdout stays parseable
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("strata", stderr_sink));

        // Conservative default; StrataCLI::run() adjusts based on flags and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        strata::cli::StrataCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
