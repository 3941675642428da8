#include <spdlog/spdlog.h>
#include <lexgraph/cli/lexgraph_cli.h>

int main(int argc, char* argv[]) {
    try {
        // LexGraphCli::run() adjusts the level from configuration and flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        lexgraph::cli::LexGraphCli cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
