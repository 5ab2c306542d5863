#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "pipeline.hpp"
#include "logging.hpp"

int main(int argc, char* argv[]) {
    auto log = pixstitch::logging::get_logger();

    pixstitch::cli::CommandContext ctx;
    try {
        ctx = pixstitch::cli::parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        pixstitch::cli::print_usage(argv[0]);
        return 1;
    }

    if (ctx.help) {
        pixstitch::cli::print_usage(argv[0]);
        return 0;
    }
    if (ctx.input_path.empty()) {
        pixstitch::cli::print_usage(argv[0]);
        return 1;
    }
    if (ctx.verbose) {
        log->set_level(spdlog::level::debug);
    }

    log->info("Starting pixstitch pipeline");
    return pixstitch::cli::run_export(ctx);
}
