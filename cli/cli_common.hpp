#ifndef PIXSTITCH_CLI_COMMON_HPP
#define PIXSTITCH_CLI_COMMON_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pixstitch::cli {

// Everything the command line can ask for
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<std::string> partitions_json_path;
    std::optional<std::string> align;
    std::vector<std::string> walks;   // "<partition>:<x>,<y>[:<mode>]"
    bool fit = false;
    bool verbose = false;
    bool help = false;
};

// Throws std::runtime_error on unknown options or missing option values
inline CommandContext parse_args(int argc, char** argv, int start_idx = 1) {
    CommandContext ctx;
    int i = start_idx;

    auto value_of = [&](const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(option + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = value_of("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = value_of("-c/--config");
        } else if (arg == "--partitions-json") {
            ctx.partitions_json_path = value_of("--partitions-json");
        } else if (arg == "--align") {
            ctx.align = value_of("--align");
        } else if (arg == "--walk") {
            ctx.walks.push_back(value_of("--walk"));
        } else if (arg == "--fit") {
            ctx.fit = true;
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (!arg.empty() && arg[0] != '-') {
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return ctx;
}

// Input path with its extension replaced by suffix, unless an output was given
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }

    size_t dot_pos = input.find_last_of('.');
    size_t slash_pos = input.find_last_of('/');

    if (dot_pos != std::string::npos &&
        (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        return input.substr(0, dot_pos) + suffix;
    }
    return input + suffix;
}

}  // namespace pixstitch::cli

#endif // PIXSTITCH_CLI_COMMON_HPP
