#ifndef GEOMILL_CLI_COMMON_HPP
#define GEOMILL_CLI_COMMON_HPP

#include <common/file_io.hpp>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace geomill::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    // key=value config overrides from -s/--set
    std::vector<std::pair<std::string, std::string>> overrides;
    bool verbose = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                throw std::runtime_error("-o/--output requires an argument");
            }
            ctx.output_path = argv[i + 1];
            i += 2;
        } else if (arg == "-s" || arg == "--set") {
            if (i + 1 >= argc) {
                throw std::runtime_error("-s/--set requires key=value");
            }
            std::string assignment = argv[i + 1];
            size_t eq = assignment.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw std::runtime_error("-s/--set expects key=value, got: " + assignment);
            }
            ctx.overrides.emplace_back(assignment.substr(0, eq), assignment.substr(eq + 1));
            i += 2;
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
            ++i;
        } else if (arg[0] != '-') {
            if (!ctx.input_path.empty()) {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
            ctx.input_path = arg;
            ++i;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Command function declarations
int command_run(int argc, char** argv);
int command_obj(int argc, char** argv);
int command_commands(int argc, char** argv);

}  // namespace geomill::cli

#endif // GEOMILL_CLI_COMMON_HPP
