#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>
#include <ffi/geomill_api.h>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Drives the geomill library the way a host application does.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  run <request.json> -o <response.json> [-s key=value ...]\n";
    std::cerr << "              Run one request through process_geometry\n";
    std::cerr << "  obj <response.json> -o <output.obj>\n";
    std::cerr << "              Convert a response to Wavefront OBJ\n";
    std::cerr << "  commands    List the available geometry commands\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -v, --verbose   Debug logging\n";
    std::cerr << "  --version       Print the library version\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  GEOMILL_LOG_LEVEL        - Set log level (trace, debug, info, warn, error, off)\n";
    std::cerr << "  GEOMILL_DATA_LOGGER_PATH - Directory receiving a dump of every call\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "--version") {
        std::cout << geomill_version() << "\n";
        return 0;
    }
    if (command == "run") {
        return geomill::cli::command_run(argc, argv);
    }
    if (command == "obj") {
        return geomill::cli::command_obj(argc, argv);
    }
    if (command == "commands") {
        return geomill::cli::command_commands(argc, argv);
    }

    geomill::logging::get_logger()->error("Unknown command: {}", command);
    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
