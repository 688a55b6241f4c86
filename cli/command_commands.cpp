#include "cli_common.hpp"
#include <operations/operation_registry.hpp>

namespace geomill::cli {

int command_commands(int /*argc*/, char** /*argv*/) {
    for (const auto& name : OperationRegistry::instance().commands()) {
        std::cout << name << "\n";
    }
    return 0;
}

}  // namespace geomill::cli
