#include "operation_registry.hpp"

namespace geomill {

const char* operation_name(const Operation& op) {
    return std::visit([](auto&& arg) -> const char* {
        return std::decay_t<decltype(arg)>::NAME;
    }, op);
}

void validate_operation(const Operation& op, const ConfigMap& config) {
    std::visit([&](auto&& arg) {
        arg.validate(config);
    }, op);
}

OperationResult execute_operation(const Operation& op, const ConfigMap& config,
                                  const GeometryBuffer& input) {
    return std::visit([&](auto&& arg) -> OperationResult {
        return arg.execute(config, input);
    }, op);
}

const OperationRegistry& OperationRegistry::instance() {
    static const OperationRegistry registry;
    return registry;
}

OperationRegistry::OperationRegistry() {
    const Operation all[] = {
        CenterlineOp{},
        LSystemOp{},
        SdfRemeshOp{},
        ToolpathOp{},
        VoronoiDiagramOp{},
        SimplifyRdpOp{},
        ConvexHull2dOp{},
        OutlineOp{},
        DiscretizeOp{},
    };
    for (const auto& op : all) {
        operations_.emplace(operation_name(op), op);
    }
}

const Operation* OperationRegistry::find(const std::string& command) const {
    auto it = operations_.find(command);
    return it == operations_.end() ? nullptr : &it->second;
}

std::vector<std::string> OperationRegistry::commands() const {
    std::vector<std::string> names;
    names.reserve(operations_.size());
    for (const auto& entry : operations_) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace geomill
