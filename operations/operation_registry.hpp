#ifndef GEOMILL_OPERATIONS_OPERATION_REGISTRY_HPP
#define GEOMILL_OPERATIONS_OPERATION_REGISTRY_HPP

#include <operations/centerline_op.hpp>
#include <operations/lsystem_op.hpp>
#include <operations/polyline_ops.hpp>
#include <operations/sdf_remesh_op.hpp>
#include <operations/toolpath_op.hpp>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace geomill {

// Closed set of commands; adding one means a new alternative here plus a
// registry entry
using Operation = std::variant<
    CenterlineOp,
    LSystemOp,
    SdfRemeshOp,
    ToolpathOp,
    VoronoiDiagramOp,
    SimplifyRdpOp,
    ConvexHull2dOp,
    OutlineOp,
    DiscretizeOp
>;

const char* operation_name(const Operation& op);
void validate_operation(const Operation& op, const ConfigMap& config);
OperationResult execute_operation(const Operation& op, const ConfigMap& config,
                                  const GeometryBuffer& input);

// Command name to operation. Built on first use and read-only afterwards.
class OperationRegistry {
public:
    static const OperationRegistry& instance();

    // nullptr for unknown commands; lookup is exact and case-sensitive
    const Operation* find(const std::string& command) const;

    std::vector<std::string> commands() const;

private:
    OperationRegistry();

    std::map<std::string, Operation> operations_;
};

}  // namespace geomill

#endif // GEOMILL_OPERATIONS_OPERATION_REGISTRY_HPP
