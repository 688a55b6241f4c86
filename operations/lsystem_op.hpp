#ifndef GEOMILL_OPERATIONS_LSYSTEM_OP_HPP
#define GEOMILL_OPERATIONS_LSYSTEM_OP_HPP

#include <operations/operation_result.hpp>
#include <lsystem/grammar.hpp>
#include <lsystem/turtle.hpp>
#include <optional>

namespace geomill {

struct LSystemParams {
    lsystem::Grammar grammar;
    int iterations = 0;
    size_t max_symbols = 5000000;
    lsystem::TurtleParams turtle;
    std::optional<int> sdf_divisions;
    float sdf_radius = 0.1f;
};

// command=lsystem
//
// With seed geometry the seed is returned unchanged together with one
// instance matrix per drawing move. Without it the turtle path is returned
// as line segments, or meshed as capsules when sdf_divisions is set.
struct LSystemOp {
    static constexpr const char* NAME = "lsystem";

    static LSystemParams parse(const ConfigMap& config);

    void validate(const ConfigMap& config) const;
    OperationResult execute(const ConfigMap& config, const GeometryBuffer& input) const;
};

}  // namespace geomill

#endif // GEOMILL_OPERATIONS_LSYSTEM_OP_HPP
