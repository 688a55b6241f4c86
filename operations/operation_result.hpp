#ifndef GEOMILL_OPERATIONS_OPERATION_RESULT_HPP
#define GEOMILL_OPERATIONS_OPERATION_RESULT_HPP

#include <config/config_map.hpp>
#include <geometry/geometry_buffer.hpp>

namespace geomill {

// What a command hands back to the dispatcher
struct OperationResult {
    GeometryBuffer geometry;
    ConfigMap config;
};

}  // namespace geomill

#endif // GEOMILL_OPERATIONS_OPERATION_RESULT_HPP
