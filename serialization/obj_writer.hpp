#ifndef GEOMILL_SERIALIZATION_OBJ_WRITER_HPP
#define GEOMILL_SERIALIZATION_OBJ_WRITER_HPP

#include <geometry/mesh_format.hpp>
#include <math/vec3.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace geomill {

// Wavefront OBJ text: faces for triangulated input, lines otherwise
std::string to_obj(const std::vector<Vec3>& vertices, const std::vector<uint32_t>& indices,
                   MeshFormat format, const std::string& name);

}  // namespace geomill

#endif // GEOMILL_SERIALIZATION_OBJ_WRITER_HPP
