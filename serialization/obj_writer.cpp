#include "obj_writer.hpp"
#include <sstream>

namespace geomill {

std::string to_obj(const std::vector<Vec3>& vertices, const std::vector<uint32_t>& indices,
                   MeshFormat format, const std::string& name) {
    std::ostringstream out;
    out << "# geomill " << to_string(format) << "\n";
    out << "o " << name << "\n";
    for (const auto& v : vertices) {
        out << "v " << v.x << " " << v.y << " " << v.z << "\n";
    }
    // OBJ indices are 1-based
    switch (format) {
        case MeshFormat::Triangulated:
            for (size_t i = 0; i + 2 < indices.size(); i += 3) {
                out << "f " << indices[i] + 1 << " " << indices[i + 1] + 1 << " " << indices[i + 2] + 1 << "\n";
            }
            break;
        case MeshFormat::LineChunks:
            for (size_t i = 0; i + 1 < indices.size(); i += 2) {
                out << "l " << indices[i] + 1 << " " << indices[i + 1] + 1 << "\n";
            }
            break;
        case MeshFormat::Line:
            if (indices.size() > 1) {
                out << "l";
                for (uint32_t idx : indices) {
                    out << " " << idx + 1;
                }
                out << "\n";
            }
            break;
        case MeshFormat::PointCloud:
            break;
    }
    return out.str();
}

}  // namespace geomill
