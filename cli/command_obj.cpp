#include "cli_common.hpp"
#include <common/logging.hpp>
#include <geometry/mesh_format.hpp>
#include <serialization/geometry_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/obj_writer.hpp>

namespace geomill::cli {

int command_obj(int argc, char** argv) {
    auto log = geomill::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: geomill_cli obj <response.json> -o <output.obj>\n";
            return 1;
        }

        log->info("Exporting OBJ from: {}", ctx.input_path);
        Document doc = Document::from_json(json::read_json_file(ctx.input_path));
        MeshFormat format = declared_format(doc.config).value_or(MeshFormat::Triangulated);

        std::string obj = to_obj(doc.geometry.vertices, doc.geometry.indices, format, "geomill");
        write_file(ctx.output_path, obj);

        log->info("Wrote OBJ to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << doc.geometry.vertices.size() << " vertices, "
                  << obj.size() << " bytes)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace geomill::cli
