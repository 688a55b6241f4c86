#include <gtest/gtest.h>
#include <common/error.hpp>
#include <operations/operation_registry.hpp>
#include "test_helpers.hpp"
#include <limits>
#include <string>
#include <vector>

using namespace geomill;

namespace {

std::string validation_message(const Operation& op, const ConfigMap& config) {
    try {
        validate_operation(op, config);
    } catch (const ValidationError& e) {
        return e.what();
    }
    return "";
}

}  // namespace

// ============================================
// Registry Tests
// ============================================

TEST(OperationRegistryTest, ListsEveryCommand) {
    std::vector<std::string> expected = {
        "2d_outline", "centerline", "convex_hull_2d", "discretize", "lsystem",
        "sdf_remesh", "simplify_rdp", "toolpath", "voronoi_diagram"
    };
    EXPECT_EQ(OperationRegistry::instance().commands(), expected);
}

TEST(OperationRegistryTest, LookupIsExact) {
    const auto& registry = OperationRegistry::instance();
    const Operation* op = registry.find("lsystem");
    ASSERT_NE(op, nullptr);
    EXPECT_STREQ(operation_name(*op), "lsystem");
    EXPECT_EQ(registry.find("LSystem"), nullptr);
    EXPECT_EQ(registry.find(""), nullptr);
    EXPECT_EQ(registry.find("unknown_op"), nullptr);
}

// ============================================
// Validation Tests
// ============================================

TEST(OperationValidationTest, SdfRemeshResolution) {
    Operation op = SdfRemeshOp{};
    EXPECT_EQ(validation_message(op, {{"resolution", "0"}}), "resolution must be positive");
    EXPECT_EQ(validation_message(op, {{"resolution", "-3"}}), "resolution must be positive");
    EXPECT_EQ(validation_message(op, {}), "missing required parameter: resolution");
    EXPECT_FALSE(validation_message(op, {{"resolution", "1001"}}).empty());
    EXPECT_EQ(validation_message(op, {{"resolution", "64"}}), "");
}

TEST(OperationValidationTest, ToolpathParameters) {
    Operation op = ToolpathOp{};
    ConfigMap config{{"tool_diameter", "2"}, {"step_over", "1.5"}, {"strategy", "meander"}};
    EXPECT_EQ(validation_message(op, config), "step_over must be in (0, 1]");

    config.set("step_over", "0.5");
    EXPECT_EQ(validation_message(op, config), "");

    config.set("strategy", "spiral");
    EXPECT_FALSE(validation_message(op, config).empty());

    config.set("strategy", "raster");
    config.set("mesh.format", "line_chunks");
    EXPECT_FALSE(validation_message(op, config).empty());
}

TEST(OperationValidationTest, ReportsOffendingKey) {
    Operation op = CenterlineOp{};
    try {
        validate_operation(op, {{"tolerance", "abc"}});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.key(), "tolerance");
    }
}

TEST(OperationValidationTest, CenterlineAngleRange) {
    Operation op = CenterlineOp{};
    EXPECT_EQ(validation_message(op, {{"tolerance", "0.1"}, {"angle", "45"}}), "");
    EXPECT_FALSE(validation_message(op, {{"tolerance", "0.1"}, {"angle", "91"}}).empty());
}

TEST(OperationValidationTest, VoronoiRejectsTriangles) {
    Operation op = VoronoiDiagramOp{};
    EXPECT_EQ(validation_message(op, {}), "");
    EXPECT_FALSE(validation_message(op, {{"mesh.format", "triangulated"}}).empty());
}

TEST(OperationValidationTest, LSystemIterations) {
    Operation op = LSystemOp{};
    EXPECT_EQ(validation_message(op, {{"grammar", "F"}, {"iterations", "3"}}), "");
    EXPECT_FALSE(validation_message(op, {{"grammar", "F"}, {"iterations", "17"}}).empty());
    EXPECT_EQ(validation_message(op, {{"iterations", "3"}}), "missing required parameter: grammar");
}

TEST(OperationValidationTest, SdfRemeshIsoValueRange) {
    Operation op = SdfRemeshOp{};
    EXPECT_EQ(validation_message(op, {{"resolution", "10"}, {"iso_value", "-0.5"}}), "");
    std::string message = validation_message(op, {{"resolution", "10"}, {"iso_value", "1e30"}});
    EXPECT_EQ(message.rfind("iso_value must be in [", 0), 0u) << message;
    EXPECT_FALSE(validation_message(op, {{"resolution", "10"}, {"radius", "1e40"}}).empty());
}

TEST(OperationValidationTest, FloatParametersMustSurviveNarrowing) {
    Operation lsystem = LSystemOp{};
    ConfigMap config{{"grammar", "F+F"}, {"iterations", "0"}, {"step", "1e300"}};
    EXPECT_FALSE(validation_message(lsystem, config).empty());
    config.set("step", "1e-50");
    EXPECT_EQ(validation_message(lsystem, config), "step must be positive");
    config.set("step", "1");
    config.set("angle", "-1e39");
    EXPECT_FALSE(validation_message(lsystem, config).empty());

    Operation toolpath = ToolpathOp{};
    ConfigMap tool{{"tool_diameter", "1e-46"}, {"step_over", "0.5"}, {"strategy", "meander"}};
    EXPECT_EQ(validation_message(toolpath, tool), "tool_diameter must be positive");
    tool.set("tool_diameter", "2");
    tool.set("safe_z", "1e39");
    EXPECT_FALSE(validation_message(toolpath, tool).empty());
}

TEST(OperationValidationTest, DiscretizeLength) {
    Operation op = DiscretizeOp{};
    EXPECT_EQ(validation_message(op, {}), "missing required parameter: discretize_length");
    EXPECT_EQ(validation_message(op, {{"discretize_length", "0"}}), "discretize_length must be positive");
    EXPECT_FALSE(validation_message(op, {{"discretize_length", "150"}}).empty());
    EXPECT_EQ(validation_message(op, {{"discretize_length", "10"}}), "");
    EXPECT_FALSE(validation_message(op, {{"discretize_length", "10"}, {"mesh.format", "triangulated"}}).empty());
}

TEST(OperationValidationTest, OutlineNeedsTriangles) {
    Operation op = OutlineOp{};
    EXPECT_EQ(validation_message(op, {}), "");
    EXPECT_FALSE(validation_message(op, {{"mesh.format", "line_chunks"}}).empty());
}

// ============================================
// Input Format Tests
// ============================================

TEST(InputFormatTest, GuessesFromIndexCount) {
    EXPECT_EQ(input_format({}, 0), MeshFormat::PointCloud);
    EXPECT_EQ(input_format({}, 6), MeshFormat::Triangulated);
    EXPECT_EQ(input_format({}, 4), MeshFormat::LineChunks);
    EXPECT_EQ(input_format({{"mesh.format", "line"}}, 6), MeshFormat::Line);
}

// ============================================
// L-System Tests
// ============================================

TEST(LSystemOpTest, SeedModeEmitsOneMatrixPerStroke) {
    GeometryBuffer seed = test::box_mesh(Vec3(0, 0, 0), Vec3(1, 1, 1));
    ConfigMap config{{"grammar", "F"}, {"iterations", "0"}};
    OperationResult result = execute_operation(LSystemOp{}, config, seed);

    EXPECT_EQ(result.geometry.vertices.size(), seed.vertices.size());
    EXPECT_EQ(result.geometry.indices, seed.indices);
    ASSERT_EQ(result.geometry.matrix_count(), 1u);
    Mat4 identity = Mat4::identity();
    for (size_t i = 0; i < 16; ++i) {
        EXPECT_FLOAT_EQ(result.geometry.matrices[i], identity.m[i]);
    }
    EXPECT_EQ(result.config.get("lsystem.strokes"), "1");
    EXPECT_EQ(result.config.get("mesh.format"), "triangulated");
}

TEST(LSystemOpTest, LineModeWeldsClosedLoop) {
    ConfigMap config{{"grammar", "F+F+F+F"}, {"iterations", "0"}, {"angle", "90"}};
    OperationResult result = execute_operation(LSystemOp{}, config, GeometryBuffer{});
    EXPECT_EQ(result.geometry.vertices.size(), 4u);
    EXPECT_EQ(result.geometry.indices.size(), 8u);
    EXPECT_EQ(result.config.get("lsystem.strokes"), "4");
    EXPECT_EQ(result.config.get("mesh.format"), "line_chunks");
}

TEST(LSystemOpTest, GrowsWithIterations) {
    ConfigMap config{{"grammar", "F"}, {"rules", "F=F+F-F"}, {"iterations", "2"}};
    OperationResult result = execute_operation(LSystemOp{}, config, GeometryBuffer{});
    EXPECT_EQ(result.config.get("lsystem.strokes"), "9");
}

TEST(LSystemOpTest, SymbolLimit) {
    ConfigMap config{{"grammar", "F"}, {"rules", "F=FF"}, {"iterations", "16"}, {"max_symbols", "1000"}};
    EXPECT_THROW(execute_operation(LSystemOp{}, config, GeometryBuffer{}), ExecutionError);
}

TEST(LSystemOpTest, SdfModeBuildsMesh) {
    ConfigMap config{{"grammar", "F"}, {"iterations", "0"}, {"sdf_divisions", "20"}};
    OperationResult result = execute_operation(LSystemOp{}, config, GeometryBuffer{});
    EXPECT_FALSE(result.geometry.vertices.empty());
    EXPECT_EQ(result.geometry.indices.size() % 3, 0u);
    EXPECT_EQ(result.config.get("mesh.format"), "triangulated");
    EXPECT_TRUE(result.config.has("sdf.chunks"));
}

// ============================================
// SDF Remesh Tests
// ============================================

TEST(SdfRemeshOpTest, PointBecomesSphere) {
    GeometryBuffer point;
    point.add_vertex(Vec3(1, 2, 3));
    ConfigMap config{{"resolution", "20"}, {"radius", "1"}};
    OperationResult result = execute_operation(SdfRemeshOp{}, config, point);
    ASSERT_FALSE(result.geometry.vertices.empty());
    EXPECT_EQ(result.geometry.indices.size() % 3, 0u);
    for (const auto& v : result.geometry.vertices) {
        EXPECT_NEAR((v - Vec3(1, 2, 3)).length(), 1.0f, 0.1f);
    }
    EXPECT_EQ(result.config.get("mesh.format"), "triangulated");
}

TEST(SdfRemeshOpTest, SinglePointNeedsRadius) {
    GeometryBuffer point;
    point.add_vertex(Vec3(0, 0, 0));
    EXPECT_THROW(execute_operation(SdfRemeshOp{}, {{"resolution", "20"}}, point), ExecutionError);
}

TEST(SdfRemeshOpTest, EmptyInput) {
    EXPECT_THROW(execute_operation(SdfRemeshOp{}, {{"resolution", "20"}}, GeometryBuffer{}),
                 ExecutionError);
}

// ============================================
// Toolpath Tests
// ============================================

TEST(ToolpathOpTest, MeanderOverFlatPart) {
    GeometryBuffer part = test::flat_quad(0.0f, 10.0f, 1.0f);
    ConfigMap config{{"tool_diameter", "2"}, {"step_over", "0.5"}, {"strategy", "meander"}};
    OperationResult result = execute_operation(ToolpathOp{}, config, part);
    EXPECT_EQ(result.config.get("toolpath.points"), "121");
    EXPECT_EQ(result.config.get("toolpath.lines"), "11");
    EXPECT_EQ(result.config.get("mesh.format"), "line_chunks");
    ASSERT_EQ(result.geometry.vertices.size(), 121u);
    EXPECT_EQ(result.geometry.indices.size(), 240u);
    EXPECT_EQ(result.geometry.indices[2], 1u);
    EXPECT_EQ(result.geometry.indices[3], 2u);
}

TEST(ToolpathOpTest, RasterAddsRetracts) {
    GeometryBuffer part = test::flat_quad(0.0f, 10.0f, 1.0f);
    ConfigMap config{{"tool_diameter", "2"}, {"step_over", "0.5"}, {"strategy", "raster"},
                     {"safe_z", "7"}};
    OperationResult result = execute_operation(ToolpathOp{}, config, part);
    EXPECT_EQ(result.config.get("toolpath.points"), "141");
    EXPECT_FLOAT_EQ(result.geometry.vertices[11].z, 7.0f);
}

TEST(ToolpathOpTest, RequiresTriangles) {
    ConfigMap config{{"tool_diameter", "2"}, {"step_over", "0.5"}, {"strategy", "meander"}};
    EXPECT_THROW(execute_operation(ToolpathOp{}, config, test::unit_square_edges()), ExecutionError);
}

// ============================================
// Polyline Operation Tests
// ============================================

TEST(SimplifyRdpOpTest, DropsNearlyCollinearPoints) {
    GeometryBuffer line;
    line.vertices = {{0, 0, 0}, {1, 0.01f, 0}, {2, -0.01f, 0}, {3, 0.02f, 0}, {4, 0, 0}};
    line.indices = {0, 1, 1, 2, 2, 3, 3, 4};
    OperationResult result = execute_operation(SimplifyRdpOp{}, {{"epsilon", "0.1"}}, line);
    EXPECT_EQ(result.geometry.vertices.size(), 2u);
    EXPECT_EQ(result.geometry.indices.size(), 2u);
    EXPECT_EQ(result.config.get("mesh.format"), "line_chunks");
}

TEST(SimplifyRdpOpTest, KeepsCorners) {
    OperationResult result = execute_operation(SimplifyRdpOp{}, {{"epsilon", "0.01"}},
                                               test::unit_square_edges());
    EXPECT_EQ(result.geometry.vertices.size(), 4u);
    EXPECT_EQ(result.geometry.indices.size(), 8u);
}

TEST(ConvexHullOpTest, IgnoresInteriorPoints) {
    GeometryBuffer cloud = test::unit_square_edges();
    cloud.indices.clear();
    cloud.add_vertex(Vec3(0.5f, 0.5f, 0.0f));
    OperationResult result = execute_operation(ConvexHull2dOp{}, {}, cloud);
    EXPECT_EQ(result.geometry.vertices.size(), 4u);
    EXPECT_EQ(result.geometry.indices.size(), 8u);
    EXPECT_EQ(result.geometry.indices.back(), 0u);
}

TEST(ConvexHullOpTest, CollinearPointsFail) {
    GeometryBuffer cloud;
    cloud.vertices = {{0, 0, 0}, {1, 1, 0}, {2, 2, 0}};
    EXPECT_THROW(execute_operation(ConvexHull2dOp{}, {}, cloud), ExecutionError);
}

TEST(OutlineOpTest, DropsSharedDiagonal) {
    GeometryBuffer quad = test::flat_quad(0.0f, 2.0f, 0.0f);
    OperationResult result = execute_operation(OutlineOp{}, {}, quad);
    EXPECT_EQ(result.config.get("mesh.format"), "line_chunks");
    EXPECT_EQ(result.geometry.vertices.size(), 4u);
    std::vector<uint32_t> expected{0, 1, 1, 2, 2, 3, 3, 0};
    EXPECT_EQ(result.geometry.indices, expected);
}

TEST(OutlineOpTest, KeepsHoleBoundary) {
    // 3x3 grid of quads with the middle one missing: outer ring of 12 edges, hole of 4
    GeometryBuffer grid;
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            grid.add_vertex(Vec3(static_cast<float>(x), static_cast<float>(y), 0.0f));
        }
    }
    for (uint32_t y = 0; y < 3; ++y) {
        for (uint32_t x = 0; x < 3; ++x) {
            if (x == 1 && y == 1) {
                continue;
            }
            uint32_t a = y * 4 + x;
            grid.add_triangle(a, a + 1, a + 5);
            grid.add_triangle(a, a + 5, a + 4);
        }
    }
    OperationResult result = execute_operation(OutlineOp{}, {}, grid);
    EXPECT_EQ(result.geometry.indices.size(), 32u);
    EXPECT_EQ(result.geometry.vertices.size(), 16u);
}

TEST(OutlineOpTest, RejectsRepeatedVertexAndNonPlanarInput) {
    GeometryBuffer bad = test::flat_quad(0.0f, 1.0f, 0.0f);
    bad.indices = {0, 1, 1};
    EXPECT_THROW(execute_operation(OutlineOp{}, {}, bad), ExecutionError);
    EXPECT_THROW(execute_operation(OutlineOp{}, {}, test::box_mesh(Vec3(0, 0, 0), Vec3(1, 1, 1))),
                 ExecutionError);
    EXPECT_THROW(execute_operation(OutlineOp{}, {}, GeometryBuffer{}), ExecutionError);
}

TEST(DiscretizeOpTest, SplitsLongEdges) {
    OperationResult result = execute_operation(DiscretizeOp{}, {{"discretize_length", "25"}},
                                               test::unit_square_edges());
    EXPECT_EQ(result.config.get("mesh.format"), "line_chunks");
    EXPECT_EQ(result.geometry.vertices.size(), 16u);
    ASSERT_EQ(result.geometry.indices.size(), 32u);
    for (size_t i = 0; i < result.geometry.indices.size(); i += 2) {
        const Vec3& a = result.geometry.vertices[result.geometry.indices[i]];
        const Vec3& b = result.geometry.vertices[result.geometry.indices[i + 1]];
        EXPECT_NEAR(a.distance_to(b), 0.25f, 1e-5f);
    }
}

TEST(DiscretizeOpTest, ShortEdgesAndLooseVerticesSurvive) {
    GeometryBuffer input = test::unit_square_edges();
    input.add_vertex(Vec3(0.5f, 0.5f, 0.0f));
    OperationResult result = execute_operation(DiscretizeOp{}, {{"discretize_length", "100"}}, input);
    EXPECT_EQ(result.geometry.vertices.size(), 5u);
    EXPECT_EQ(result.geometry.indices.size(), 8u);
}

TEST(DiscretizeOpTest, RejectsNonFiniteInput) {
    GeometryBuffer input = test::unit_square_edges();
    input.vertices[2].x = std::numeric_limits<float>::infinity();
    EXPECT_THROW(execute_operation(DiscretizeOp{}, {{"discretize_length", "10"}}, input), ExecutionError);
    EXPECT_THROW(execute_operation(DiscretizeOp{}, {{"discretize_length", "10"}}, GeometryBuffer{}),
                 ExecutionError);
}
