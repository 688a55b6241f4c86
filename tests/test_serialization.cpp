#include <gtest/gtest.h>
#include <dispatch/data_logger.hpp>
#include <common/file_io.hpp>
#include <dispatch/dispatcher.hpp>
#include <serialization/geometry_json.hpp>
#include <serialization/json_serialization.hpp>
#include "test_helpers.hpp"
#include <filesystem>

using namespace geomill;
namespace fs = std::filesystem;

namespace {

// Fresh directory under the system temp path, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(fs::temp_directory_path() / ("geomill_test_" + name)) {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

size_t count_files(const fs::path& dir, const std::string& extension) {
    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == extension) {
            ++count;
        }
    }
    return count;
}

}  // namespace

// ============================================
// Document Tests
// ============================================

TEST(DocumentTest, ToJson) {
    Document doc;
    doc.geometry = test::unit_square_edges();
    doc.config.set("command", "centerline");
    nlohmann::json j = doc.to_json();
    EXPECT_EQ(j["vertices"].size(), 4u);
    EXPECT_EQ(j["vertices"][2][0].get<float>(), 1.0f);
    EXPECT_EQ(j["indices"].size(), 8u);
    EXPECT_TRUE(j["matrices"].empty());
    EXPECT_EQ(j["config"]["command"], "centerline");
}

TEST(DocumentTest, FromJson) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "vertices": [[0, 0, 0], [1, 0, 0], [1, 1, 0]],
        "indices": [0, 1, 2],
        "config": {"command": "sdf_remesh", "resolution": 32, "debug_chunks": true, "iso_value": 0.5}
    })");
    Document doc = Document::from_json(j);
    EXPECT_EQ(doc.geometry.vertices.size(), 3u);
    EXPECT_EQ(doc.geometry.indices.size(), 3u);
    EXPECT_TRUE(doc.geometry.matrices.empty());
    EXPECT_EQ(doc.config.get("command"), "sdf_remesh");
    EXPECT_EQ(doc.config.get("resolution"), "32");
    EXPECT_EQ(doc.config.get("debug_chunks"), "true");
    EXPECT_EQ(doc.config.get("iso_value"), "0.5");
}

TEST(DocumentTest, MissingSectionsAreEmpty) {
    Document doc = Document::from_json(nlohmann::json::object());
    EXPECT_TRUE(doc.geometry.empty());
    EXPECT_TRUE(doc.config.empty());
}

TEST(DocumentTest, BadVertexThrows) {
    nlohmann::json j = nlohmann::json::parse(R"({"vertices": [[0, 0]]})");
    EXPECT_THROW(Document::from_json(j), std::exception);
}

TEST(DocumentTest, NestedConfigValueThrows) {
    nlohmann::json j = nlohmann::json::parse(R"({"config": {"command": ["a"]}})");
    EXPECT_THROW(Document::from_json(j), std::runtime_error);
}

TEST(JsonFileTest, WriteThenRead) {
    TempDir dir("json_file");
    std::string path = (dir.path() / "doc.json").string();
    Document doc;
    doc.geometry = test::flat_quad(0.0f, 2.0f, 1.0f);
    doc.config.set("command", "toolpath");
    json::write_json_file(path, doc.to_json());

    Document back = Document::from_json(json::read_json_file(path));
    EXPECT_EQ(back.config, doc.config);
    EXPECT_EQ(back.geometry.indices, doc.geometry.indices);
    ASSERT_EQ(back.geometry.vertices.size(), 4u);
    EXPECT_EQ(back.geometry.vertices[2], Vec3(2.0f, 2.0f, 1.0f));
}

TEST(JsonFileTest, MissingFileThrows) {
    EXPECT_THROW(json::read_json_file("/nonexistent/geomill/doc.json"), std::runtime_error);
}

TEST(JsonFileTest, InvalidJsonNamesFile) {
    TempDir dir("json_invalid");
    std::string path = (dir.path() / "broken.json").string();
    write_file(path, "{\"config\": ");
    try {
        json::read_json_file(path);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path), std::string::npos);
    }
}

TEST(JsonFileTest, TimestampFormat) {
    std::string stamp = json::get_timestamp();
    ASSERT_EQ(stamp.size(), 20u);
    EXPECT_EQ(stamp[10], 'T');
    EXPECT_EQ(stamp.back(), 'Z');
}

// ============================================
// Data Logger Tests
// ============================================

TEST(DataLoggerTest, RecordsCall) {
    TempDir dir("data_logger");
    DataLogger logger(dir.path());
    ConfigMap config{{"command", "centerline"}, {"tolerance", "0.1"}, {"mesh.format", "line_chunks"}};
    std::string stamp = logger.record(config, test::unit_square_edges());
    ASSERT_FALSE(stamp.empty());

    nlohmann::json j = json::read_json_file((dir.path() / (stamp + ".json")).string());
    EXPECT_EQ(j["config"]["command"], "centerline");
    EXPECT_EQ(j["vertex_count"], 4);
    EXPECT_EQ(j["index_count"], 8);
    EXPECT_TRUE(fs::exists(dir.path() / (stamp + ".0.obj")));
}

TEST(DataLoggerTest, StampsAreUnique) {
    TempDir dir("data_logger_unique");
    DataLogger logger(dir.path());
    std::string first = logger.record({{"command", "x"}}, GeometryBuffer{});
    std::string second = logger.record({{"command", "x"}}, GeometryBuffer{});
    EXPECT_NE(first, second);
    EXPECT_EQ(count_files(dir.path(), ".json"), 2u);
}

TEST(DataLoggerTest, MissingDirectoryDoesNotThrow) {
    DataLogger logger("/nonexistent/geomill/dumps");
    EXPECT_TRUE(logger.record({{"command", "x"}}, GeometryBuffer{}).empty());
}

TEST(DataLoggerTest, DispatcherRecordsBeforeRouting) {
    TempDir dir("data_logger_dispatch");
    Dispatcher dispatcher(OperationRegistry::instance(), DataLogger(dir.path()));
    OperationResult result = dispatcher.process({{"command", "unknown_op"}}, GeometryBuffer{});
    EXPECT_TRUE(is_error(result));
    EXPECT_EQ(count_files(dir.path(), ".json"), 1u);
}
