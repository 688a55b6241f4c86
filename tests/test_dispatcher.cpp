#include <gtest/gtest.h>
#include <dispatch/dispatcher.hpp>
#include "test_helpers.hpp"
#include <stdexcept>
#include <string>

using namespace geomill;

namespace {

Dispatcher quiet_dispatcher() {
    return Dispatcher(OperationRegistry::instance(), std::nullopt);
}

// Counts execute calls and can fail the way a numeric back end does
class CountingDispatcher : public Dispatcher {
public:
    explicit CountingDispatcher(bool fail_out_of_range = false)
        : Dispatcher(OperationRegistry::instance(), std::nullopt),
          fail_out_of_range_(fail_out_of_range) {}

    mutable int execute_calls = 0;

protected:
    OperationResult execute(const Operation& op, const ConfigMap& config,
                            const GeometryBuffer& input) const override {
        ++execute_calls;
        if (fail_out_of_range_) {
            throw std::out_of_range("vector::_M_range_check");
        }
        return Dispatcher::execute(op, config, input);
    }

private:
    bool fail_out_of_range_;
};

}  // namespace

// ============================================
// Routing Tests
// ============================================

TEST(DispatcherTest, CenterlineOfSquare) {
    Dispatcher dispatcher = quiet_dispatcher();
    ConfigMap config{{"command", "centerline"}, {"tolerance", "0.1"}};
    OperationResult result = dispatcher.process(config, test::unit_square_edges());
    EXPECT_FALSE(is_error(result)) << result.config.get("error").value_or("");
    EXPECT_EQ(result.config.get("mesh.format"), "line_chunks");
    EXPECT_FALSE(result.geometry.indices.empty());
    EXPECT_EQ(result.geometry.indices.size() % 2, 0u);
}

TEST(DispatcherTest, MissingCommand) {
    Dispatcher dispatcher = quiet_dispatcher();
    OperationResult result = dispatcher.process({{"tolerance", "0.1"}}, test::unit_square_edges());
    EXPECT_EQ(result.config.get("error"), "missing command");
    EXPECT_TRUE(result.geometry.empty());
}

TEST(DispatcherTest, UnknownCommand) {
    Dispatcher dispatcher = quiet_dispatcher();
    OperationResult result = dispatcher.process({{"command", "unknown_op"}}, test::unit_square_edges());
    EXPECT_EQ(result.config.get("error"), "unknown command: unknown_op");
    EXPECT_EQ(result.config.size(), 1u);
    EXPECT_TRUE(result.geometry.empty());
}

TEST(DispatcherTest, ValidationFailureBecomesError) {
    Dispatcher dispatcher = quiet_dispatcher();
    ConfigMap config{{"command", "sdf_remesh"}, {"resolution", "0"}};
    OperationResult result = dispatcher.process(config, test::box_mesh(Vec3(0, 0, 0), Vec3(1, 1, 1)));
    EXPECT_EQ(result.config.get("error"), "resolution must be positive");
    EXPECT_TRUE(result.geometry.empty());
}

TEST(DispatcherTest, ValidationFailureSkipsExecute) {
    CountingDispatcher dispatcher;
    GeometryBuffer box = test::box_mesh(Vec3(0, 0, 0), Vec3(1, 1, 1));
    OperationResult rejected = dispatcher.process({{"command", "sdf_remesh"}, {"resolution", "0"}}, box);
    EXPECT_TRUE(is_error(rejected));
    EXPECT_EQ(dispatcher.execute_calls, 0);

    OperationResult accepted = dispatcher.process({{"command", "sdf_remesh"}, {"resolution", "8"}}, box);
    EXPECT_FALSE(is_error(accepted)) << accepted.config.get("error").value_or("");
    EXPECT_EQ(dispatcher.execute_calls, 1);
}

TEST(DispatcherTest, StandardExceptionBecomesInternalFailure) {
    CountingDispatcher dispatcher(true);
    ConfigMap config{{"command", "convex_hull_2d"}};
    OperationResult result = dispatcher.process(config, test::unit_square_edges());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(dispatcher.execute_calls, 1);
    EXPECT_EQ(result.config.get("error"), "convex_hull_2d: internal failure: vector::_M_range_check");
    EXPECT_TRUE(result.geometry.empty());
}

TEST(DispatcherTest, NonFiniteOutputBecomesError) {
    Dispatcher dispatcher = quiet_dispatcher();
    ConfigMap config{{"command", "lsystem"}, {"grammar", "FFFFFFFF"}, {"iterations", "0"}, {"step", "1e38"}};
    OperationResult result = dispatcher.process(config, GeometryBuffer{});
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(result.config.get("error")->find("lsystem"), std::string::npos);
    EXPECT_TRUE(result.geometry.empty());
}

TEST(DispatcherTest, StepOutsideFloatRangeIsRejected) {
    CountingDispatcher dispatcher;
    for (const char* step : {"1e300", "1e-50"}) {
        ConfigMap config{{"command", "lsystem"}, {"grammar", "F+F"}, {"iterations", "0"}, {"step", step}};
        OperationResult result = dispatcher.process(config, GeometryBuffer{});
        EXPECT_TRUE(is_error(result)) << step;
    }
    EXPECT_EQ(dispatcher.execute_calls, 0);
}

TEST(DispatcherTest, ExecutionFailureBecomesError) {
    Dispatcher dispatcher = quiet_dispatcher();
    ConfigMap config{{"command", "convex_hull_2d"}};
    OperationResult result = dispatcher.process(config, GeometryBuffer{});
    EXPECT_TRUE(is_error(result));
    EXPECT_TRUE(result.geometry.empty());
}

TEST(DispatcherTest, ConfigIsNotShared) {
    Dispatcher dispatcher = quiet_dispatcher();
    ConfigMap config{{"command", "convex_hull_2d"}, {"unrelated", "x"}};
    GeometryBuffer cloud = test::unit_square_edges();
    cloud.indices.clear();
    OperationResult result = dispatcher.process(config, cloud);
    EXPECT_FALSE(result.config.has("unrelated"));
    EXPECT_FALSE(result.config.has("command"));
}

TEST(DispatcherTest, Deterministic) {
    Dispatcher dispatcher = quiet_dispatcher();
    ConfigMap config{{"command", "sdf_remesh"}, {"resolution", "16"}};
    GeometryBuffer box = test::box_mesh(Vec3(0, 0, 0), Vec3(1, 1, 1));
    OperationResult first = dispatcher.process(config, box);
    OperationResult second = dispatcher.process(config, box);
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(first.geometry.vertices.size(), second.geometry.vertices.size());
    EXPECT_EQ(first.geometry.indices, second.geometry.indices);
    for (size_t i = 0; i < first.geometry.vertices.size(); ++i) {
        EXPECT_EQ(first.geometry.vertices[i], second.geometry.vertices[i]);
    }
    EXPECT_EQ(first.config, second.config);
}

TEST(DispatcherTest, ErrorResultShape) {
    OperationResult result = error_result("boom");
    EXPECT_TRUE(is_error(result));
    EXPECT_EQ(result.config.size(), 1u);
    EXPECT_TRUE(result.geometry.empty());
}
