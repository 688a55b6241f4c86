#include <gtest/gtest.h>
#include <common/error.hpp>
#include <lsystem/grammar.hpp>
#include <lsystem/turtle.hpp>

using namespace geomill;
using namespace geomill::lsystem;

namespace {

void expect_near(const Vec3& actual, const Vec3& expected) {
    EXPECT_NEAR(actual.x, expected.x, 1e-5f);
    EXPECT_NEAR(actual.y, expected.y, 1e-5f);
    EXPECT_NEAR(actual.z, expected.z, 1e-5f);
}

}  // namespace

// ============================================
// Grammar Tests
// ============================================

TEST(GrammarTest, ParsesRules) {
    Grammar g = parse_grammar("X", "X=F[+X]-X; F -> FF");
    EXPECT_EQ(g.axiom, "X");
    ASSERT_EQ(g.rules.size(), 2u);
    EXPECT_EQ(g.rules.at('X'), "F[+X]-X");
    EXPECT_EQ(g.rules.at('F'), "FF");
}

TEST(GrammarTest, NewlineSeparated) {
    Grammar g = parse_grammar("A", "A=AB\nB=A\n");
    EXPECT_EQ(g.rules.size(), 2u);
}

TEST(GrammarTest, EmptyAxiomRejected) {
    try {
        parse_grammar("  ", "");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.key(), "grammar");
    }
}

TEST(GrammarTest, MalformedRuleRejected) {
    EXPECT_THROW(parse_grammar("F", "FF=F"), ValidationError);
    EXPECT_THROW(parse_grammar("F", "F"), ValidationError);
}

TEST(GrammarTest, DuplicateRuleRejected) {
    try {
        parse_grammar("F", "F=FF;F=F+F");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.key(), "rules");
    }
}

TEST(GrammarTest, ExpandAlgae) {
    Grammar g = parse_grammar("A", "A=AB;B=A");
    EXPECT_EQ(expand(g, 0, 100), "A");
    EXPECT_EQ(expand(g, 1, 100), "AB");
    EXPECT_EQ(expand(g, 4, 100), "ABAABABA");
}

TEST(GrammarTest, ExpandLimit) {
    Grammar g = parse_grammar("F", "F=FF");
    EXPECT_EQ(expand(g, 3, 8).size(), 8u);
    EXPECT_THROW(expand(g, 4, 8), ExecutionError);
}

// ============================================
// Turtle Tests
// ============================================

TEST(TurtleTest, StartFrameIsIdentity) {
    TurtleState state;
    EXPECT_EQ(state.frame(), Mat4::identity());
}

TEST(TurtleTest, ForwardAndTurn) {
    Turtle turtle(TurtleParams{});
    auto strokes = turtle.run("F+F");
    ASSERT_EQ(strokes.size(), 2u);
    expect_near(strokes[0].from, Vec3(0, 0, 0));
    expect_near(strokes[0].to, Vec3(0, 1, 0));
    // '+' turns left around +Z
    expect_near(strokes[1].to, Vec3(-1, 1, 0));
    EXPECT_EQ(strokes[0].frame, Mat4::identity());
}

TEST(TurtleTest, MoveWithoutDrawing) {
    Turtle turtle(TurtleParams{});
    auto strokes = turtle.run("fF");
    ASSERT_EQ(strokes.size(), 1u);
    expect_near(strokes[0].from, Vec3(0, 1, 0));
}

TEST(TurtleTest, PushPopRestoresPose) {
    Turtle turtle(TurtleParams{});
    auto strokes = turtle.run("[+F]F");
    ASSERT_EQ(strokes.size(), 2u);
    expect_near(strokes[1].from, Vec3(0, 0, 0));
    expect_near(strokes[1].to, Vec3(0, 1, 0));
}

TEST(TurtleTest, PitchDown) {
    Turtle turtle(TurtleParams{});
    auto strokes = turtle.run("&F");
    ASSERT_EQ(strokes.size(), 1u);
    expect_near(strokes[0].to, Vec3(0, 0, -1));
}

TEST(TurtleTest, TurnAround) {
    Turtle turtle(TurtleParams{});
    auto strokes = turtle.run("|F");
    expect_near(strokes[0].to, Vec3(0, -1, 0));
}

TEST(TurtleTest, UnmatchedPopFails) {
    Turtle turtle(TurtleParams{});
    EXPECT_THROW(turtle.run("F]"), ExecutionError);
}

TEST(TurtleTest, JitterIsReproducible) {
    TurtleParams params;
    params.seed = 42;
    params.angle_jitter = 10.0f;
    auto a = Turtle(params).run("F+F+F+F");
    auto b = Turtle(params).run("F+F+F+F");
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].to, b[i].to);
    }
    // Jitter moves the last point off the unjittered square
    auto plain = Turtle(TurtleParams{}).run("F+F+F+F");
    EXPECT_GT(a.back().to.distance_to(plain.back().to), 1e-4f);
}

TEST(TurtleTest, JitterNeedsSeed) {
    TurtleParams params;
    params.angle_jitter = 10.0f;
    auto strokes = Turtle(params).run("F+F");
    expect_near(strokes[1].to, Vec3(-1, 1, 0));
}
