#include <gtest/gtest.h>
#include <stdexcept>

#include "scene/diagnostic_boundary.hpp"

using namespace sheetscape;

TEST(DiagnosticBoundary, PassesThroughSuccess)
{
    DiagnosticBoundary b;
    int                calls = 0;
    EXPECT_TRUE(b.run([&]() { ++calls; }));
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(b.has_error());
}

TEST(DiagnosticBoundary, LatchesFirstFailure)
{
    DiagnosticBoundary b;
    EXPECT_FALSE(b.run([]() { throw std::runtime_error("layout exploded"); }));
    EXPECT_TRUE(b.has_error());
    EXPECT_EQ(b.message(), "layout exploded");

    int calls = 0;
    EXPECT_FALSE(b.run([&]() { ++calls; }));
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(b.message(), "layout exploded");
}

TEST(DiagnosticBoundary, ResetResumes)
{
    DiagnosticBoundary b;
    b.run([]() { throw std::logic_error("bad"); });
    b.reset();
    EXPECT_FALSE(b.has_error());
    EXPECT_TRUE(b.message().empty());
    EXPECT_TRUE(b.run([]() {}));
}
