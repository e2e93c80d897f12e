#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

#include "arrowpath_planner.hpp"

using namespace arrowpath;

class StepPlannerTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(StepPlannerTest, NoStepsGiveEmptySequence) {
    PointSequence points = plan(Point(3.0f, 4.0f), {});
    EXPECT_TRUE(points.empty());
    EXPECT_TRUE(flatten_coordinates(points).empty());
}

TEST_F(StepPlannerTest, StepCountMatchesPointCount) {
    for (size_t k = 1; k <= 6; k++) {
        StepList list;
        for (size_t i = 0; i < k; i++) {
            list.push_back(steps::offset(10.0f, (i % 2 == 0) ? 5.0f : -5.0f));
        }
        PointSequence points = plan(Point(0.0f, 0.0f), list);
        EXPECT_EQ(points.size(), k) << "for " << k << " steps";
    }
}

TEST_F(StepPlannerTest, SingleStepToTargetTrimsOrigin) {
    PointSequence points = plan(Point(0.0f, 0.0f), { steps::to(Point(10.0f, 5.0f)) });

    ASSERT_EQ(points.size(), 1u);
    EXPECT_EQ(points[0], Point(10.0f, 5.0f));

    std::vector<float> coords = flatten_coordinates(points);
    ASSERT_EQ(coords.size(), 2u);
    EXPECT_FLOAT_EQ(coords[0], 10.0f);
    EXPECT_FLOAT_EQ(coords[1], 5.0f);
}

TEST_F(StepPlannerTest, EachStepReceivesPreviousOutput) {
    std::vector<Point> seen;
    auto recording = [&seen](float dx, float dy) -> Step {
        return [&seen, dx, dy](float x, float y) {
            seen.emplace_back(x, y);
            return Point(x + dx, y + dy);
        };
    };

    PointSequence points = plan(Point(1.0f, 2.0f), { recording(3.0f, 0.0f), recording(0.0f, 4.0f) });

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], Point(1.0f, 2.0f));
    EXPECT_EQ(seen[1], Point(4.0f, 2.0f));

    ASSERT_EQ(points.size(), 2u);
    EXPECT_EQ(points[0], Point(4.0f, 2.0f));
    EXPECT_EQ(points[1], Point(4.0f, 6.0f));
}

TEST_F(StepPlannerTest, AnchorStepReadsPositionWhenPlanned) {
    PointAnchor target(1.0f, 1.0f);
    Step step = steps::to(target);
    target.p = Point(5.0f, 7.0f);

    PointSequence points = plan(Point(0.0f, 0.0f), { step });
    ASSERT_EQ(points.size(), 1u);
    EXPECT_EQ(points[0], Point(5.0f, 7.0f));
}

TEST_F(StepPlannerTest, AxisAlignedSteps) {
    PointSequence points = plan(Point(10.0f, 10.0f), {
        steps::horizontal_to(60.0f),
        steps::vertical_to(-20.0f),
        steps::horizontal_to(0.0f),
    });

    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points[0], Point(60.0f, 10.0f));
    EXPECT_EQ(points[1], Point(60.0f, -20.0f));
    EXPECT_EQ(points[2], Point(0.0f, -20.0f));
}

TEST_F(StepPlannerTest, FlattenKeepsOrder) {
    PointSequence points = { Point(1, 2), Point(3, 4), Point(5, 6) };
    std::vector<float> expected = { 1, 2, 3, 4, 5, 6 };
    EXPECT_EQ(flatten_coordinates(points), expected);
}

TEST_F(StepPlannerTest, ValidatePointsRejectsNonFinite) {
    PointSequence good = { Point(0, 0), Point(1, 1) };
    EXPECT_TRUE(validate_points(good).is_ok());

    PointSequence bad = { Point(0, 0), Point(std::numeric_limits<float>::quiet_NaN(), 1) };
    auto result = validate_points(bad);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.unwrap_err(), Error::NonFiniteCoordinate);

    PointSequence inf = { Point(std::numeric_limits<float>::infinity(), 0) };
    EXPECT_TRUE(validate_points(inf).is_err());
}

TEST_F(StepPlannerTest, UnwrapOnWrongAlternativeThrows) {
    PointSequence bad = { Point(std::numeric_limits<float>::quiet_NaN(), 0) };
    auto result = validate_points(bad);
    EXPECT_THROW(result.unwrap(), std::runtime_error);

    auto ok = validate_points({});
    EXPECT_THROW(ok.unwrap_err(), std::runtime_error);
}
