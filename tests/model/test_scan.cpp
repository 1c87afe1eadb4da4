/**
 * @file test_scan.cpp
 * @brief Unit tests for slit scans
 */

#include <gtest/gtest.h>

#include "exception/exception.hpp"
#include "model/scan.hpp"

namespace tessera::model::test {

class ScanTest : public ::testing::Test {
protected:
    static constexpr double EPSILON = 1e-9;

    static ObservationContext context() {
        return {"CALLISTO", tools::parseIsoTime("2031-09-27T09:40:00"),
                tools::TimeUnit::Minutes, tools::AngularUnit::Degrees};
    }

    static ScanGeometry twoLines() {
        ScanGeometry lines;
        lines.fovWidth = 3.4;
        lines.scanSlewRate = 0.00859 / (2.0 / 60.0);
        lines.lineSlewTime = 5.0;
        lines.borderSlewTime = 5.0;
        lines.start = {-1.5, 3.3};
        lines.delta = {3.06, -6.5};
        lines.numberOfLines = 2;
        return lines;
    }
};

TEST_F(ScanTest, DurationAndEndTime) {
    const Scan scan(context(), twoLines());
    const double expected = 2.0 * 5.0 + 2.0 * 6.5 / (0.00859 / (2.0 / 60.0)) + 5.0;
    EXPECT_NEAR(scan.duration(), expected, EPSILON);
    EXPECT_EQ(tools::formatIsoTime(scan.endTime()), "2031-09-27T10:46:36");
}

TEST_F(ScanTest, SingleLineHasNoLineSlew) {
    auto lines = twoLines();
    lines.numberOfLines = 1;
    const Scan scan(context(), lines);
    EXPECT_NEAR(scan.duration(), 10.0 + 6.5 / lines.scanSlewRate, EPSILON);
}

TEST_F(ScanTest, CentersSitMidHeight) {
    const Scan scan(context(), twoLines());
    const auto centers = scan.centerPoints();
    ASSERT_EQ(centers.size(), 2u);
    EXPECT_NEAR(centers[0].x, -1.5, EPSILON);
    EXPECT_NEAR(centers[1].x, 1.56, EPSILON);
    EXPECT_NEAR(centers[0].y, 0.05, EPSILON);
    EXPECT_NEAR(centers[1].y, 0.05, EPSILON);
}

TEST_F(ScanTest, RectanglesSpanLineHeight) {
    const Scan scan(context(), twoLines());
    const auto frames = scan.rectangles();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_NEAR(frames[0].size().width, 3.4, EPSILON);
    EXPECT_NEAR(frames[0].size().height, 6.5, EPSILON);
    EXPECT_NEAR(frames[1].bounds().maxY, 3.3, EPSILON);
}

TEST_F(ScanTest, ToJson) {
    const auto j = Scan(context(), twoLines()).toJson();
    EXPECT_EQ(j["type"], "scan");
    EXPECT_EQ(j["numberOfLines"], 2);
    EXPECT_EQ(j["endTime"], "2031-09-27T10:46:36");
}

TEST_F(ScanTest, InvalidGeometryThrows) {
    auto lines = twoLines();
    lines.numberOfLines = 0;
    EXPECT_THROW(Scan(context(), lines), InvalidParameter);

    lines = twoLines();
    lines.scanSlewRate = 0.0;
    EXPECT_THROW(Scan(context(), lines), InvalidParameter);

    lines = twoLines();
    lines.borderSlewTime = -5.0;
    EXPECT_THROW(Scan(context(), lines), InvalidParameter);
}

}  // namespace tessera::model::test
