/**
 * @file test_scan_generator.cpp
 * @brief Unit tests for scan generation from target geometry
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "exception/exception.hpp"
#include "generator/scan_generator.hpp"
#include "mocks/mock_celestial_geometry.hpp"
#include "tools/constants.hpp"

namespace tessera::generator::test {

using ::testing::_;
using ::testing::Return;
using tessera::test::MockCelestialGeometry;

class ScanGeneratorTest : public ::testing::Test {
protected:
    static constexpr double EPSILON = 1e-9;

    void SetUp() override {
        geometry_ = std::make_shared<MockCelestialGeometry>();
        context_ = {"CALLISTO", tools::parseIsoTime("2031-09-27T09:40:00"),
                    tools::TimeUnit::Minutes, tools::AngularUnit::Degrees};
        settings_.observer = "JUICE";
        settings_.fovWidth = 3.4;
        settings_.scanSlewRate = 0.25;
        settings_.transferSlewRate = 1.5;
    }

    std::shared_ptr<MockCelestialGeometry> geometry_;
    model::ObservationContext context_;
    ScanSettings settings_;
};

TEST_F(ScanGeneratorTest, SymmetricScanSpansDisk) {
    EXPECT_CALL(*geometry_, angularDiameter("JUICE", "CALLISTO", _))
        .WillOnce(Return(10.0 * tools::DEG_TO_RAD));

    const auto scan =
        ScanGenerator(geometry_, context_, settings_).generateSymmetricScan(0.0, 0.0);
    const auto& lines = scan.scanGeometry();
    EXPECT_EQ(lines.numberOfLines, 3);
    EXPECT_NEAR(lines.start.x, -3.3, 1e-6);
    EXPECT_NEAR(lines.delta.x, 3.3, 1e-6);
    EXPECT_NEAR(lines.start.y, 5.0, 1e-6);
    EXPECT_NEAR(lines.delta.y, -10.0, 1e-6);
    EXPECT_NEAR(lines.lineSlewTime, 2.2, 1e-6);
    EXPECT_DOUBLE_EQ(lines.scanSlewRate, 0.25);
    EXPECT_DOUBLE_EQ(lines.borderSlewTime, 5.0);
}

TEST_F(ScanGeneratorTest, DefaultBorderFollowsTimeUnit) {
    context_.timeUnit = tools::TimeUnit::Seconds;
    EXPECT_CALL(*geometry_, angularDiameter(_, _, _))
        .WillOnce(Return(10.0 * tools::DEG_TO_RAD));
    const auto scan =
        ScanGenerator(geometry_, context_, settings_).generateSymmetricScan(0.0, 0.0);
    EXPECT_DOUBLE_EQ(scan.scanGeometry().borderSlewTime, 300.0);
}

TEST_F(ScanGeneratorTest, ExplicitBorderSlewTime) {
    settings_.borderSlewTime = 2.5;
    EXPECT_CALL(*geometry_, angularDiameter(_, _, _))
        .WillOnce(Return(10.0 * tools::DEG_TO_RAD));
    const auto scan =
        ScanGenerator(geometry_, context_, settings_).generateSymmetricScan(0.0, 0.0);
    EXPECT_DOUBLE_EQ(scan.scanGeometry().borderSlewTime, 2.5);
}

TEST_F(ScanGeneratorTest, SunsideScanCoversLitWidth) {
    settings_.fovWidth = 1.0;
    settings_.transferSlewRate = 0.5;
    EXPECT_CALL(*geometry_, angularDiameter(_, _, _))
        .WillOnce(Return(4.0 * tools::DEG_TO_RAD));
    EXPECT_CALL(*geometry_,
                illuminatedShape("JUICE", "CALLISTO", _, tools::AngularUnit::Degrees))
        .WillOnce(Return(geometry::Polygon(std::vector<geometry::Point>{
            {0.0, -2.0}, {2.0, 0.0}, {0.0, 2.0}})));

    const auto scan =
        ScanGenerator(geometry_, context_, settings_).generateSunsideScan(0.0, 0.0);
    const auto& lines = scan.scanGeometry();
    EXPECT_EQ(lines.numberOfLines, 2);
    EXPECT_NEAR(lines.start.x, 0.5, 1e-6);
    EXPECT_NEAR(lines.delta.y, -4.0, 1e-6);
    EXPECT_NEAR(lines.lineSlewTime, 2.0, 1e-6);
}

TEST_F(ScanGeneratorTest, InvalidSettingsThrow) {
    EXPECT_THROW((void)ScanGenerator(nullptr, context_, settings_), InvalidParameter);

    auto bad = settings_;
    bad.scanSlewRate = 0.0;
    EXPECT_THROW((void)ScanGenerator(geometry_, context_, bad), InvalidParameter);

    bad = settings_;
    bad.transferSlewRate = -1.0;
    EXPECT_THROW((void)ScanGenerator(geometry_, context_, bad), InvalidParameter);

    bad = settings_;
    bad.borderSlewTime = 0.0;
    EXPECT_THROW((void)ScanGenerator(geometry_, context_, bad), InvalidParameter);
}

}  // namespace tessera::generator::test
