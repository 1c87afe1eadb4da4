/**
 * @file test_mosaic_generator.cpp
 * @brief Unit tests for mosaic generation from target geometry
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "exception/exception.hpp"
#include "generator/mosaic_generator.hpp"
#include "mocks/mock_celestial_geometry.hpp"
#include "tools/constants.hpp"

namespace tessera::generator::test {

using ::testing::_;
using ::testing::Eq;
using ::testing::Return;
using tessera::test::MockCelestialGeometry;

class MosaicGeneratorTest : public ::testing::Test {
protected:
    static constexpr double EPSILON = 1e-9;

    void SetUp() override {
        geometry_ = std::make_shared<MockCelestialGeometry>();
        context_ = {"CALLISTO", tools::parseIsoTime("2031-04-26T00:40:47"),
                    tools::TimeUnit::Minutes, tools::AngularUnit::Degrees};
    }

    MosaicGenerator makeGenerator(const geometry::Size& fov, double dwell,
                                  double rate) {
        return MosaicGenerator(geometry_, context_, {"JUICE", fov, dwell, rate});
    }

    std::shared_ptr<MockCelestialGeometry> geometry_;
    model::ObservationContext context_;
};

TEST_F(MosaicGeneratorTest, SymmetricMosaicFromDiameter) {
    EXPECT_CALL(*geometry_, angularDiameter("JUICE", "CALLISTO",
                                            Eq(context_.startTime)))
        .WillOnce(Return(0.19167923151263316));

    const auto mosaic =
        makeGenerator({3.0, 2.0}, 2.0, 1.5).generateSymmetricMosaic(0.1, 0.1);
    const auto& grid = mosaic.grid();
    EXPECT_EQ(grid.pointsX, 5);
    EXPECT_EQ(grid.pointsY, 7);
    EXPECT_NEAR(grid.start.x, -4.54032604229169, EPSILON);
    EXPECT_NEAR(grid.delta.y, 1.6801086807638965, EPSILON);
    EXPECT_DOUBLE_EQ(grid.dwellTime, 2.0);
    EXPECT_NEAR(grid.lineSlewTime, 2.270163021145845 / 1.5, EPSILON);
    EXPECT_EQ(mosaic.target(), "CALLISTO");
    EXPECT_EQ(mosaic.startTime(), context_.startTime);
}

TEST_F(MosaicGeneratorTest, DiameterInContextUnit) {
    context_.angularUnit = tools::AngularUnit::ArcMinutes;
    EXPECT_CALL(*geometry_, angularDiameter(_, _, _))
        .WillOnce(Return(tools::DEG_TO_RAD));
    EXPECT_NEAR(makeGenerator({1.0, 1.0}, 1.0, 1.0).targetAngularDiameter(),
                60.0, 1e-9);
}

TEST_F(MosaicGeneratorTest, SunsideMosaicUsesLitShape) {
    EXPECT_CALL(*geometry_, angularDiameter(_, _, _))
        .WillOnce(Return(4.0 * tools::DEG_TO_RAD));
    EXPECT_CALL(*geometry_, illuminatedShape("JUICE", "CALLISTO",
                                             Eq(context_.startTime),
                                             tools::AngularUnit::Degrees))
        .WillOnce(Return(geometry::Polygon(std::vector<geometry::Point>{
            {0.0, -2.0}, {2.0, 0.0}, {0.0, 2.0}})));

    const auto mosaic =
        makeGenerator({1.0, 1.0}, 1.0, 2.0).generateSunsideMosaic(0.0, 0.0);
    EXPECT_EQ(mosaic.frameCount(), 6u);
    EXPECT_DOUBLE_EQ(mosaic.dwellTime(), 1.0);
    EXPECT_DOUBLE_EQ(mosaic.slewRate(), 2.0);
    for (const auto& p : mosaic.centerPoints()) {
        EXPECT_GT(p.x, 0.0);
    }
}

TEST_F(MosaicGeneratorTest, GeometryErrorsPropagate) {
    EXPECT_CALL(*geometry_, angularDiameter(_, _, _))
        .WillOnce([](const std::string&, const std::string& target,
                     const tools::TimePoint&) -> double {
            THROW_GEOMETRY_UNAVAILABLE("No geometry for target ", target);
        });
    EXPECT_THROW((void)makeGenerator({1.0, 1.0}, 1.0, 1.0)
                     .generateSymmetricMosaic(0.0, 0.1),
                 GeometryUnavailable);
}

TEST_F(MosaicGeneratorTest, InvalidSettingsThrow) {
    const MosaicSettings settings{"JUICE", {1.0, 1.0}, 1.0, 1.0};
    EXPECT_THROW((void)MosaicGenerator(nullptr, context_, settings),
                 InvalidParameter);
    EXPECT_THROW((void)makeGenerator({0.0, 1.0}, 1.0, 1.0), InvalidParameter);
    EXPECT_THROW((void)makeGenerator({1.0, 1.0}, -1.0, 1.0), InvalidParameter);
    EXPECT_THROW((void)makeGenerator({1.0, 1.0}, 1.0, 0.0), InvalidParameter);
}

}  // namespace tessera::generator::test
