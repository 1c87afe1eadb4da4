/**
 * @file test_ptr_writer.cpp
 * @brief Unit tests for PTR block rendering
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "exception/exception.hpp"
#include "ptr/ptr_writer.hpp"

namespace tessera::ptr::test {

using ::testing::HasSubstr;
using ::testing::StartsWith;
using ::testing::EndsWith;

class PtrWriterTest : public ::testing::Test {
protected:
    static model::RasterMosaic raster() {
        model::RasterGrid grid;
        grid.fovSize = {1.72, 1.29};
        grid.start = {-1.5, 1.5};
        grid.delta = {1.5, -1.5};
        grid.pointsX = 3;
        grid.pointsY = 3;
        grid.dwellTime = 3.0;
        grid.pointSlewTime = 1.75;
        grid.lineSlewTime = 2.25;
        return model::RasterMosaic(
            {"CALLISTO", tools::parseIsoTime("2031-04-26T00:40:47"),
             tools::TimeUnit::Minutes, tools::AngularUnit::Degrees},
            grid);
    }

    static model::CustomMosaic custom() {
        return model::CustomMosaic(
            {"EUROPA", tools::parseIsoTime("2030-09-17T12:30:00"),
             tools::TimeUnit::Minutes, tools::AngularUnit::Degrees},
            {1.72, 1.29}, 1.0, 2.5, {{1.0, 0.0}, {4.0, 4.0}, {4.0, 0.0}});
    }

    static model::Scan scan() {
        model::ScanGeometry lines;
        lines.fovWidth = 3.4;
        lines.scanSlewRate = 0.00859 / (2.0 / 60.0);
        lines.lineSlewTime = 5.0;
        lines.borderSlewTime = 5.0;
        lines.start = {-1.5, 3.3};
        lines.delta = {3.06, -6.5};
        lines.numberOfLines = 2;
        return model::Scan({"CALLISTO", tools::parseIsoTime("2031-09-27T09:40:00"),
                            tools::TimeUnit::Minutes,
                            tools::AngularUnit::Degrees},
                           lines);
    }
};

// ============================================================================
// Raster
// ============================================================================

TEST_F(PtrWriterTest, RasterBlockText) {
    const std::string expected =
        "<block ref=\"OBS\">\n"
        "\t<startTime> 2031-04-26T00:40:47 </startTime>\n"
        "\t<endTime> 2031-04-26T01:24:47 </endTime>\n"
        "\t<attitude ref=\"track\">\n"
        "\t\t<boresight ref=\"SC_Zaxis\"/>\n"
        "\t\t<target ref=\"CALLISTO\"/>\n"
        "\t\t<offsetRefAxis frame=\"SC\">\n"
        "\t\t\t<x>1.0</x>\n"
        "\t\t\t<y>0.0</y>\n"
        "\t\t\t<z>0.0</z>\n"
        "\t\t</offsetRefAxis>\n"
        "\t\t<offsetAngles ref=\"raster\">\n"
        "\t\t\t<startTime>2031-04-26T00:41:47</startTime>\n"
        "\t\t\t<xPoints>3</xPoints>\n"
        "\t\t\t<yPoints>3</yPoints>\n"
        "\t\t\t<xStart units=\"deg\">-1.500</xStart>\n"
        "\t\t\t<yStart units=\"deg\">1.500</yStart>\n"
        "\t\t\t<xDelta units=\"deg\">1.500</xDelta>\n"
        "\t\t\t<yDelta units=\"deg\">-1.500</yDelta>\n"
        "\t\t\t<pointSlewTime units=\"min\">1.750</pointSlewTime>\n"
        "\t\t\t<lineSlewTime units=\"min\">2.250</lineSlewTime>\n"
        "\t\t\t<dwellTime units=\"min\">3.000</dwellTime>\n"
        "\t\t\t<lineAxis>Y</lineAxis>\n"
        "\t\t\t<keepLineDir>false</keepLineDir>\n"
        "\t\t</offsetAngles>\n"
        "\t\t<phaseAngle ref=\"powerOptimised\">\n"
        "\t\t\t<yDir> false </yDir>\n"
        "\t\t</phaseAngle>\n"
        "\t</attitude>\n"
        "</block>\n";
    EXPECT_EQ(PtrWriter().write(raster()), expected);
}

TEST_F(PtrWriterTest, DecimalsControlPrecision) {
    const auto text = PtrWriter(1).write(raster());
    EXPECT_THAT(text, HasSubstr("<xStart units=\"deg\">-1.5</xStart>"));
    EXPECT_THAT(text, HasSubstr("<pointSlewTime units=\"min\">1.8</pointSlewTime>"));
}

// ============================================================================
// Custom
// ============================================================================

TEST_F(PtrWriterTest, CustomBlockTables) {
    const auto text = PtrWriter().write(custom());
    EXPECT_THAT(text, HasSubstr("<offsetAngles ref=\"custom\">"));
    EXPECT_THAT(text, HasSubstr("<startTime>2030-09-17T12:31:00</startTime>"));
    EXPECT_THAT(text, HasSubstr("<endTime> 2030-09-17T12:38:36 </endTime>"));
    EXPECT_THAT(text,
                HasSubstr("<deltaTimes units='min'>   0.500  0.500  2.000"
                          "  0.500  0.500  1.600  0.500  0.500  0.000"
                          " </deltaTimes>"));
    EXPECT_THAT(text,
                HasSubstr("<xAngles units='deg'>     -1.000 -1.000 -1.000"
                          " -4.000 -4.000 -4.000 -4.000 -4.000 -4.000"
                          " </xAngles>"));
    EXPECT_THAT(text,
                HasSubstr("<yAngles units='deg'>      0.000  0.000  0.000"
                          "  4.000  4.000  4.000  0.000  0.000  0.000"
                          " </yAngles>"));
    EXPECT_THAT(text, HasSubstr("<xRates units='deg/min'>   0.000"));
}

TEST_F(PtrWriterTest, CustomColumnsWidenForLongTimes) {
    const model::CustomMosaic slow(
        {"EUROPA", tools::parseIsoTime("2030-09-17T12:30:00"),
         tools::TimeUnit::Minutes, tools::AngularUnit::Degrees},
        {1.0, 1.0}, 1.0, 0.1, {{1.0, 0.0}, {2.0, 0.0}});
    // Slew of 10 minutes needs two integer digits
    EXPECT_THAT(PtrWriter().write(slow),
                HasSubstr("<deltaTimes units='min'>    0.500   0.500  10.000"));
}

// ============================================================================
// Scan
// ============================================================================

TEST_F(PtrWriterTest, ScanBlockFields) {
    const auto text = PtrWriter().write(scan());
    EXPECT_THAT(text, StartsWith("<block ref=\"OBS\">\n"));
    EXPECT_THAT(text, EndsWith("</block>\n"));
    EXPECT_THAT(text, HasSubstr("<offsetAngles ref=\"scan\">"));
    EXPECT_THAT(text, HasSubstr("<endTime> 2031-09-27T10:46:36 </endTime>"));
    EXPECT_THAT(text, HasSubstr("<startTime>2031-09-27T09:45:10</startTime>"));
    EXPECT_THAT(text, HasSubstr("<numberOfLines> 2 </numberOfLines>"));
    EXPECT_THAT(text, HasSubstr("<xStart units=\"deg\">1.500</xStart>"));
    EXPECT_THAT(text, HasSubstr("<yStart units=\"deg\">3.300</yStart>"));
    EXPECT_THAT(text, HasSubstr("<lineDelta units=\"deg\">-3.060</lineDelta>"));
    EXPECT_THAT(text, HasSubstr("<scanDelta units=\"deg\">-6.500</scanDelta>"));
    EXPECT_THAT(text, HasSubstr("<scanSpeed units=\"deg/min\">0.258</scanSpeed>"));
    EXPECT_THAT(text, HasSubstr("<scanSlewTime units=\"min\">1.0</scanSlewTime>"));
    EXPECT_THAT(text,
                HasSubstr("<borderSlewTime units=\"min\">5.000</borderSlewTime>"));
}

// ============================================================================
// Dispatch and validation
// ============================================================================

TEST_F(PtrWriterTest, WriteDispatchesOnObservationType) {
    const PtrWriter writer;
    const std::unique_ptr<model::Observation> observation =
        std::make_unique<model::Scan>(scan());
    EXPECT_EQ(writer.write(*observation), writer.write(scan()));
}

TEST_F(PtrWriterTest, DecimalsOutOfRangeThrow) {
    EXPECT_THROW(PtrWriter(-1), InvalidParameter);
    EXPECT_THROW(PtrWriter(13), InvalidParameter);
    EXPECT_NO_THROW(PtrWriter(0));
}

}  // namespace tessera::ptr::test
