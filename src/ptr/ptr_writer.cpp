#include "ptr_writer.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

#include <fmt/format.h>

#include "exception/exception.hpp"

namespace tessera::ptr {

namespace {

constexpr int MAX_DECIMALS = 12;

std::string blockHeader(const model::Observation& observation,
                        std::string_view offsetRef) {
    return fmt::format(
        "<block ref=\"OBS\">\n"
        "\t<startTime> {} </startTime>\n"
        "\t<endTime> {} </endTime>\n"
        "\t<attitude ref=\"track\">\n"
        "\t\t<boresight ref=\"SC_Zaxis\"/>\n"
        "\t\t<target ref=\"{}\"/>\n"
        "\t\t<offsetRefAxis frame=\"SC\">\n"
        "\t\t\t<x>1.0</x>\n"
        "\t\t\t<y>0.0</y>\n"
        "\t\t\t<z>0.0</z>\n"
        "\t\t</offsetRefAxis>\n"
        "\t\t<offsetAngles ref=\"{}\">\n",
        tools::formatIsoTime(observation.startTime()),
        tools::formatIsoTime(observation.endTime()), observation.target(),
        offsetRef);
}

std::string blockFooter() {
    return "\t\t</offsetAngles>\n"
           "\t\t<phaseAngle ref=\"powerOptimised\">\n"
           "\t\t\t<yDir> false </yDir>\n"
           "\t\t</phaseAngle>\n"
           "\t</attitude>\n"
           "</block>\n";
}

/// Right-aligned column entry with a blank in place of a plus sign
std::string column(double value, int width, int decimals) {
    return fmt::format(" {: {}.{}f}", value, width, decimals);
}

}  // namespace

PtrWriter::PtrWriter(int decimals) : decimals_(decimals) {
    if (decimals < 0 || decimals > MAX_DECIMALS) {
        THROW_INVALID_PARAMETER("PTR decimals must be in [0, ", MAX_DECIMALS,
                                "], got ", decimals);
    }
}

std::string PtrWriter::write(const model::RasterMosaic& mosaic) const {
    const auto& grid = mosaic.grid();
    const auto angle = tools::toString(mosaic.angularUnit());
    const auto time = tools::toString(mosaic.timeUnit());
    const int d = decimals_;

    std::string out = blockHeader(mosaic, "raster");
    auto it = std::back_inserter(out);
    fmt::format_to(it, "\t\t\t<startTime>{}</startTime>\n",
                   tools::formatIsoTime(mosaic.startTime() +
                                        std::chrono::minutes(1)));
    fmt::format_to(it, "\t\t\t<xPoints>{}</xPoints>\n", grid.pointsX);
    fmt::format_to(it, "\t\t\t<yPoints>{}</yPoints>\n", grid.pointsY);
    fmt::format_to(it, "\t\t\t<xStart units=\"{}\">{:.{}f}</xStart>\n", angle,
                   grid.start.x, d);
    fmt::format_to(it, "\t\t\t<yStart units=\"{}\">{:.{}f}</yStart>\n", angle,
                   grid.start.y, d);
    fmt::format_to(it, "\t\t\t<xDelta units=\"{}\">{:.{}f}</xDelta>\n", angle,
                   grid.delta.x, d);
    fmt::format_to(it, "\t\t\t<yDelta units=\"{}\">{:.{}f}</yDelta>\n", angle,
                   grid.delta.y, d);
    fmt::format_to(it,
                   "\t\t\t<pointSlewTime units=\"{}\">{:.{}f}</pointSlewTime>\n",
                   time, grid.pointSlewTime, d);
    fmt::format_to(it,
                   "\t\t\t<lineSlewTime units=\"{}\">{:.{}f}</lineSlewTime>\n",
                   time, grid.lineSlewTime, d);
    fmt::format_to(it, "\t\t\t<dwellTime units=\"{}\">{:.{}f}</dwellTime>\n",
                   time, grid.dwellTime, d);
    out += "\t\t\t<lineAxis>Y</lineAxis>\n"
           "\t\t\t<keepLineDir>false</keepLineDir>\n";
    out += blockFooter();
    return out;
}

std::string PtrWriter::write(const model::CustomMosaic& mosaic) const {
    const auto angle = tools::toString(mosaic.angularUnit());
    const auto time = tools::toString(mosaic.timeUnit());
    const auto points = mosaic.centerPoints();
    const auto slews = mosaic.slewTimes();
    const double halfDwell = mosaic.dwellTime() * 0.5;
    const int d = decimals_;

    // Widest integer part among dwell and slew times, plus sign and point
    const double longest =
        std::max(mosaic.dwellTime(), *std::max_element(slews.begin(), slews.end()));
    const int width =
        static_cast<int>(fmt::format("{:.0f}", longest).size()) + d + 2;

    std::string deltaTimes = fmt::format("<deltaTimes units='{}'> ", time);
    std::string xAngles = fmt::format("<xAngles units='{}'>    ", angle);
    std::string yAngles = fmt::format("<yAngles units='{}'>    ", angle);
    std::string xRates = fmt::format("<xRates units='{}/{}'> ", angle, time);
    std::string yRates = fmt::format("<yRates units='{}/{}'> ", angle, time);

    for (size_t i = 0; i < points.size(); ++i) {
        deltaTimes += column(halfDwell, width, d);
        deltaTimes += column(halfDwell, width, d);
        deltaTimes += column(slews[i], width, d);
        for (int k = 0; k < 3; ++k) {
            xAngles += column(-points[i].x, width, d);
            yAngles += column(points[i].y, width, d);
            xRates += column(0.0, width, d);
            yRates += column(0.0, width, d);
        }
    }
    deltaTimes += " </deltaTimes>";
    xAngles += " </xAngles>";
    yAngles += " </yAngles>";
    xRates += " </xRates>";
    yRates += " </yRates>";

    std::string out = blockHeader(mosaic, "custom");
    auto it = std::back_inserter(out);
    fmt::format_to(it, "\t\t\t<startTime>{}</startTime>\n",
                   tools::formatIsoTime(mosaic.startTime() +
                                        std::chrono::minutes(1)));
    fmt::format_to(it, "\t\t\t{}\n\t\t\t{}\n\t\t\t{}\n\t\t\t{}\n\t\t\t{}\n",
                   deltaTimes, xAngles, xRates, yAngles, yRates);
    out += blockFooter();
    return out;
}

std::string PtrWriter::write(const model::Scan& scan) const {
    const auto& lines = scan.scanGeometry();
    const auto angle = tools::toString(scan.angularUnit());
    const auto time = tools::toString(scan.timeUnit());
    const int d = decimals_;

    const auto offsetStart =
        scan.startTime() + std::chrono::seconds(10) +
        tools::toDuration(lines.borderSlewTime, scan.timeUnit());

    std::string out = blockHeader(scan, "scan");
    auto it = std::back_inserter(out);
    fmt::format_to(it, "\t\t\t<startTime>{}</startTime>\n",
                   tools::formatIsoTime(offsetStart));
    fmt::format_to(it, "\t\t\t<numberOfLines> {} </numberOfLines>\n",
                   lines.numberOfLines);
    fmt::format_to(it, "\t\t\t<xStart units=\"{}\">{:.{}f}</xStart>\n", angle,
                   -lines.start.x, d);
    fmt::format_to(it, "\t\t\t<yStart units=\"{}\">{:.{}f}</yStart>\n", angle,
                   lines.start.y, d);
    fmt::format_to(it, "\t\t\t<lineDelta units=\"{}\">{:.{}f}</lineDelta>\n",
                   angle, -lines.delta.x, d);
    fmt::format_to(it, "\t\t\t<scanDelta units=\"{}\">{:.{}f}</scanDelta>\n",
                   angle, lines.delta.y, d);
    fmt::format_to(it, "\t\t\t<scanSpeed units=\"{}/{}\">{:.{}f}</scanSpeed>\n",
                   angle, time, lines.scanSlewRate, d);
    fmt::format_to(it, "\t\t\t<scanSlewTime units=\"{}\">1.0</scanSlewTime>\n",
                   time);
    fmt::format_to(it,
                   "\t\t\t<lineSlewTime units=\"{}\">{:.{}f}</lineSlewTime>\n",
                   time, lines.lineSlewTime, d);
    fmt::format_to(
        it, "\t\t\t<borderSlewTime units=\"{}\">{:.{}f}</borderSlewTime>\n",
        time, lines.borderSlewTime, d);
    out += "\t\t\t<lineAxis>Y</lineAxis>\n"
           "\t\t\t<keepLineDir>false</keepLineDir>\n";
    out += blockFooter();
    return out;
}

std::string PtrWriter::write(const model::Observation& observation) const {
    if (const auto* raster =
            dynamic_cast<const model::RasterMosaic*>(&observation)) {
        return write(*raster);
    }
    if (const auto* custom =
            dynamic_cast<const model::CustomMosaic*>(&observation)) {
        return write(*custom);
    }
    if (const auto* scan = dynamic_cast<const model::Scan*>(&observation)) {
        return write(*scan);
    }
    THROW_INVALID_PARAMETER("Unsupported observation type for PTR output");
}

}  // namespace tessera::ptr
