/**
 * @file ptr_writer.hpp
 * @brief Pointing-request (PTR) block rendering for planned observations.
 *
 * @date 2024-12-5
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_PTR_PTR_WRITER_HPP
#define TESSERA_PTR_PTR_WRITER_HPP

#include <string>

#include "model/custom_mosaic.hpp"
#include "model/raster_mosaic.hpp"
#include "model/scan.hpp"

namespace tessera::ptr {

/// Default number of decimals for angles and times
inline constexpr int DEFAULT_DECIMALS = 3;

/**
 * @brief Renders observations as PTR observation blocks.
 *
 * Every block tracks the target with the spacecraft Z axis as boresight and
 * carries one offsetAngles element describing the pointing pattern:
 * "raster" for grid mosaics, "custom" for explicit point lists and "scan"
 * for slit scans. Instrument x runs opposite to the planning frame x, so
 * x angles of custom mosaics and scans are written negated.
 */
class PtrWriter {
public:
    /**
     * @param decimals Fixed number of decimals, 0 to 12
     * @throws InvalidParameter if decimals is out of range
     */
    explicit PtrWriter(int decimals = DEFAULT_DECIMALS);

    [[nodiscard]] int decimals() const noexcept { return decimals_; }

    [[nodiscard]] std::string write(const model::RasterMosaic& mosaic) const;
    [[nodiscard]] std::string write(const model::CustomMosaic& mosaic) const;
    [[nodiscard]] std::string write(const model::Scan& scan) const;

    /**
     * @brief Render any supported observation.
     * @throws InvalidParameter for an unsupported observation type
     */
    [[nodiscard]] std::string write(const model::Observation& observation) const;

private:
    int decimals_;
};

}  // namespace tessera::ptr

#endif  // TESSERA_PTR_PTR_WRITER_HPP
