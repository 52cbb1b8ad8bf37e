#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <datapod/datapod.hpp>

#include "covertrax/types.hpp"

namespace covertrax {

    /**
     * @brief Georeferencing of a north-up geographic (WGS84) grid
     *
     * Cell (row, col) spans longitudes [west + col * cell_lon, west + (col + 1) * cell_lon]
     * and latitudes [north - (row + 1) * cell_lat, north - row * cell_lat].
     */
    struct GridSpec {
        double west = 0.0;
        double north = 0.0;
        double cell_lon = 0.0; ///< degrees
        double cell_lat = 0.0; ///< degrees
        std::size_t rows = 0;
        std::size_t cols = 0;

        std::size_t cells() const { return rows * cols; }

        /// Corner (x = longitude, y = latitude) at corner indices (row, col), 0 <= row <= rows.
        datapod::Point corner(std::size_t row, std::size_t col) const {
            return datapod::Point{west + static_cast<double>(col) * cell_lon,
                                  north - static_cast<double>(row) * cell_lat, 0.0};
        }

        datapod::Point cell_center(std::size_t row, std::size_t col) const {
            return datapod::Point{west + (static_cast<double>(col) + 0.5) * cell_lon,
                                  north - (static_cast<double>(row) + 0.5) * cell_lat, 0.0};
        }

        bool operator==(const GridSpec &other) const {
            return west == other.west && north == other.north && cell_lon == other.cell_lon &&
                   cell_lat == other.cell_lat && rows == other.rows && cols == other.cols;
        }
        bool operator!=(const GridSpec &other) const { return !(*this == other); }
    };

    /**
     * @brief Row-major grid of values sharing one GridSpec
     */
    template <typename T> class Grid {
        GridSpec spec_;
        std::vector<T> data_;

      public:
        Grid() = default;

        explicit Grid(const GridSpec &spec, const T &fill = T{}) : spec_(spec), data_(spec.cells(), fill) {}

        const GridSpec &spec() const { return spec_; }
        std::size_t rows() const { return spec_.rows; }
        std::size_t cols() const { return spec_.cols; }
        std::size_t size() const { return data_.size(); }

        std::size_t index(std::size_t row, std::size_t col) const { return row * spec_.cols + col; }

        T &operator()(std::size_t row, std::size_t col) { return data_[index(row, col)]; }
        const T &operator()(std::size_t row, std::size_t col) const { return data_[index(row, col)]; }

        T &at(std::size_t row, std::size_t col) {
            if (row >= spec_.rows || col >= spec_.cols)
                throw std::out_of_range("Grid cell out of range");
            return data_[index(row, col)];
        }

        const T &at(std::size_t row, std::size_t col) const {
            if (row >= spec_.rows || col >= spec_.cols)
                throw std::out_of_range("Grid cell out of range");
            return data_[index(row, col)];
        }

        std::vector<T> &data() { return data_; }
        const std::vector<T> &data() const { return data_; }

        void fill(const T &value) { std::fill(data_.begin(), data_.end(), value); }
    };

    /**
     * @brief Reflectance bands carried by scenes and composites
     */
    enum class Band : std::uint8_t { Blue, Green, Red, Nir, Swir };

    inline constexpr std::size_t kBandCount = 5;

    inline constexpr std::size_t band_index(Band band) { return static_cast<std::size_t>(band); }

    /**
     * @brief Surface reflectance of one pixel, band-ordered like Band
     */
    struct Reflectance {
        float blue = 0.0f;
        float green = 0.0f;
        float red = 0.0f;
        float nir = 0.0f;
        float swir = 0.0f;

        float operator[](Band band) const {
            switch (band) {
            case Band::Blue:
                return blue;
            case Band::Green:
                return green;
            case Band::Red:
                return red;
            case Band::Nir:
                return nir;
            case Band::Swir:
                return swir;
            }
            return 0.0f;
        }
    };

    /**
     * @brief Median composite: per-band reflectance plus a validity mask
     */
    struct RasterComposite {
        GridSpec grid;
        std::array<std::vector<float>, kBandCount> bands;
        std::vector<std::uint8_t> valid; ///< 1 where at least one scene contributed
        std::size_t scene_count = 0;

        RasterComposite() = default;

        explicit RasterComposite(const GridSpec &spec) : grid(spec), valid(spec.cells(), 0) {
            for (auto &band : bands) {
                band.assign(spec.cells(), 0.0f);
            }
        }

        bool is_valid(std::size_t row, std::size_t col) const { return valid[row * grid.cols + col] != 0; }

        Reflectance pixel(std::size_t row, std::size_t col) const {
            std::size_t i = row * grid.cols + col;
            return Reflectance{bands[0][i], bands[1][i], bands[2][i], bands[3][i], bands[4][i]};
        }

        void set_pixel(std::size_t row, std::size_t col, const Reflectance &r) {
            std::size_t i = row * grid.cols + col;
            bands[band_index(Band::Blue)][i] = r.blue;
            bands[band_index(Band::Green)][i] = r.green;
            bands[band_index(Band::Red)][i] = r.red;
            bands[band_index(Band::Nir)][i] = r.nir;
            bands[band_index(Band::Swir)][i] = r.swir;
            valid[i] = 1;
        }

        std::size_t valid_count() const {
            return static_cast<std::size_t>(std::count(valid.begin(), valid.end(), std::uint8_t{1}));
        }
    };

    using ClassifiedRaster = Grid<LandCoverClass>;

} // namespace covertrax
