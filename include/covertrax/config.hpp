#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>

#include "covertrax/error.hpp"

namespace covertrax {

    /**
     * @brief Spectral thresholds of the classifier
     *
     * These are operational tuning values. The defaults follow common
     * Sentinel-2 practice and are expected to be overridden per deployment.
     */
    struct ClassifierThresholds {
        double water_ndwi = 0.30;      ///< NDWI above this is water
        double builtup_ndbi = 0.10;    ///< NDBI above this (with low NDVI) is infrastructure
        double vegetation_ndvi = 0.35; ///< NDVI above this is vegetated
        double forest_ndvi = 0.60;     ///< NDVI above this is forest rather than agriculture
    };

    /**
     * @brief How the composite fetcher selects and grids imagery
     */
    struct FetchPolicy {
        int lookback_days = 365;
        /// End of the acquisition window. Unset means "today (UTC midnight)".
        std::optional<std::chrono::system_clock::time_point> end_time;
        double max_cloud_fraction = 0.40;
        double resolution_m = 10.0;
        std::size_t max_cells = 4000000;
        /// QA bits that mask a scene pixel out of the median (cloud bit 10, cirrus bit 11).
        std::uint16_t qa_mask_bits = (1u << 10) | (1u << 11);
    };

    struct VectorizerOptions {
        /// Polygons smaller than this after clipping are dropped as noise.
        double min_region_area_sq_m = 50.0;
        /// Douglas-Peucker tolerance as a fraction of the cell size, 0 disables simplification.
        double simplify_tolerance_cells = 0.05;
    };

    struct AnalysisConfig {
        std::size_t aoi_segments = 128;
        FetchPolicy fetch;
        ClassifierThresholds classifier;
        /// Classification threads, 0 picks the hardware concurrency.
        std::size_t classifier_workers = 0;
        VectorizerOptions vectorizer;
        /// Per-request deadline, 0 disables it.
        std::chrono::milliseconds timeout{120000};
        bool verbose = false;

        /**
         * @brief Throw ValidationError if any parameter is out of range
         */
        void validate() const;

        /**
         * @brief Apply `key = value` overrides on top of this configuration
         *
         * @throws ValidationError on unknown keys or unparsable values
         */
        void apply(const std::unordered_map<std::string, std::string> &properties);

        static AnalysisConfig from_properties(const std::unordered_map<std::string, std::string> &properties) {
            AnalysisConfig config;
            config.apply(properties);
            return config;
        }
    };

    namespace detail {

        inline std::string trim(const std::string &s) {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos) {
                return "";
            }
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        inline double parse_double(const std::string &key, const std::string &value) {
            std::size_t consumed = 0;
            double out = 0.0;
            try {
                out = std::stod(value, &consumed);
            } catch (const std::exception &) {
                throw ValidationError("config: '" + key + "' expects a number, got '" + value + "'");
            }
            if (consumed != value.size()) {
                throw ValidationError("config: '" + key + "' expects a number, got '" + value + "'");
            }
            return out;
        }

        inline long long parse_integer(const std::string &key, const std::string &value) {
            std::size_t consumed = 0;
            long long out = 0;
            try {
                out = std::stoll(value, &consumed, 0);
            } catch (const std::exception &) {
                throw ValidationError("config: '" + key + "' expects an integer, got '" + value + "'");
            }
            if (consumed != value.size()) {
                throw ValidationError("config: '" + key + "' expects an integer, got '" + value + "'");
            }
            return out;
        }

        /// Integer within [lo, hi], ValidationError otherwise.
        inline long long parse_ranged(const std::string &key, const std::string &value, long long lo, long long hi) {
            long long v = parse_integer(key, value);
            if (v < lo || v > hi) {
                throw ValidationError("config: '" + key + "' must be within [" + std::to_string(lo) + ", " +
                                      std::to_string(hi) + "], got " + value);
            }
            return v;
        }

        inline std::size_t parse_count(const std::string &key, const std::string &value) {
            long long v = parse_integer(key, value);
            if (v < 0) {
                throw ValidationError("config: '" + key + "' must not be negative");
            }
            return static_cast<std::size_t>(v);
        }

        inline bool parse_bool(const std::string &key, const std::string &value) {
            if (value == "true" || value == "1" || value == "yes" || value == "on") {
                return true;
            }
            if (value == "false" || value == "0" || value == "no" || value == "off") {
                return false;
            }
            throw ValidationError("config: '" + key + "' expects a boolean, got '" + value + "'");
        }

        // Days since 1970-01-01 for a proleptic Gregorian date.
        inline long long days_from_civil(long long y, unsigned m, unsigned d) {
            y -= m <= 2 ? 1 : 0;
            const long long era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<long long>(doe) - 719468;
        }

        /**
         * @brief Parse a YYYY-MM-DD date into a UTC midnight time point
         */
        inline std::chrono::system_clock::time_point parse_date(const std::string &key, const std::string &value) {
            int y = 0;
            unsigned m = 0, d = 0;
            char dash1 = 0, dash2 = 0;
            std::istringstream iss(value);
            iss >> y >> dash1 >> m >> dash2 >> d;
            if (!iss || dash1 != '-' || dash2 != '-' || m < 1 || m > 12 || d < 1 || d > 31 || !iss.eof()) {
                throw ValidationError("config: '" + key + "' expects YYYY-MM-DD, got '" + value + "'");
            }
            auto days = days_from_civil(y, m, d);
            return std::chrono::system_clock::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::hours(24) * days));
        }

    } // namespace detail

    inline void AnalysisConfig::validate() const {
        if (aoi_segments < 32) {
            throw ValidationError("config: aoi.segments must be at least 32");
        }
        if (fetch.lookback_days <= 0) {
            throw ValidationError("config: fetch.lookback_days must be positive");
        }
        if (!(fetch.max_cloud_fraction >= 0.0 && fetch.max_cloud_fraction <= 1.0)) {
            throw ValidationError("config: fetch.max_cloud_fraction must be within [0, 1]");
        }
        if (!(fetch.resolution_m > 0.0)) {
            throw ValidationError("config: fetch.resolution_m must be positive");
        }
        if (fetch.max_cells == 0) {
            throw ValidationError("config: fetch.max_cells must be positive");
        }
        const double thresholds[] = {classifier.water_ndwi, classifier.builtup_ndbi, classifier.vegetation_ndvi,
                                     classifier.forest_ndvi};
        for (double t : thresholds) {
            if (!(t >= -1.0 && t <= 1.0)) {
                throw ValidationError("config: classifier thresholds must be within [-1, 1]");
            }
        }
        if (!(classifier.forest_ndvi > classifier.vegetation_ndvi)) {
            throw ValidationError("config: classifier.forest_ndvi must exceed classifier.vegetation_ndvi");
        }
        if (!(vectorizer.min_region_area_sq_m >= 0.0)) {
            throw ValidationError("config: vectorize.min_region_area_sq_m must not be negative");
        }
        if (!(vectorizer.simplify_tolerance_cells >= 0.0 && vectorizer.simplify_tolerance_cells < 1.0)) {
            throw ValidationError("config: vectorize.simplify_tolerance_cells must be within [0, 1)");
        }
        if (timeout.count() < 0) {
            throw ValidationError("config: pipeline.timeout_ms must not be negative");
        }
    }

    inline void AnalysisConfig::apply(const std::unordered_map<std::string, std::string> &properties) {
        for (const auto &[raw_key, raw_value] : properties) {
            const std::string key = detail::trim(raw_key);
            const std::string value = detail::trim(raw_value);

            if (key == "aoi.segments") {
                aoi_segments = detail::parse_count(key, value);
            } else if (key == "fetch.lookback_days") {
                fetch.lookback_days =
                    static_cast<int>(detail::parse_ranged(key, value, 1, std::numeric_limits<int>::max()));
            } else if (key == "fetch.end_date") {
                fetch.end_time = detail::parse_date(key, value);
            } else if (key == "fetch.max_cloud_fraction") {
                fetch.max_cloud_fraction = detail::parse_double(key, value);
            } else if (key == "fetch.resolution_m") {
                fetch.resolution_m = detail::parse_double(key, value);
            } else if (key == "fetch.max_cells") {
                fetch.max_cells = detail::parse_count(key, value);
            } else if (key == "fetch.qa_mask_bits") {
                fetch.qa_mask_bits = static_cast<std::uint16_t>(
                    detail::parse_ranged(key, value, 0, std::numeric_limits<std::uint16_t>::max()));
            } else if (key == "classifier.water_ndwi") {
                classifier.water_ndwi = detail::parse_double(key, value);
            } else if (key == "classifier.builtup_ndbi") {
                classifier.builtup_ndbi = detail::parse_double(key, value);
            } else if (key == "classifier.vegetation_ndvi") {
                classifier.vegetation_ndvi = detail::parse_double(key, value);
            } else if (key == "classifier.forest_ndvi") {
                classifier.forest_ndvi = detail::parse_double(key, value);
            } else if (key == "classifier.workers") {
                classifier_workers = detail::parse_count(key, value);
            } else if (key == "vectorize.min_region_area_sq_m") {
                vectorizer.min_region_area_sq_m = detail::parse_double(key, value);
            } else if (key == "vectorize.simplify_tolerance_cells") {
                vectorizer.simplify_tolerance_cells = detail::parse_double(key, value);
            } else if (key == "pipeline.timeout_ms") {
                timeout = std::chrono::milliseconds(detail::parse_integer(key, value));
            } else if (key == "pipeline.verbose") {
                verbose = detail::parse_bool(key, value);
            } else {
                throw ValidationError("config: unknown key '" + key + "'");
            }
        }
        validate();
    }

    /**
     * @brief Read a `key = value` configuration file
     *
     * Blank lines and lines starting with '#' are ignored. Keys not present in
     * the file keep their defaults.
     *
     * @throws ValidationError if the file cannot be read or holds an invalid entry
     */
    inline AnalysisConfig load_config(const std::filesystem::path &path) {
        std::ifstream ifs(path);
        if (!ifs) {
            throw ValidationError("config: cannot open \"" + path.string() + "\"");
        }

        std::unordered_map<std::string, std::string> properties;
        std::string line;
        std::size_t line_no = 0;
        while (std::getline(ifs, line)) {
            ++line_no;
            std::string stripped = detail::trim(line);
            if (stripped.empty() || stripped.front() == '#') {
                continue;
            }
            auto eq = stripped.find('=');
            if (eq == std::string::npos) {
                throw ValidationError("config: line " + std::to_string(line_no) + " of \"" + path.string() +
                                      "\" is not 'key = value'");
            }
            properties[detail::trim(stripped.substr(0, eq))] = detail::trim(stripped.substr(eq + 1));
        }

        return AnalysisConfig::from_properties(properties);
    }

} // namespace covertrax
