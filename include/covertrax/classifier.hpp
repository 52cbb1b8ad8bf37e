#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "covertrax/cancel.hpp"
#include "covertrax/config.hpp"
#include "covertrax/raster.hpp"
#include "covertrax/types.hpp"

namespace covertrax {

    struct SpectralIndices {
        double ndwi = 0.0;
        double ndvi = 0.0;
        double ndbi = 0.0;
    };

    /// (a - b) / (a + b), with 0 where the denominator vanishes.
    inline double normalized_difference(double a, double b) {
        const double sum = a + b;
        if (sum == 0.0) {
            return 0.0;
        }
        return (a - b) / sum;
    }

    inline SpectralIndices compute_indices(const Reflectance &r) {
        SpectralIndices idx;
        idx.ndwi = normalized_difference(r.green, r.nir);
        idx.ndvi = normalized_difference(r.nir, r.red);
        idx.ndbi = normalized_difference(r.swir, r.nir);
        return idx;
    }

    /**
     * @brief One entry of the classification precedence list
     */
    struct ClassRule {
        LandCoverClass cls;
        std::string description;
        std::function<bool(const SpectralIndices &)> predicate;
    };

    /**
     * @brief Check thresholds, throwing ValidationError on the first bad one
     */
    void validate_thresholds(const ClassifierThresholds &thresholds);

    /**
     * @brief Ordered rules for the given thresholds: water, infrastructure, forest, agriculture
     */
    std::vector<ClassRule> make_rules(const ClassifierThresholds &thresholds);

    /**
     * @brief Labels composite cells with one land-cover class each
     *
     * Rules are tried in order and the first match wins, so classes are
     * mutually exclusive by construction. Invalid composite cells and cells
     * matching no rule are Unclassified.
     */
    class SpectralClassifier {
      public:
        /**
         * @param thresholds Index thresholds, validated here
         * @param workers Number of classification threads, 0 for the hardware concurrency
         */
        explicit SpectralClassifier(const ClassifierThresholds &thresholds = {}, std::size_t workers = 0);

        const std::vector<ClassRule> &rules() const { return rules_; }
        const ClassifierThresholds &thresholds() const { return thresholds_; }

        LandCoverClass classify_indices(const SpectralIndices &indices) const;

        LandCoverClass classify_cell(const Reflectance &reflectance) const {
            return classify_indices(compute_indices(reflectance));
        }

        /**
         * @brief Classify every cell of the composite in parallel row bands
         *
         * @throws TimeoutError if the token is stopped while classifying
         */
        ClassifiedRaster classify(const RasterComposite &composite, const CancelToken &token = CancelToken()) const;

      private:
        ClassifierThresholds thresholds_;
        std::vector<ClassRule> rules_;
        std::size_t workers_;
    };

} // namespace covertrax
