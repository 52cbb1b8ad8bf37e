#pragma once

#include <algorithm>
#include <cmath>
#include <string>

#include "covertrax/aoi.hpp"
#include "covertrax/error.hpp"
#include "covertrax/geodesy.hpp"
#include "covertrax/types.hpp"

namespace covertrax {

    namespace detail {
        inline double round_to(double value, int decimals) {
            const double scale = std::pow(10.0, decimals);
            return std::round(value * scale) / scale;
        }
    } // namespace detail

    /**
     * @brief Percentage of `part` in `total`, rounded to 4 decimals, 0 for an empty total
     */
    inline double percent_of(double part, double total) {
        if (!(total > 0.0)) {
            return 0.0;
        }
        return detail::round_to(100.0 * part / total, 4);
    }

    /**
     * @brief Area accounting for one analysis
     *
     * The total is the geodesic area of the AOI polygon, each class area is
     * the sum of its features' geodesic areas (outer ring minus holes). An
     * excess of the class sum over the total beyond floating noise means the
     * layers overlap or leak out of the AOI.
     *
     * @param request The request the AOI was built from
     * @param aoi Geometry of the analysis
     * @param layers Vectorized layers, clipped to the AOI
     * @return Summary with areas, unclassified remainder and percentages
     * @throws InternalError if class areas exceed the AOI area
     */
    inline AnalysisSummary aggregate(const AoiRequest &request, const AoiGeometry &aoi, const LayerSet &layers) {
        AnalysisSummary summary;
        summary.name = request.name;
        summary.input_area_sq_m = request.area_sq_m;
        summary.calculated_radius_m = aoi.radius_m;
        summary.latitude = request.latitude;
        summary.longitude = request.longitude;
        summary.total_area_sq_m = geodesy::region_area_sq_m(aoi.region());

        auto layer_area = [&layers](LandCoverClass cls) {
            double area = 0.0;
            auto it = layers.find(cls);
            if (it == layers.end()) {
                return area;
            }
            for (const auto &feature : it->second.features) {
                area += geodesy::region_area_sq_m(feature.region);
            }
            return area;
        };
        summary.water_area_sq_m = layer_area(LandCoverClass::Water);
        summary.agriculture_area_sq_m = layer_area(LandCoverClass::Agriculture);
        summary.forest_area_sq_m = layer_area(LandCoverClass::Forest);
        summary.infrastructure_area_sq_m = layer_area(LandCoverClass::Infrastructure);

        const double classified = summary.classified_area_sq_m();
        const double total = summary.total_area_sq_m;
        if (classified > total * (1.0 + 1e-6)) {
            throw InternalError("aggregate: class areas (" + std::to_string(classified) + " m2) exceed AOI area (" +
                                std::to_string(total) + " m2)");
        }
        if (classified > total && classified > 0.0) {
            const double scale = total / classified;
            summary.water_area_sq_m *= scale;
            summary.agriculture_area_sq_m *= scale;
            summary.forest_area_sq_m *= scale;
            summary.infrastructure_area_sq_m *= scale;
        }
        summary.unclassified_area_sq_m = std::max(0.0, total - summary.classified_area_sq_m());

        summary.water_pct = percent_of(summary.water_area_sq_m, total);
        summary.agriculture_pct = percent_of(summary.agriculture_area_sq_m, total);
        summary.forest_pct = percent_of(summary.forest_area_sq_m, total);
        summary.infrastructure_pct = percent_of(summary.infrastructure_area_sq_m, total);
        return summary;
    }

} // namespace covertrax
