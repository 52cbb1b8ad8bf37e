#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

namespace covertrax {

    /**
     * @brief Inbound analysis request: a named circle given by center and area
     */
    struct AoiRequest {
        std::string name;
        double latitude = 0.0;  ///< degrees, [-90, 90]
        double longitude = 0.0; ///< degrees, [-180, 180]
        double area_sq_m = 0.0; ///< target area of the circle, > 0
    };

    /**
     * @brief Land-cover label of a raster cell
     */
    enum class LandCoverClass : std::uint8_t {
        Water,
        Agriculture,
        Forest,
        Infrastructure,
        Unclassified,
    };

    /// The four classes that get a layer and an area in the summary, in output order.
    inline constexpr std::array<LandCoverClass, 4> kReportedClasses = {
        LandCoverClass::Water, LandCoverClass::Agriculture, LandCoverClass::Forest, LandCoverClass::Infrastructure};

    inline const char *class_name(LandCoverClass cls) {
        switch (cls) {
        case LandCoverClass::Water:
            return "water";
        case LandCoverClass::Agriculture:
            return "agriculture";
        case LandCoverClass::Forest:
            return "forest";
        case LandCoverClass::Infrastructure:
            return "infrastructure";
        case LandCoverClass::Unclassified:
            return "unclassified";
        }
        return "unclassified";
    }

    /**
     * @brief Simple polygon with optional holes
     *
     * Vertices are (x = longitude, y = latitude) in degrees. The outer ring is
     * closed and counter-clockwise, holes are closed and clockwise.
     */
    struct Region {
        datapod::Polygon outer;
        std::vector<datapod::Polygon> holes;
    };

    /**
     * @brief One vectorized region of a single class
     */
    struct LayerFeature {
        std::string id;
        LandCoverClass cls = LandCoverClass::Unclassified;
        Region region;
        double area_sq_m = 0.0;
    };

    /**
     * @brief All regions of one class, disjoint and clipped to the AOI
     */
    struct LayerFeatureCollection {
        LandCoverClass cls = LandCoverClass::Unclassified;
        std::vector<LayerFeature> features;

        bool empty() const { return features.empty(); }
        std::size_t size() const { return features.size(); }
    };

    /// Layers keyed by class. Always holds all four reported classes.
    using LayerSet = std::map<LandCoverClass, LayerFeatureCollection>;

    /**
     * @brief Layer set with an empty collection for every reported class
     */
    inline LayerSet make_empty_layers() {
        LayerSet layers;
        for (auto cls : kReportedClasses) {
            layers[cls].cls = cls;
        }
        return layers;
    }

    /**
     * @brief Area accounting of one analysis
     *
     * total_area_sq_m is the area of the AOI geometry itself. Unclassified and
     * invalid cells are not attributed to any class, so the class areas sum to
     * at most the total.
     */
    struct AnalysisSummary {
        std::string name;
        double total_area_sq_m = 0.0;
        double water_area_sq_m = 0.0;
        double agriculture_area_sq_m = 0.0;
        double forest_area_sq_m = 0.0;
        double infrastructure_area_sq_m = 0.0;
        double unclassified_area_sq_m = 0.0;

        double input_area_sq_m = 0.0;
        double calculated_radius_m = 0.0;
        double latitude = 0.0;
        double longitude = 0.0;

        double water_pct = 0.0;
        double agriculture_pct = 0.0;
        double forest_pct = 0.0;
        double infrastructure_pct = 0.0;

        double class_area(LandCoverClass cls) const {
            switch (cls) {
            case LandCoverClass::Water:
                return water_area_sq_m;
            case LandCoverClass::Agriculture:
                return agriculture_area_sq_m;
            case LandCoverClass::Forest:
                return forest_area_sq_m;
            case LandCoverClass::Infrastructure:
                return infrastructure_area_sq_m;
            case LandCoverClass::Unclassified:
                return unclassified_area_sq_m;
            }
            return 0.0;
        }

        double classified_area_sq_m() const {
            return water_area_sq_m + agriculture_area_sq_m + forest_area_sq_m + infrastructure_area_sq_m;
        }
    };

    struct AnalysisResult {
        AnalysisSummary summary;
        LayerSet layers;
    };

} // namespace covertrax
