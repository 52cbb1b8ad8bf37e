#pragma once

#ifdef HAS_RERUN

#include <datapod/datapod.hpp>

#include "../aoi.hpp"
#include "../types.hpp"
#include "rerun.hpp"
#include <iostream>
#include <memory>
#include <rerun/archetypes/geo_line_strings.hpp>
#include <rerun/components/geo_line_string.hpp>
#include <rerun/components/lat_lon.hpp>
#include <rerun/recording_stream.hpp>
#include <string>
#include <vector>

namespace covertrax {
    namespace visualize {

        inline std::vector<rerun::LatLon> ring_to_latlon(const datapod::Polygon &ring) {
            std::vector<rerun::LatLon> out;
            out.reserve(ring.vertices.size() + 1);
            for (const auto &p : ring.vertices) {
                out.push_back(rerun::LatLon{float(p.y), float(p.x)});
            }
            if (!ring.vertices.empty() && (ring.vertices.front().x != ring.vertices.back().x ||
                                           ring.vertices.front().y != ring.vertices.back().y)) {
                out.push_back(out.front());
            }
            return out;
        }

        inline rerun::Color class_color(LandCoverClass cls) {
            switch (cls) {
            case LandCoverClass::Water:
                return rerun::Color(40, 110, 220);
            case LandCoverClass::Agriculture:
                return rerun::Color(230, 190, 60);
            case LandCoverClass::Forest:
                return rerun::Color(30, 130, 50);
            case LandCoverClass::Infrastructure:
                return rerun::Color(200, 60, 60);
            case LandCoverClass::Unclassified:
                return rerun::Color(150, 150, 150);
            }
            return rerun::Color(150, 150, 150);
        }

        inline void show_aoi(const AoiGeometry &aoi, std::shared_ptr<rerun::RecordingStream> rec) {
            std::cout << "Visualizing AOI with " << aoi.polygon.vertices.size() << " points" << std::endl;

            auto border = rerun::components::GeoLineString::from_lat_lon(ring_to_latlon(aoi.polygon));
            rec->log_static("/aoi/border", rerun::archetypes::GeoLineStrings(border)
                                               .with_colors({{rerun::Color(120, 70, 70)}})
                                               .with_radii({{1.0f}}));
        }

        /**
         * @brief Log every feature ring (outer and holes) under /layers/<class>/<id>
         */
        inline void show_layers(const LayerSet &layers, std::shared_ptr<rerun::RecordingStream> rec) {
            for (const auto &[cls, layer] : layers) {
                const std::string base = std::string("/layers/") + class_name(cls);
                for (const auto &feature : layer.features) {
                    std::vector<rerun::components::GeoLineString> rings;
                    rings.push_back(rerun::components::GeoLineString::from_lat_lon(ring_to_latlon(feature.region.outer)));
                    for (const auto &hole : feature.region.holes) {
                        rings.push_back(rerun::components::GeoLineString::from_lat_lon(ring_to_latlon(hole)));
                    }
                    rec->log_static(base + "/" + feature.id, rerun::archetypes::GeoLineStrings(rings)
                                                                 .with_colors({{class_color(cls)}})
                                                                 .with_radii({{0.5f}}));
                }
            }
        }

    } // namespace visualize
} // namespace covertrax

#endif
