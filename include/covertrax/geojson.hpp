#pragma once

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "covertrax/geodesy.hpp"
#include "covertrax/types.hpp"

namespace covertrax {

    namespace detail {
        inline std::string escape_string(const std::string &s) {
            std::string result;
            result.reserve(s.size() + 2);
            for (char c : s) {
                switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        std::ostringstream hex;
                        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(static_cast<unsigned char>(c));
                        result += hex.str();
                    } else {
                        result += c;
                    }
                    break;
                }
            }
            return result;
        }

        inline void write_ring(std::ostringstream &oss, const datapod::Polygon &ring) {
            oss << "[";
            bool first = true;
            for (const auto &p : ring.vertices) {
                if (!first)
                    oss << ",";
                first = false;
                const double lon = (p.x < -180.0 || p.x > 180.0) ? utils::normalize_longitude(p.x) : p.x;
                oss << "[" << lon << "," << p.y << "]";
            }
            oss << "]";
        }

        inline void write_polygon(std::ostringstream &oss, const Region &region) {
            oss << "[";
            write_ring(oss, region.outer);
            for (const auto &hole : region.holes) {
                oss << ",";
                write_ring(oss, hole);
            }
            oss << "]";
        }
    } // namespace detail

    /**
     * @brief GeoJSON geometry of a region, [lon, lat] positions within [-180, 180]
     *
     * A region crossing the antimeridian is written as a MultiPolygon with one
     * polygon per side, anything else as a Polygon (outer ring then holes).
     */
    inline std::string region_to_geojson(const Region &region) {
        std::vector<Region> parts = geodesy::split_at_antimeridian(region);
        if (parts.empty()) {
            parts.push_back(region);
        }

        std::ostringstream oss;
        oss << std::setprecision(15);
        if (parts.size() == 1) {
            oss << R"({"type":"Polygon","coordinates":)";
            detail::write_polygon(oss, parts.front());
        } else {
            oss << R"({"type":"MultiPolygon","coordinates":[)";
            for (std::size_t i = 0; i < parts.size(); ++i) {
                if (i > 0)
                    oss << ",";
                detail::write_polygon(oss, parts[i]);
            }
            oss << "]";
        }
        oss << "}";
        return oss.str();
    }

    inline std::string feature_to_geojson(const LayerFeature &feature) {
        std::ostringstream oss;
        oss << std::setprecision(15);
        oss << R"({"type":"Feature","id":")" << detail::escape_string(feature.id) << "\"";
        oss << R"(,"properties":{"class":")" << class_name(feature.cls) << "\"";
        oss << R"(,"area_sq_m":)" << feature.area_sq_m;
        oss << R"(,"id":")" << detail::escape_string(feature.id) << "\"}";
        oss << R"(,"geometry":)" << region_to_geojson(feature.region) << "}";
        return oss.str();
    }

    inline std::string to_geojson(const LayerFeatureCollection &layer) {
        std::ostringstream oss;
        oss << R"({"type":"FeatureCollection","features":[)";
        bool first = true;
        for (const auto &feature : layer.features) {
            if (!first)
                oss << ",";
            first = false;
            oss << feature_to_geojson(feature);
        }
        oss << "]}";
        return oss.str();
    }

    inline std::string to_geojson(const AnalysisSummary &summary) {
        std::ostringstream oss;
        oss << std::setprecision(15);
        oss << R"({"name":")" << detail::escape_string(summary.name) << "\"";
        oss << R"(,"total_area_sq_m":)" << summary.total_area_sq_m;
        oss << R"(,"water_area_sq_m":)" << summary.water_area_sq_m;
        oss << R"(,"agriculture_area_sq_m":)" << summary.agriculture_area_sq_m;
        oss << R"(,"forest_area_sq_m":)" << summary.forest_area_sq_m;
        oss << R"(,"infrastructure_area_sq_m":)" << summary.infrastructure_area_sq_m;
        oss << R"(,"unclassified_area_sq_m":)" << summary.unclassified_area_sq_m;
        oss << R"(,"water_pct":)" << summary.water_pct;
        oss << R"(,"agriculture_pct":)" << summary.agriculture_pct;
        oss << R"(,"forest_pct":)" << summary.forest_pct;
        oss << R"(,"infrastructure_pct":)" << summary.infrastructure_pct;
        oss << R"(,"input_area_sq_m":)" << summary.input_area_sq_m;
        oss << R"(,"calculated_radius_m":)" << summary.calculated_radius_m;
        oss << R"(,"latitude":)" << summary.latitude;
        oss << R"(,"longitude":)" << summary.longitude;
        oss << "}";
        return oss.str();
    }

    /**
     * @brief Full response document: {"summary": {...}, "layers": {class: FeatureCollection}}
     *
     * Every reported class has a key under "layers", empty collections included.
     */
    inline std::string to_geojson(const AnalysisResult &result) {
        std::ostringstream oss;
        oss << R"({"summary":)" << to_geojson(result.summary) << R"(,"layers":{)";
        bool first = true;
        for (auto cls : kReportedClasses) {
            if (!first)
                oss << ",";
            first = false;
            oss << "\"" << class_name(cls) << "\":";
            auto it = result.layers.find(cls);
            if (it == result.layers.end()) {
                oss << to_geojson(LayerFeatureCollection{cls, {}});
            } else {
                oss << to_geojson(it->second);
            }
        }
        oss << "}}";
        return oss.str();
    }

    inline void write_geojson(const AnalysisResult &result, const std::filesystem::path &path) {
        std::ofstream ofs(path);
        if (!ofs)
            throw std::runtime_error("Cannot open for write: " + path.string());
        ofs << to_geojson(result) << "\n";
    }

} // namespace covertrax
