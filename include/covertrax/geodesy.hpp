#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/formulas/vincenty_direct.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/ring.hpp>
#include <boost/geometry/strategies/transform/matrix_transformers.hpp>
#include <boost/geometry/srs/spheroid.hpp>
#include <boost/geometry/strategies/geographic/area.hpp>

#include <datapod/datapod.hpp>

#include "covertrax/types.hpp"
#include "covertrax/utils/utils.hpp"

namespace covertrax {

    namespace bg = boost::geometry;

    // Planar model in (lon, lat) degrees, used for clipping and simplification.
    using PlanarPoint = bg::model::d2::point_xy<double>;
    using PlanarPolygon = bg::model::polygon<PlanarPoint, false, true>;
    using PlanarMultiPolygon = bg::model::multi_polygon<PlanarPolygon>;

    // Geographic model on the WGS84 spheroid, used for areas.
    using GeoPoint = bg::model::point<double, 2, bg::cs::geographic<bg::degree>>;
    using GeoRing = bg::model::ring<GeoPoint, false, true>;

    namespace geodesy {

        /// Mean Earth radius (IUGG), only used to size grid cells.
        inline constexpr double kMeanEarthRadius = 6371008.8;

        inline double meters_per_degree_lat() { return kMeanEarthRadius * M_PI / 180.0; }

        inline const bg::srs::spheroid<double> &wgs84() {
            static const bg::srs::spheroid<double> spheroid;
            return spheroid;
        }

        /**
         * @brief Solve the geodesic direct problem on WGS84 (Vincenty)
         *
         * @param latitude Start latitude in degrees
         * @param longitude Start longitude in degrees
         * @param azimuth_deg Forward azimuth, clockwise from north, in degrees
         * @param distance_m Distance along the geodesic in meters
         * @return Destination point with x = longitude, y = latitude (degrees)
         */
        inline datapod::Point direct(double latitude, double longitude, double azimuth_deg, double distance_m) {
            using formula = bg::formula::vincenty_direct<double, true, false>;
            auto res = formula::apply(utils::deg2rad(longitude), utils::deg2rad(latitude), distance_m,
                                      utils::deg2rad(azimuth_deg), wgs84());
            return datapod::Point{utils::rad2deg(res.lon2), utils::rad2deg(res.lat2), 0.0};
        }

        /// Distance from a pole, in degrees of latitude, at which pole vertices are evaluated (about 11 cm).
        inline constexpr double kPoleOffsetDeg = 1e-6;

        /**
         * @brief Unsigned geodesic area of a (lon, lat) ring in square meters
         *
         * Winding does not matter. Rings with fewer than three vertices have no
         * area. Longitudes may be unwrapped. A ring closed along a pole (an edge
         * between two vertices at latitude +/-90) is evaluated with that edge
         * replaced by short geodesics kPoleOffsetDeg off the pole, which leaves
         * out a cap well below a square meter.
         */
        inline double ring_area_sq_m(const datapod::Polygon &ring) {
            if (ring.vertices.size() < 3) {
                return 0.0;
            }

            const double limit = 90.0 - kPoleOffsetDeg;
            auto clamp_lat = [limit](double lat) { return std::max(-limit, std::min(limit, lat)); };

            GeoRing geo;
            geo.reserve(ring.vertices.size() + 1);
            auto push = [&geo](double lon, double lat) { geo.push_back(GeoPoint{utils::normalize_longitude(lon), lat}); };

            const auto &v = ring.vertices;
            for (std::size_t i = 0; i < v.size(); ++i) {
                const double lat = clamp_lat(v[i].y);
                if (i > 0 && std::abs(lat) == limit && clamp_lat(v[i - 1].y) == lat) {
                    // Walk along the pole in steps short enough to keep each geodesic on the expected side.
                    const double span = v[i].x - v[i - 1].x;
                    const auto steps = static_cast<std::size_t>(std::ceil(std::abs(span) / 45.0));
                    for (std::size_t k = 1; k < steps; ++k) {
                        push(v[i - 1].x + span * static_cast<double>(k) / static_cast<double>(steps), lat);
                    }
                }
                push(v[i].x, lat);
            }
            if (!bg::equals(geo.front(), geo.back())) {
                geo.push_back(geo.front());
            }

            bg::strategy::area::geographic<bg::strategy::vincenty, 5> strategy;
            return std::abs(bg::area(geo, strategy));
        }

        /**
         * @brief Geodesic area of a region: outer ring minus its holes
         */
        inline double region_area_sq_m(const Region &region) {
            double area = ring_area_sq_m(region.outer);
            for (const auto &hole : region.holes) {
                area -= ring_area_sq_m(hole);
            }
            return area > 0.0 ? area : 0.0;
        }

        inline PlanarPolygon::ring_type to_planar_ring(const datapod::Polygon &ring) {
            PlanarPolygon::ring_type out;
            out.reserve(ring.vertices.size() + 1);
            for (const auto &p : ring.vertices) {
                out.push_back(PlanarPoint{p.x, p.y});
            }
            if (!out.empty() && !bg::equals(out.front(), out.back())) {
                out.push_back(out.front());
            }
            return out;
        }

        inline datapod::Polygon from_planar_ring(const PlanarPolygon::ring_type &ring) {
            datapod::Polygon out;
            out.vertices.reserve(ring.size());
            for (const auto &p : ring) {
                out.vertices.push_back(datapod::Point{p.x(), p.y(), 0.0});
            }
            return out;
        }

        /**
         * @brief Convert a region to a corrected Boost.Geometry polygon
         */
        inline PlanarPolygon to_planar(const Region &region) {
            PlanarPolygon poly;
            poly.outer() = to_planar_ring(region.outer);
            for (const auto &hole : region.holes) {
                poly.inners().push_back(to_planar_ring(hole));
            }
            bg::correct(poly);
            return poly;
        }

        /**
         * @brief Convert back to a region with CCW outer ring and CW holes
         */
        inline Region from_planar(const PlanarPolygon &poly) {
            Region region;
            region.outer = utils::with_winding(from_planar_ring(poly.outer()), true);
            for (const auto &inner : poly.inners()) {
                region.holes.push_back(utils::with_winding(from_planar_ring(inner), false));
            }
            return region;
        }

        /**
         * @brief Cut a region with unwrapped longitudes into parts within [-180, 180]
         *
         * Each 360 degree window the region reaches is intersected separately and
         * shifted back, so a region crossing the antimeridian comes out as one part
         * per side. A region already within range is returned unchanged.
         */
        inline std::vector<Region> split_at_antimeridian(const Region &region) {
            if (region.outer.vertices.empty()) {
                return {region};
            }
            const auto box = region.outer.get_aabb();
            if (box.min_point.x >= -180.0 && box.max_point.x <= 180.0) {
                return {region};
            }

            const PlanarPolygon poly = to_planar(region);
            const auto k_min = static_cast<long>(std::floor((box.min_point.x + 180.0) / 360.0));
            const auto k_max = static_cast<long>(std::floor((box.max_point.x + 180.0) / 360.0));

            std::vector<Region> parts;
            for (long k = k_min; k <= k_max; ++k) {
                const double shift = 360.0 * static_cast<double>(k);
                const bg::model::box<PlanarPoint> window(PlanarPoint(shift - 180.0, -90.0),
                                                         PlanarPoint(shift + 180.0, 90.0));
                PlanarMultiPolygon pieces;
                bg::intersection(poly, window, pieces);

                const bg::strategy::transform::translate_transformer<double, 2, 2> move(-shift, 0.0);
                for (const auto &piece : pieces) {
                    if (!(bg::area(piece) > 0.0)) {
                        continue;
                    }
                    PlanarPolygon moved;
                    bg::transform(piece, moved, move);
                    parts.push_back(from_planar(moved));
                }
            }
            return parts;
        }

    } // namespace geodesy

} // namespace covertrax
