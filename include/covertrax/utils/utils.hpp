#pragma once

#include <cmath>
#include <cstddef>

#include <datapod/datapod.hpp>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace covertrax {

    namespace utils {

        inline double deg2rad(double deg) { return deg * M_PI / 180.0; }
        inline double rad2deg(double rad) { return rad * 180.0 / M_PI; }

        /**
         * @brief Check if two points are approximately equal in the x/y plane
         *
         * @param p1 First point
         * @param p2 Second point
         * @param epsilon Tolerance
         * @return true if points are approximately equal
         */
        inline bool points_equal(const datapod::Point &p1, const datapod::Point &p2, double epsilon = 1e-12) {
            double dx = p1.x - p2.x;
            double dy = p1.y - p2.y;
            return (dx * dx + dy * dy) <= epsilon * epsilon;
        }

        /**
         * @brief Signed shoelace area of a ring (closing vertex optional)
         *
         * Positive means counter-clockwise winding (exterior ring),
         * negative means clockwise winding (hole).
         */
        inline double signed_area(const datapod::Polygon &polygon) {
            const auto &verts = polygon.vertices;
            std::size_t n = verts.size();
            if (n < 3) {
                return 0.0;
            }

            double area = 0.0;
            for (std::size_t i = 0; i < n; ++i) {
                std::size_t j = (i + 1) % n;
                area += verts[i].x * verts[j].y;
                area -= verts[j].x * verts[i].y;
            }
            return area * 0.5;
        }

        inline bool is_ccw(const datapod::Polygon &polygon) { return signed_area(polygon) > 0.0; }

        /**
         * @brief Reverse the ring if needed so that its winding matches `ccw`
         */
        inline datapod::Polygon with_winding(const datapod::Polygon &polygon, bool ccw) {
            double area = signed_area(polygon);
            if (area == 0.0 || (area > 0.0) == ccw) {
                return polygon;
            }

            datapod::Polygon result;
            result.vertices.reserve(polygon.vertices.size());
            for (auto it = polygon.vertices.rbegin(); it != polygon.vertices.rend(); ++it) {
                result.vertices.push_back(*it);
            }
            return result;
        }

        /**
         * @brief Ensure polygon is closed (first point == last point)
         */
        inline datapod::Polygon close_polygon(const datapod::Polygon &polygon) {
            if (polygon.vertices.empty()) {
                return polygon;
            }

            datapod::Polygon result = polygon;
            if (!points_equal(result.vertices.front(), result.vertices.back())) {
                result.vertices.push_back(result.vertices.front());
            }
            return result;
        }

        /**
         * @brief Check if three points are collinear
         *
         * @param epsilon Tolerance on the doubled triangle area
         */
        inline bool are_colinear(const datapod::Point &p1, const datapod::Point &p2, const datapod::Point &p3,
                                 double epsilon = 1e-12) {
            double cross = (p2.x - p1.x) * (p3.y - p1.y) - (p2.y - p1.y) * (p3.x - p1.x);
            return std::abs(cross) <= epsilon;
        }

        /**
         * @brief Remove collinear vertices from a ring
         *
         * Accepts open or closed rings and preserves closure. Rings with fewer
         * than four distinct vertices are returned untouched.
         *
         * @param polygon The ring to simplify
         * @param epsilon Tolerance for the collinearity check
         * @return Ring without collinear vertices
         */
        inline datapod::Polygon remove_colinear_points(const datapod::Polygon &polygon, double epsilon = 1e-12) {
            const auto &pts = polygon.vertices;
            bool is_closed = pts.size() > 1 && points_equal(pts.front(), pts.back());
            std::size_t n = is_closed ? pts.size() - 1 : pts.size();

            if (n < 4) {
                return polygon;
            }

            datapod::Polygon result;
            for (std::size_t i = 0; i < n; ++i) {
                const auto &prev = pts[(i + n - 1) % n];
                const auto &curr = pts[i];
                const auto &next = pts[(i + 1) % n];

                if (!are_colinear(prev, curr, next, epsilon)) {
                    result.vertices.push_back(curr);
                }
            }

            if (is_closed && !result.vertices.empty()) {
                result.vertices.push_back(result.vertices.front());
            }
            return result;
        }

        /**
         * @brief Normalize a longitude difference to [-180, 180)
         */
        inline double wrap_longitude_delta(double delta) {
            delta = std::fmod(delta + 180.0, 360.0);
            if (delta < 0.0) {
                delta += 360.0;
            }
            return delta - 180.0;
        }

        /// Longitude in [-180, 180).
        inline double normalize_longitude(double lon) { return wrap_longitude_delta(lon); }

    } // namespace utils

} // namespace covertrax
