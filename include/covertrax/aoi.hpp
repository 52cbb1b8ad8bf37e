#pragma once

#include <cmath>
#include <cstddef>
#include <string>

#include <datapod/datapod.hpp>

#include "covertrax/error.hpp"
#include "covertrax/geodesy.hpp"
#include "covertrax/types.hpp"
#include "covertrax/utils/utils.hpp"

namespace covertrax {

    /**
     * @brief Closed polygon approximating the geodesic circle of a request
     *
     * Vertices are (x = longitude, y = latitude) in degrees, counter-clockwise,
     * with the first vertex repeated at the end. Longitudes are unwrapped
     * relative to the center, so a ring crossing the antimeridian may hold
     * values beyond +/-180.
     *
     * A circle that encloses a pole cannot be drawn as a simple ring in
     * (lon, lat); `enclosed_pole` is then +1 (north) or -1 (south) and
     * region() closes the ring along that pole.
     */
    struct AoiGeometry {
        datapod::Polygon polygon;
        datapod::Geo center;
        double radius_m = 0.0;
        double requested_area_sq_m = 0.0;
        int enclosed_pole = 0;

        /// Number of distinct vertices (the closing vertex is not counted).
        std::size_t segments() const { return polygon.vertices.empty() ? 0 : polygon.vertices.size() - 1; }

        /// Bounds of region(), which reach the pole for a polar AOI.
        datapod::AABB bounds() const { return region().outer.get_aabb(); }

        /**
         * @brief The AOI as a simple (lon, lat) region, used for clipping and areas
         *
         * For a polar AOI the ring is unwrapped over one full turn of longitude
         * and closed by two meridian edges and an edge along the pole.
         */
        Region region() const {
            if (enclosed_pole == 0 || segments() == 0) {
                return Region{polygon, {}};
            }

            const std::size_t n = segments();
            const auto &v = polygon.vertices;
            double sweep = 0.0;
            for (std::size_t i = 0; i < n; ++i) {
                sweep += utils::wrap_longitude_delta(v[i + 1].x - v[i].x);
            }
            // Start at the western end for an eastward sweep, the eastern end otherwise.
            std::size_t start = 0;
            for (std::size_t i = 1; i < n; ++i) {
                if (sweep > 0.0 ? v[i].x < v[start].x : v[i].x > v[start].x) {
                    start = i;
                }
            }

            datapod::Polygon ring;
            ring.vertices.reserve(n + 4);
            double lon = v[start].x;
            ring.vertices.push_back(datapod::Point{lon, v[start].y, 0.0});
            for (std::size_t k = 1; k <= n; ++k) {
                const auto &p = v[(start + k) % n];
                lon += utils::wrap_longitude_delta(p.x - lon);
                ring.vertices.push_back(datapod::Point{lon, p.y, 0.0});
            }
            const double pole_lat = enclosed_pole > 0 ? 90.0 : -90.0;
            ring.vertices.push_back(datapod::Point{lon, pole_lat, 0.0});
            ring.vertices.push_back(datapod::Point{v[start].x, pole_lat, 0.0});
            ring.vertices.push_back(ring.vertices.front());
            return Region{utils::with_winding(ring, true), {}};
        }
    };

    /**
     * @brief Check a request against the input contract
     *
     * @throws ValidationError naming the first violated constraint
     */
    inline void validate_request(const AoiRequest &request) {
        if (request.name.empty()) {
            throw ValidationError("name must not be empty");
        }
        if (!std::isfinite(request.latitude) || request.latitude < -90.0 || request.latitude > 90.0) {
            throw ValidationError("latitude must be within [-90, 90], got " + std::to_string(request.latitude));
        }
        if (!std::isfinite(request.longitude) || request.longitude < -180.0 || request.longitude > 180.0) {
            throw ValidationError("longitude must be within [-180, 180], got " + std::to_string(request.longitude));
        }
        if (!std::isfinite(request.area_sq_m) || !(request.area_sq_m > 0.0)) {
            throw ValidationError("area_sq_m must be > 0, got " + std::to_string(request.area_sq_m));
        }
    }

    /**
     * @brief Radius of the circle whose planar area is `area_sq_m`
     */
    inline double radius_for_area(double area_sq_m) { return std::sqrt(area_sq_m / M_PI); }

    /**
     * @brief Build the AOI polygon for a request
     *
     * Emits `segments` vertices at equally spaced azimuths, each the WGS84
     * geodesic destination at the circle radius from the center. A radius that
     * rounds to zero still yields a closed (collapsed) ring.
     *
     * @param request The validated or unvalidated request
     * @param segments Number of distinct vertices, at least 32
     * @return AoiGeometry with a closed counter-clockwise ring
     */
    inline AoiGeometry build_aoi(const AoiRequest &request, std::size_t segments = 128) {
        validate_request(request);
        if (segments < 32) {
            throw ValidationError("AOI polygon needs at least 32 segments, got " + std::to_string(segments));
        }

        AoiGeometry aoi;
        aoi.center = datapod::Geo{request.latitude, request.longitude, 0.0};
        aoi.radius_m = radius_for_area(request.area_sq_m);
        aoi.requested_area_sq_m = request.area_sq_m;

        aoi.polygon.vertices.reserve(segments + 1);
        // Walking azimuths backwards (west of north first) gives a CCW ring in (lon, lat).
        for (std::size_t i = 0; i < segments; ++i) {
            double azimuth = 360.0 - 360.0 * static_cast<double>(i) / static_cast<double>(segments);
            if (azimuth >= 360.0) {
                azimuth -= 360.0;
            }
            datapod::Point p = geodesy::direct(request.latitude, request.longitude, azimuth, aoi.radius_m);
            p.x = request.longitude + utils::wrap_longitude_delta(p.x - request.longitude);
            aoi.polygon.vertices.push_back(p);
        }
        aoi.polygon.vertices.push_back(aoi.polygon.vertices.front());

        // A ring around a pole turns once through every longitude instead of returning.
        double sweep = 0.0;
        for (std::size_t i = 0; i < segments; ++i) {
            sweep += utils::wrap_longitude_delta(aoi.polygon.vertices[i + 1].x - aoi.polygon.vertices[i].x);
        }
        if (std::abs(sweep) > 180.0) {
            aoi.enclosed_pole = request.latitude >= 0.0 ? 1 : -1;
        }

        return aoi;
    }

} // namespace covertrax
