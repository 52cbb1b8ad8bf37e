#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "covertrax/aoi.hpp"
#include "covertrax/cancel.hpp"
#include "covertrax/raster.hpp"

namespace covertrax {

    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Closed acquisition window [start, end]
     */
    struct DateRange {
        TimePoint start;
        TimePoint end;

        bool contains(TimePoint t) const { return t >= start && t <= end; }
    };

    /**
     * @brief One satellite acquisition resampled onto the requested grid
     *
     * Band planes are row-major with grid.cells() values each. The QA plane
     * is optional; when present it has the same size and holds per-pixel
     * quality bits (cloud, cirrus, ...).
     */
    struct Scene {
        std::string id;
        TimePoint acquired;
        double cloud_fraction = 0.0; ///< [0, 1]
        GridSpec grid;
        std::array<std::vector<float>, kBandCount> bands;
        std::vector<std::uint16_t> qa;
    };

    /**
     * @brief What the composite fetcher asks the imagery source for
     */
    struct SceneQuery {
        AoiGeometry aoi;
        datapod::AABB bounds;
        GridSpec grid;
        DateRange range;
        double max_cloud_fraction = 1.0;
    };

    /**
     * @brief Connection-scoped access to the imagery provider
     *
     * Destroying the session releases whatever it holds (connections,
     * in-flight requests). query() should poll the token during long
     * operations and return early once it is stopped.
     */
    class ImagerySession {
      public:
        virtual ~ImagerySession() = default;

        virtual std::vector<Scene> query(const SceneQuery &query, const CancelToken &token) = 0;
    };

    /**
     * @brief Factory for imagery sessions, owned by the orchestrator
     *
     * Authentication and connection lifecycle live behind this interface.
     */
    class ImagerySource {
      public:
        virtual ~ImagerySource() = default;

        virtual std::unique_ptr<ImagerySession> open() = 0;
    };

} // namespace covertrax
