#pragma once

#include <memory>
#include <vector>

#include "covertrax/aoi.hpp"
#include "covertrax/cache.hpp"
#include "covertrax/cancel.hpp"
#include "covertrax/config.hpp"
#include "covertrax/imagery.hpp"
#include "covertrax/raster.hpp"

namespace covertrax {

    /**
     * @brief Builds the per-pixel median composite covering an AOI
     *
     * The fetcher owns the schema of what reaches classification: scenes that
     * do not match the requested grid, lie outside the window or report an
     * impossible cloud fraction are rejected here.
     */
    class CompositeFetcher {
      public:
        explicit CompositeFetcher(const FetchPolicy &policy, std::shared_ptr<CompositeCache> cache = nullptr,
                                  bool verbose = false);

        /**
         * @brief Query the session and reduce qualifying scenes to one composite
         *
         * @throws DataUnavailableError if no scene qualifies
         * @throws TimeoutError if the token is stopped before the composite is complete
         */
        RasterComposite fetch(const AoiGeometry &aoi, ImagerySession &session, const CancelToken &token) const;

        /**
         * @brief Grid covering the AOI bounding box plus one cell of margin
         *
         * The cell size follows policy().resolution_m at the AOI latitude and is
         * coarsened until the grid fits policy().max_cells.
         */
        GridSpec target_grid(const AoiGeometry &aoi) const;

        /// Acquisition window ending at policy().end_time or today (UTC midnight).
        DateRange date_range() const;

        /**
         * @brief Drop scenes that do not conform to the query
         */
        std::vector<Scene> normalize(std::vector<Scene> scenes, const SceneQuery &query) const;

        /**
         * @brief Per-pixel, per-band median over scenes, honoring QA masks
         */
        RasterComposite reduce_median(const std::vector<Scene> &scenes, const GridSpec &grid,
                                      const CancelToken &token) const;

        const FetchPolicy &policy() const { return policy_; }

      private:
        FetchPolicy policy_;
        std::shared_ptr<CompositeCache> cache_;
        bool verbose_;
    };

} // namespace covertrax
