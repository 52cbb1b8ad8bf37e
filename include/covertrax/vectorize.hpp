#pragma once

#include <cstddef>
#include <vector>

#include "covertrax/aoi.hpp"
#include "covertrax/cancel.hpp"
#include "covertrax/config.hpp"
#include "covertrax/raster.hpp"
#include "covertrax/types.hpp"

namespace covertrax {

    /**
     * @brief 4-connected components of the cells labelled `cls`
     *
     * Components are ordered by their first cell in row-major scan order and
     * each holds the row-major indices of its cells.
     */
    std::vector<std::vector<std::size_t>> connected_components(const ClassifiedRaster &raster, LandCoverClass cls);

    /**
     * @brief Boundary of one component as a region in (lon, lat)
     *
     * Edges are traced on cell corners with the component on the left, so the
     * outer ring comes out counter-clockwise and holes clockwise. Where two
     * cells of the component touch only diagonally the trace turns right, so a
     * ring keeps following the same background cell and stays simple (an
     * outer ring and a hole may touch at such a vertex but never cross).
     * Collinear corners are dropped.
     *
     * @throws InternalError if the boundary does not close into exactly one outer ring
     */
    Region trace_component(const ClassifiedRaster &raster, const std::vector<std::size_t> &cells);

    /**
     * @brief trace_component() for every component of `cls`, in scan order
     *
     * Runs in time linear in the raster however many components there are.
     *
     * @throws TimeoutError if the token is stopped between components
     */
    std::vector<Region> trace_regions(const ClassifiedRaster &raster, LandCoverClass cls,
                                      const CancelToken &token = CancelToken());

    /**
     * @brief Turns a classified raster into one clipped polygon layer per class
     */
    class Vectorizer {
      public:
        explicit Vectorizer(const VectorizerOptions &options = {});

        /**
         * @brief Vectorize, clip to the AOI, simplify and filter every reported class
         *
         * @return Layer set holding all four reported classes, empty ones included
         * @throws InternalError if a clipped part stays invalid after dropping simplification
         * @throws TimeoutError if the token is stopped between classes or components
         */
        LayerSet vectorize(const ClassifiedRaster &raster, const AoiGeometry &aoi,
                           const CancelToken &token = CancelToken()) const;

        const VectorizerOptions &options() const { return options_; }

      private:
        VectorizerOptions options_;
    };

} // namespace covertrax
