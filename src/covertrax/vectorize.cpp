#include "covertrax/vectorize.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>

#include "covertrax/error.hpp"
#include "covertrax/geodesy.hpp"
#include "covertrax/utils/utils.hpp"

namespace covertrax {

    namespace {

        struct Edge {
            std::uint64_t from;
            std::uint64_t to;
            bool used = false;
        };

        struct Corner {
            std::int64_t row;
            std::int64_t col;
        };

    } // namespace

    std::vector<std::vector<std::size_t>> connected_components(const ClassifiedRaster &raster, LandCoverClass cls) {
        const std::size_t rows = raster.rows();
        const std::size_t cols = raster.cols();
        std::vector<std::vector<std::size_t>> components;
        std::vector<std::uint8_t> seen(raster.size(), 0);
        const auto &data = raster.data();

        for (std::size_t start = 0; start < data.size(); ++start) {
            if (seen[start] || data[start] != cls) {
                continue;
            }
            std::vector<std::size_t> cells;
            std::deque<std::size_t> queue{start};
            seen[start] = 1;
            while (!queue.empty()) {
                std::size_t i = queue.front();
                queue.pop_front();
                cells.push_back(i);
                std::size_t r = i / cols;
                std::size_t c = i % cols;

                auto visit = [&](std::size_t j) {
                    if (!seen[j] && data[j] == cls) {
                        seen[j] = 1;
                        queue.push_back(j);
                    }
                };
                if (r > 0)
                    visit(i - cols);
                if (r + 1 < rows)
                    visit(i + cols);
                if (c > 0)
                    visit(i - 1);
                if (c + 1 < cols)
                    visit(i + 1);
            }
            std::sort(cells.begin(), cells.end());
            components.push_back(std::move(cells));
        }
        return components;
    }

    namespace {

        /**
         * @brief Trace the boundary of `cells`
         *
         * `member(i)` tells whether the in-bounds cell with row-major index `i`
         * belongs to the component. Work is proportional to the component, not
         * to the raster.
         */
        template <typename Member>
        Region trace_boundary(const ClassifiedRaster &raster, const std::vector<std::size_t> &cells, Member member) {
            const std::size_t rows = raster.rows();
            const std::size_t cols = raster.cols();
            const std::uint64_t stride = static_cast<std::uint64_t>(cols) + 1;

            auto inside = [&](std::int64_t r, std::int64_t c) {
                if (r < 0 || c < 0 || r >= static_cast<std::int64_t>(rows) || c >= static_cast<std::int64_t>(cols)) {
                    return false;
                }
                return member(static_cast<std::size_t>(r) * cols + static_cast<std::size_t>(c));
            };
            auto corner_id = [stride](std::int64_t r, std::int64_t c) {
                return static_cast<std::uint64_t>(r) * stride + static_cast<std::uint64_t>(c);
            };
            auto decode = [stride](std::uint64_t id) {
                return Corner{static_cast<std::int64_t>(id / stride), static_cast<std::int64_t>(id % stride)};
            };

            // Directed boundary edges with the component on the left in a y-up frame (y = -row).
            std::vector<Edge> edges;
            std::unordered_map<std::uint64_t, std::vector<std::size_t>> outgoing;
            auto add_edge = [&](std::int64_t r0, std::int64_t c0, std::int64_t r1, std::int64_t c1) {
                std::uint64_t from = corner_id(r0, c0);
                outgoing[from].push_back(edges.size());
                edges.push_back(Edge{from, corner_id(r1, c1)});
            };
            for (std::size_t i : cells) {
                auto r = static_cast<std::int64_t>(i / cols);
                auto c = static_cast<std::int64_t>(i % cols);
                if (!inside(r + 1, c))
                    add_edge(r + 1, c, r + 1, c + 1);
                if (!inside(r, c + 1))
                    add_edge(r + 1, c + 1, r, c + 1);
                if (!inside(r - 1, c))
                    add_edge(r, c + 1, r, c);
                if (!inside(r, c - 1))
                    add_edge(r, c, r + 1, c);
            }

            auto direction = [&](const Edge &e) {
                Corner a = decode(e.from);
                Corner b = decode(e.to);
                return std::make_pair(b.col - a.col, -(b.row - a.row));
            };

            std::vector<datapod::Polygon> rings;
            for (std::size_t start = 0; start < edges.size(); ++start) {
                if (edges[start].used) {
                    continue;
                }
                datapod::Polygon ring;
                std::size_t current = start;
                while (true) {
                    Edge &edge = edges[current];
                    edge.used = true;
                    Corner a = decode(edge.from);
                    ring.vertices.push_back(
                        datapod::Point{static_cast<double>(a.col), -static_cast<double>(a.row), 0.0});

                    const auto in_dir = direction(edge);
                    std::size_t next = edges.size();
                    std::int64_t best_turn = 0;
                    for (std::size_t candidate : outgoing[edge.to]) {
                        if (edges[candidate].used && candidate != start) {
                            continue;
                        }
                        const auto out_dir = direction(edges[candidate]);
                        std::int64_t turn = in_dir.first * out_dir.second - in_dir.second * out_dir.first;
                        if (next == edges.size() || turn < best_turn) {
                            next = candidate;
                            best_turn = turn;
                        }
                    }
                    if (next == edges.size()) {
                        throw InternalError("vectorize: open boundary at corner " + std::to_string(edge.to));
                    }
                    if (next == start) {
                        break;
                    }
                    current = next;
                }
                rings.push_back(utils::remove_colinear_points(utils::close_polygon(ring), 0.5));
            }

            Region region;
            bool have_outer = false;
            auto to_lonlat = [&raster](const datapod::Polygon &ring) {
                datapod::Polygon out;
                out.vertices.reserve(ring.vertices.size());
                for (const auto &p : ring.vertices) {
                    out.vertices.push_back(raster.spec().corner(static_cast<std::size_t>(-p.y), static_cast<std::size_t>(p.x)));
                }
                return out;
            };
            for (const auto &ring : rings) {
                if (utils::signed_area(ring) > 0.0) {
                    if (have_outer) {
                        throw InternalError("vectorize: component boundary has more than one outer ring");
                    }
                    region.outer = to_lonlat(ring);
                    have_outer = true;
                } else {
                    region.holes.push_back(to_lonlat(ring));
                }
            }
            if (!have_outer) {
                throw InternalError("vectorize: component boundary has no outer ring");
            }
            return region;
        }

    } // namespace

    Region trace_component(const ClassifiedRaster &raster, const std::vector<std::size_t> &cells) {
        std::vector<std::size_t> sorted = cells;
        std::sort(sorted.begin(), sorted.end());
        return trace_boundary(raster, cells, [&sorted](std::size_t i) {
            return std::binary_search(sorted.begin(), sorted.end(), i);
        });
    }

    std::vector<Region> trace_regions(const ClassifiedRaster &raster, LandCoverClass cls, const CancelToken &token) {
        // Two components of one class never share an edge, so a 4-neighbour of
        // the class belongs to the component being traced.
        const auto &data = raster.data();
        auto same_class = [&data, cls](std::size_t i) { return data[i] == cls; };

        std::vector<Region> regions;
        for (const auto &cells : connected_components(raster, cls)) {
            token.throw_if_stopped("vectorizing");
            regions.push_back(trace_boundary(raster, cells, same_class));
        }
        return regions;
    }

    Vectorizer::Vectorizer(const VectorizerOptions &options) : options_(options) {}

    LayerSet Vectorizer::vectorize(const ClassifiedRaster &raster, const AoiGeometry &aoi,
                                   const CancelToken &token) const {
        LayerSet layers = make_empty_layers();
        const GridSpec &grid = raster.spec();
        const PlanarPolygon aoi_poly = geodesy::to_planar(aoi.region());
        const double tolerance = options_.simplify_tolerance_cells * std::min(grid.cell_lon, grid.cell_lat);

        // A collapsed AOI (radius below floating resolution) covers nothing.
        if (!(bg::area(aoi_poly) > 0.0)) {
            return layers;
        }

        for (auto cls : kReportedClasses) {
            token.throw_if_stopped("vectorizing");
            auto &layer = layers[cls];
            std::size_t counter = 0;

            for (const auto &region : trace_regions(raster, cls, token)) {
                token.throw_if_stopped("vectorizing");
                PlanarMultiPolygon clipped;
                bg::intersection(geodesy::to_planar(region), aoi_poly, clipped);

                for (auto &part : clipped) {
                    PlanarPolygon chosen = part;
                    if (tolerance > 0.0) {
                        PlanarPolygon simplified;
                        bg::simplify(part, simplified, tolerance);
                        if (simplified.outer().size() >= 4 && bg::is_valid(simplified)) {
                            chosen = simplified;
                        }
                    }

                    std::string reason;
                    if (!bg::is_valid(chosen, reason)) {
                        bg::correct(chosen);
                        if (!bg::is_valid(chosen, reason)) {
                            throw InternalError(std::string("vectorize: invalid ") + class_name(cls) +
                                                " polygon after clipping: " + reason);
                        }
                    }

                    LayerFeature feature;
                    feature.cls = cls;
                    feature.region = geodesy::from_planar(chosen);
                    feature.area_sq_m = geodesy::region_area_sq_m(feature.region);
                    if (feature.area_sq_m < options_.min_region_area_sq_m) {
                        continue;
                    }
                    feature.id = std::string(class_name(cls)) + "-" + std::to_string(++counter);
                    layer.features.push_back(std::move(feature));
                }
            }
        }
        return layers;
    }

} // namespace covertrax
