#include "covertrax/composite.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <utility>

#include "covertrax/error.hpp"
#include "covertrax/geodesy.hpp"
#include "covertrax/utils/utils.hpp"

namespace covertrax {

    namespace {

        using Days = std::chrono::duration<long long, std::ratio<86400>>;

        std::string format_date(TimePoint t) {
            long long z = std::chrono::floor<Days>(t.time_since_epoch()).count() + 719468;
            const long long era = (z >= 0 ? z : z - 146096) / 146097;
            const long long doe = z - era * 146097;
            const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const long long mp = (5 * doy + 2) / 153;
            const long long d = doy - (153 * mp + 2) / 5 + 1;
            const long long m = mp < 10 ? mp + 3 : mp - 9;
            const long long y = yoe + era * 400 + (m <= 2 ? 1 : 0);

            char buf[16];
            std::snprintf(buf, sizeof(buf), "%04lld-%02lld-%02lld", y, m, d);
            return buf;
        }

        float median_of(std::vector<float> &values) {
            const std::size_t n = values.size();
            const std::size_t mid = n / 2;
            std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
            float upper = values[mid];
            if (n % 2 == 1) {
                return upper;
            }
            float lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
            return 0.5f * (lower + upper);
        }

    } // namespace

    CompositeFetcher::CompositeFetcher(const FetchPolicy &policy, std::shared_ptr<CompositeCache> cache, bool verbose)
        : policy_(policy), cache_(std::move(cache)), verbose_(verbose) {}

    GridSpec CompositeFetcher::target_grid(const AoiGeometry &aoi) const {
        const auto bb = aoi.bounds();
        const double width = bb.max_point.x - bb.min_point.x;
        const double height = bb.max_point.y - bb.min_point.y;
        // Around a pole the cells are sized for the AOI edge furthest from it, not for the center.
        double ref_lat = aoi.center.latitude;
        if (aoi.enclosed_pole > 0) {
            ref_lat = bb.min_point.y;
        } else if (aoi.enclosed_pole < 0) {
            ref_lat = bb.max_point.y;
        }
        const double cos_lat = std::max(std::cos(utils::deg2rad(ref_lat)), 1e-6);

        double resolution = policy_.resolution_m;
        GridSpec grid;
        while (true) {
            grid.cell_lat = resolution / geodesy::meters_per_degree_lat();
            grid.cell_lon = grid.cell_lat / cos_lat;
            grid.rows = static_cast<std::size_t>(std::ceil(height / grid.cell_lat)) + 2;
            grid.cols = static_cast<std::size_t>(std::ceil(width / grid.cell_lon)) + (aoi.enclosed_pole != 0 ? 3 : 2);
            if (grid.cells() <= policy_.max_cells) {
                break;
            }
            // Coarsen proportionally, with a little slack so the loop always converges.
            resolution *= std::sqrt(static_cast<double>(grid.cells()) / static_cast<double>(policy_.max_cells)) * 1.01;
        }
        grid.west = bb.min_point.x - grid.cell_lon;
        grid.north = std::min(bb.max_point.y + grid.cell_lat, 90.0);
        if (aoi.enclosed_pole != 0) {
            // Keep cell edges off the meridian that closes a polar AOI.
            grid.west -= 0.5 * grid.cell_lon;
        }

        if (verbose_ && resolution != policy_.resolution_m) {
            std::cout << "Coarsened grid resolution to " << resolution << " m to stay within " << policy_.max_cells
                      << " cells\n";
        }
        return grid;
    }

    DateRange CompositeFetcher::date_range() const {
        TimePoint end;
        if (policy_.end_time) {
            end = *policy_.end_time;
        } else {
            end = TimePoint(std::chrono::duration_cast<TimePoint::duration>(
                std::chrono::floor<Days>(std::chrono::system_clock::now().time_since_epoch())));
        }
        TimePoint start = end - std::chrono::duration_cast<TimePoint::duration>(Days(policy_.lookback_days));
        return DateRange{start, end};
    }

    std::vector<Scene> CompositeFetcher::normalize(std::vector<Scene> scenes, const SceneQuery &query) const {
        const std::size_t cells = query.grid.cells();
        std::vector<Scene> kept;
        kept.reserve(scenes.size());

        for (auto &scene : scenes) {
            const char *problem = nullptr;
            if (scene.grid != query.grid) {
                problem = "grid does not match the requested grid";
            } else if (std::any_of(scene.bands.begin(), scene.bands.end(),
                                   [cells](const std::vector<float> &band) { return band.size() != cells; })) {
                problem = "band plane size does not match the grid";
            } else if (!scene.qa.empty() && scene.qa.size() != cells) {
                problem = "QA plane size does not match the grid";
            } else if (!std::isfinite(scene.cloud_fraction) || scene.cloud_fraction < 0.0 ||
                       scene.cloud_fraction > 1.0) {
                problem = "cloud fraction outside [0, 1]";
            } else if (!query.range.contains(scene.acquired)) {
                problem = "acquired outside the requested window";
            }

            if (problem) {
                std::cerr << "Warning: skipping scene " << scene.id << ": " << problem << std::endl;
                continue;
            }
            if (scene.cloud_fraction > query.max_cloud_fraction) {
                if (verbose_) {
                    std::cout << "Skipping scene " << scene.id << " with cloud fraction " << scene.cloud_fraction
                              << "\n";
                }
                continue;
            }
            kept.push_back(std::move(scene));
        }

        std::sort(kept.begin(), kept.end(), [](const Scene &a, const Scene &b) {
            if (a.acquired != b.acquired) {
                return a.acquired < b.acquired;
            }
            return a.id < b.id;
        });
        return kept;
    }

    RasterComposite CompositeFetcher::reduce_median(const std::vector<Scene> &scenes, const GridSpec &grid,
                                                    const CancelToken &token) const {
        RasterComposite composite(grid);
        composite.scene_count = scenes.size();

        std::array<std::vector<float>, kBandCount> samples;
        for (auto &s : samples) {
            s.reserve(scenes.size());
        }

        for (std::size_t row = 0; row < grid.rows; ++row) {
            token.throw_if_stopped("compositing");
            for (std::size_t col = 0; col < grid.cols; ++col) {
                const std::size_t i = row * grid.cols + col;
                for (auto &s : samples) {
                    s.clear();
                }

                for (const auto &scene : scenes) {
                    if (!scene.qa.empty() && (scene.qa[i] & policy_.qa_mask_bits) != 0) {
                        continue;
                    }
                    bool finite = true;
                    for (const auto &band : scene.bands) {
                        if (!std::isfinite(band[i])) {
                            finite = false;
                            break;
                        }
                    }
                    if (!finite) {
                        continue;
                    }
                    for (std::size_t b = 0; b < kBandCount; ++b) {
                        samples[b].push_back(scene.bands[b][i]);
                    }
                }

                if (samples[0].empty()) {
                    continue;
                }
                Reflectance r;
                r.blue = median_of(samples[band_index(Band::Blue)]);
                r.green = median_of(samples[band_index(Band::Green)]);
                r.red = median_of(samples[band_index(Band::Red)]);
                r.nir = median_of(samples[band_index(Band::Nir)]);
                r.swir = median_of(samples[band_index(Band::Swir)]);
                composite.set_pixel(row, col, r);
            }
        }
        return composite;
    }

    RasterComposite CompositeFetcher::fetch(const AoiGeometry &aoi, ImagerySession &session,
                                            const CancelToken &token) const {
        const GridSpec grid = target_grid(aoi);
        const DateRange range = date_range();

        std::string key;
        if (cache_) {
            key = CompositeCache::fingerprint(aoi, grid, range, policy_.max_cloud_fraction, policy_.qa_mask_bits);
            if (auto hit = cache_->find(key)) {
                if (verbose_) {
                    std::cout << "Composite cache hit " << key << "\n";
                }
                return std::move(*hit);
            }
        }

        token.throw_if_stopped("fetching imagery");
        SceneQuery query{aoi, aoi.bounds(), grid, range, policy_.max_cloud_fraction};
        std::vector<Scene> scenes = session.query(query, token);
        token.throw_if_stopped("fetching imagery");

        const std::size_t returned = scenes.size();
        scenes = normalize(std::move(scenes), query);
        if (verbose_) {
            std::cout << "Imagery: " << returned << " scenes returned, " << scenes.size() << " kept between "
                      << format_date(range.start) << " and " << format_date(range.end) << "\n";
        }
        if (scenes.empty()) {
            throw DataUnavailableError("no scenes between " + format_date(range.start) + " and " +
                                       format_date(range.end) + " with cloud fraction <= " +
                                       std::to_string(policy_.max_cloud_fraction));
        }

        RasterComposite composite = reduce_median(scenes, grid, token);
        if (composite.valid_count() == 0) {
            throw DataUnavailableError("every pixel of the " + std::to_string(scenes.size()) +
                                       " qualifying scenes is masked");
        }

        if (cache_) {
            cache_->store(key, composite);
        }
        return composite;
    }

} // namespace covertrax
