#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "covertrax/imagery.hpp"
#include "covertrax/raster.hpp"

namespace covertrax {

    namespace sources {

        /// Reflectance as a function of (latitude, longitude) in degrees.
        using ReflectanceField = std::function<Reflectance(double, double)>;
        /// QA bits as a function of (latitude, longitude) in degrees.
        using QaField = std::function<std::uint16_t(double, double)>;

        // Typical surface reflectances, in Band order.
        inline Reflectance water() { return Reflectance{0.08f, 0.10f, 0.06f, 0.03f, 0.01f}; }
        inline Reflectance forest() { return Reflectance{0.03f, 0.08f, 0.04f, 0.45f, 0.20f}; }
        inline Reflectance cropland() { return Reflectance{0.05f, 0.10f, 0.08f, 0.30f, 0.20f}; }
        inline Reflectance built_up() { return Reflectance{0.12f, 0.15f, 0.20f, 0.25f, 0.35f}; }
        inline Reflectance bare() { return Reflectance{0.15f, 0.20f, 0.25f, 0.30f, 0.30f}; }

        inline ReflectanceField uniform(const Reflectance &r) {
            return [r](double, double) { return r; };
        }

        /**
         * @brief Recipe for one scene rendered onto whatever grid is queried
         *
         * Without an acquisition time the scene is dated `days_before_end` days
         * before the end of the queried window.
         */
        struct SyntheticScene {
            std::string id;
            std::optional<TimePoint> acquired;
            int days_before_end = 1;
            double cloud_fraction = 0.0;
            ReflectanceField field;
            QaField qa;
        };

        /**
         * @brief In-memory imagery source rendering scenes at cell centers
         *
         * Counts opened and still-open sessions so callers can check that
         * sessions are released. A query delay makes the session wait while
         * polling the cancel token, returning nothing once it is stopped.
         */
        class SyntheticImagerySource : public ImagerySource {
          public:
            struct Counters {
                std::atomic<int> sessions_opened{0};
                std::atomic<int> open_sessions{0};
                std::atomic<int> queries{0};
            };

            explicit SyntheticImagerySource(std::vector<SyntheticScene> scenes = {})
                : scenes_(std::move(scenes)), counters_(std::make_shared<Counters>()) {}

            void add_scene(SyntheticScene scene) { scenes_.push_back(std::move(scene)); }

            void set_query_delay(std::chrono::milliseconds delay) { query_delay_ = delay; }

            /// Make every query throw, as an unreachable upstream would.
            void set_failure(std::string message) { failure_ = std::move(message); }

            int sessions_opened() const { return counters_->sessions_opened.load(); }
            int open_sessions() const { return counters_->open_sessions.load(); }
            int queries() const { return counters_->queries.load(); }

            std::unique_ptr<ImagerySession> open() override {
                return std::make_unique<Session>(scenes_, query_delay_, failure_, counters_);
            }

          private:
            class Session : public ImagerySession {
              public:
                Session(std::vector<SyntheticScene> scenes, std::chrono::milliseconds delay,
                        std::optional<std::string> failure, std::shared_ptr<Counters> counters)
                    : scenes_(std::move(scenes)), delay_(delay), failure_(std::move(failure)),
                      counters_(std::move(counters)) {
                    ++counters_->sessions_opened;
                    ++counters_->open_sessions;
                }

                ~Session() override { --counters_->open_sessions; }

                std::vector<Scene> query(const SceneQuery &query, const CancelToken &token) override {
                    ++counters_->queries;
                    if (failure_) {
                        throw std::runtime_error(*failure_);
                    }

                    const auto until = std::chrono::steady_clock::now() + delay_;
                    while (std::chrono::steady_clock::now() < until) {
                        if (token.stop_requested()) {
                            return {};
                        }
                        std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    }

                    std::vector<Scene> out;
                    out.reserve(scenes_.size());
                    for (const auto &recipe : scenes_) {
                        out.push_back(render(recipe, query));
                    }
                    return out;
                }

              private:
                static Scene render(const SyntheticScene &recipe, const SceneQuery &query) {
                    const GridSpec &grid = query.grid;
                    Scene scene;
                    scene.id = recipe.id;
                    scene.acquired = recipe.acquired
                                         ? *recipe.acquired
                                         : query.range.end - std::chrono::hours(24 * recipe.days_before_end);
                    scene.cloud_fraction = recipe.cloud_fraction;
                    scene.grid = grid;
                    for (auto &band : scene.bands) {
                        band.resize(grid.cells());
                    }
                    if (recipe.qa) {
                        scene.qa.resize(grid.cells());
                    }

                    for (std::size_t row = 0; row < grid.rows; ++row) {
                        for (std::size_t col = 0; col < grid.cols; ++col) {
                            const std::size_t i = row * grid.cols + col;
                            const auto center = grid.cell_center(row, col);
                            const Reflectance r = recipe.field(center.y, center.x);
                            scene.bands[band_index(Band::Blue)][i] = r.blue;
                            scene.bands[band_index(Band::Green)][i] = r.green;
                            scene.bands[band_index(Band::Red)][i] = r.red;
                            scene.bands[band_index(Band::Nir)][i] = r.nir;
                            scene.bands[band_index(Band::Swir)][i] = r.swir;
                            if (recipe.qa) {
                                scene.qa[i] = recipe.qa(center.y, center.x);
                            }
                        }
                    }
                    return scene;
                }

                std::vector<SyntheticScene> scenes_;
                std::chrono::milliseconds delay_;
                std::optional<std::string> failure_;
                std::shared_ptr<Counters> counters_;
            };

            std::vector<SyntheticScene> scenes_;
            std::chrono::milliseconds query_delay_{0};
            std::optional<std::string> failure_;
            std::shared_ptr<Counters> counters_;
        };

    } // namespace sources

} // namespace covertrax
