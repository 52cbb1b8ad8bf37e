#include "covertrax/classifier.hpp"

#include <algorithm>
#include <atomic>
#include <string>
#include <system_error>
#include <thread>

#include "covertrax/error.hpp"
#include "covertrax/utils/thread_group.hpp"

namespace covertrax {

    void validate_thresholds(const ClassifierThresholds &thresholds) {
        auto in_range = [](double v) { return v >= -1.0 && v <= 1.0; };
        if (!in_range(thresholds.water_ndwi)) {
            throw ValidationError("classifier: water_ndwi must be within [-1, 1]");
        }
        if (!in_range(thresholds.builtup_ndbi)) {
            throw ValidationError("classifier: builtup_ndbi must be within [-1, 1]");
        }
        if (!in_range(thresholds.vegetation_ndvi)) {
            throw ValidationError("classifier: vegetation_ndvi must be within [-1, 1]");
        }
        if (!in_range(thresholds.forest_ndvi)) {
            throw ValidationError("classifier: forest_ndvi must be within [-1, 1]");
        }
        if (!(thresholds.forest_ndvi > thresholds.vegetation_ndvi)) {
            throw ValidationError("classifier: forest_ndvi must exceed vegetation_ndvi");
        }
    }

    std::vector<ClassRule> make_rules(const ClassifierThresholds &t) {
        std::vector<ClassRule> rules;
        rules.push_back({LandCoverClass::Water, "ndwi > water_ndwi",
                         [t](const SpectralIndices &i) { return i.ndwi > t.water_ndwi; }});
        rules.push_back({LandCoverClass::Infrastructure, "ndbi > builtup_ndbi and ndvi < vegetation_ndvi",
                         [t](const SpectralIndices &i) { return i.ndbi > t.builtup_ndbi && i.ndvi < t.vegetation_ndvi; }});
        rules.push_back({LandCoverClass::Forest, "ndvi > forest_ndvi",
                         [t](const SpectralIndices &i) { return i.ndvi > t.forest_ndvi; }});
        rules.push_back({LandCoverClass::Agriculture, "ndvi > vegetation_ndvi",
                         [t](const SpectralIndices &i) { return i.ndvi > t.vegetation_ndvi; }});
        return rules;
    }

    SpectralClassifier::SpectralClassifier(const ClassifierThresholds &thresholds, std::size_t workers)
        : thresholds_(thresholds), workers_(workers) {
        validate_thresholds(thresholds_);
        rules_ = make_rules(thresholds_);
        if (workers_ == 0) {
            workers_ = std::max(1u, std::thread::hardware_concurrency());
        }
    }

    LandCoverClass SpectralClassifier::classify_indices(const SpectralIndices &indices) const {
        for (const auto &rule : rules_) {
            if (rule.predicate(indices)) {
                return rule.cls;
            }
        }
        return LandCoverClass::Unclassified;
    }

    ClassifiedRaster SpectralClassifier::classify(const RasterComposite &composite, const CancelToken &token) const {
        const GridSpec &grid = composite.grid;
        ClassifiedRaster out(grid, LandCoverClass::Unclassified);
        if (grid.rows == 0 || grid.cols == 0) {
            return out;
        }

        const std::size_t workers = std::min(workers_, grid.rows);
        const std::size_t band = (grid.rows + workers - 1) / workers;
        std::atomic<bool> stopped{false};

        auto work = [&](std::size_t row_begin, std::size_t row_end) {
            for (std::size_t row = row_begin; row < row_end; ++row) {
                if (stopped.load(std::memory_order_relaxed) || token.stop_requested()) {
                    stopped.store(true, std::memory_order_relaxed);
                    return;
                }
                for (std::size_t col = 0; col < grid.cols; ++col) {
                    if (!composite.is_valid(row, col)) {
                        continue;
                    }
                    out(row, col) = classify_cell(composite.pixel(row, col));
                }
            }
        };

        utils::ThreadGroup group;
        try {
            for (std::size_t w = 0; w < workers; ++w) {
                const std::size_t begin = w * band;
                const std::size_t end = std::min(grid.rows, begin + band);
                if (begin >= end) {
                    break;
                }
                group.spawn(work, begin, end);
            }
        } catch (const std::system_error &e) {
            stopped.store(true, std::memory_order_relaxed);
            group.join();
            throw InternalError(std::string("classifying: cannot start worker thread: ") + e.what());
        }
        group.join();

        token.throw_if_stopped("classifying");
        return out;
    }

} // namespace covertrax
