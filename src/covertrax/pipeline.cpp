#include "covertrax/pipeline.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace covertrax {

    AnalysisOrchestrator::AnalysisOrchestrator(std::shared_ptr<ImagerySource> source, const AnalysisConfig &config,
                                               std::shared_ptr<CompositeCache> cache, Observer observer)
        : source_(std::move(source)), config_(config), cache_(std::move(cache)), observer_(std::move(observer)) {
        if (!source_) {
            throw std::invalid_argument("AnalysisOrchestrator requires an imagery source");
        }
        config_.validate();
    }

    AnalysisResult AnalysisOrchestrator::analyze(const AoiRequest &request) const {
        return analyze(request, CancelToken());
    }

    AnalysisResult AnalysisOrchestrator::analyze(const AoiRequest &request, const CancelToken &caller,
                                                 RunReport *report) const {
        if (report) {
            *report = RunReport();
        }

        CancelToken token = caller;
        if (config_.timeout.count() > 0) {
            token = caller.with_deadline(CancelToken::Clock::now() + config_.timeout);
        }

        Stage stage = Stage::Validating;
        try {
            transition(stage, request.name, report);
            AoiGeometry aoi = build_aoi(request, config_.aoi_segments);
            token.throw_if_stopped(stage_name(stage));

            stage = Stage::FetchingImagery;
            transition(stage, std::to_string(aoi.segments()) + "-gon, radius " + std::to_string(aoi.radius_m) + " m",
                       report);
            RasterComposite composite;
            {
                std::unique_ptr<ImagerySession> session = source_->open();
                if (!session) {
                    throw InternalError("imagery source returned no session");
                }
                CompositeFetcher fetcher(config_.fetch, cache_, config_.verbose);
                composite = fetcher.fetch(aoi, *session, token);
            }
            token.throw_if_stopped(stage_name(stage));

            stage = Stage::Classifying;
            transition(stage, std::to_string(composite.grid.rows) + "x" + std::to_string(composite.grid.cols) +
                                  " cells from " + std::to_string(composite.scene_count) + " scenes", report);
            SpectralClassifier classifier(config_.classifier, config_.classifier_workers);
            ClassifiedRaster classified = classifier.classify(composite, token);
            composite = RasterComposite();
            token.throw_if_stopped(stage_name(stage));

            stage = Stage::Vectorizing;
            transition(stage, "", report);
            Vectorizer vectorizer(config_.vectorizer);
            LayerSet layers = vectorizer.vectorize(classified, aoi, token);
            token.throw_if_stopped(stage_name(stage));

            stage = Stage::Aggregating;
            transition(stage, "", report);
            AnalysisResult result;
            result.summary = aggregate(request, aoi, layers);
            result.layers = std::move(layers);

            transition(Stage::Done, "total " + std::to_string(result.summary.total_area_sq_m) + " m2", report);
            return result;
        } catch (const AnalysisError &e) {
            record_failure(stage, request, e, report);
            throw;
        } catch (const std::exception &e) {
            InternalError wrapped(std::string(stage_name(stage)) + ": " + e.what());
            record_failure(stage, request, wrapped, report);
            throw wrapped;
        }
    }

    void AnalysisOrchestrator::transition(Stage stage, const std::string &detail, RunReport *report) const {
        if (report) {
            report->stage = stage;
        }
        if (config_.verbose) {
            std::cout << "[" << stage_name(stage) << "]";
            if (!detail.empty()) {
                std::cout << " " << detail;
            }
            std::cout << "\n";
        }
        if (observer_) {
            observer_(stage, detail);
        }
    }

    void AnalysisOrchestrator::record_failure(Stage stage, const AoiRequest &request, const AnalysisError &error,
                                              RunReport *report) const {
        if (report) {
            report->error_kind = error.kind();
            report->error = error.what();
        }
        std::cerr << "Error: analysis \"" << request.name << "\" (" << request.latitude << ", " << request.longitude
                  << ", " << request.area_sq_m << " m2) failed while " << stage_name(stage) << ": "
                  << error_kind_name(error.kind()) << ": " << error.what() << std::endl;
        transition(Stage::Failed, error.what(), report);
    }

} // namespace covertrax
