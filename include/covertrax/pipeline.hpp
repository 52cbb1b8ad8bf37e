#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "covertrax/aggregate.hpp"
#include "covertrax/aoi.hpp"
#include "covertrax/cache.hpp"
#include "covertrax/cancel.hpp"
#include "covertrax/classifier.hpp"
#include "covertrax/composite.hpp"
#include "covertrax/config.hpp"
#include "covertrax/error.hpp"
#include "covertrax/imagery.hpp"
#include "covertrax/types.hpp"
#include "covertrax/vectorize.hpp"

namespace covertrax {

    enum class Stage {
        Validating,
        FetchingImagery,
        Classifying,
        Vectorizing,
        Aggregating,
        Done,
        Failed,
    };

    inline const char *stage_name(Stage stage) {
        switch (stage) {
        case Stage::Validating:
            return "validating";
        case Stage::FetchingImagery:
            return "fetching_imagery";
        case Stage::Classifying:
            return "classifying";
        case Stage::Vectorizing:
            return "vectorizing";
        case Stage::Aggregating:
            return "aggregating";
        case Stage::Done:
            return "done";
        case Stage::Failed:
            return "failed";
        }
        return "failed";
    }

    /// Final stage and failure of one analyze call.
    struct RunReport {
        Stage stage = Stage::Validating;
        /// Empty after a successful run.
        std::optional<ErrorKind> error_kind;
        std::string error;
    };

    /**
     * @brief Runs one request through validate, fetch, classify, vectorize and aggregate
     *
     * Stages run strictly in sequence and each one only sees the previous
     * stage's output. The imagery session lives exactly as long as the fetch
     * stage. Either a complete result is returned or an AnalysisError is
     * thrown; there are no partial results.
     *
     * analyze() keeps no per-run state in the orchestrator, so one instance
     * may serve several threads at once. The observer is then called from
     * each of those threads.
     */
    class AnalysisOrchestrator {
      public:
        /// Called on every stage transition with the new stage and a detail message.
        using Observer = std::function<void(Stage, const std::string &)>;

        AnalysisOrchestrator(std::shared_ptr<ImagerySource> source, const AnalysisConfig &config = {},
                             std::shared_ptr<CompositeCache> cache = nullptr, Observer observer = nullptr);

        /**
         * @brief Analyze a request under the configured timeout
         *
         * @throws ValidationError, DataUnavailableError, TimeoutError or InternalError
         */
        AnalysisResult analyze(const AoiRequest &request) const;

        /**
         * @brief Analyze a request, also stopping when `caller` is cancelled
         *
         * The run uses the earlier of the caller's deadline and the configured timeout.
         * When `report` is given it receives the final stage and, on failure,
         * the error kind and reason, before the call returns or throws.
         */
        AnalysisResult analyze(const AoiRequest &request, const CancelToken &caller,
                               RunReport *report = nullptr) const;

        const AnalysisConfig &config() const { return config_; }

      private:
        void transition(Stage stage, const std::string &detail, RunReport *report) const;
        void record_failure(Stage stage, const AoiRequest &request, const AnalysisError &error,
                            RunReport *report) const;

        std::shared_ptr<ImagerySource> source_;
        AnalysisConfig config_;
        std::shared_ptr<CompositeCache> cache_;
        Observer observer_;
    };

} // namespace covertrax
