#include "doctest/doctest.h"

#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "covertrax/pipeline.hpp"
#include "covertrax/sources/synthetic.hpp"

using namespace covertrax;
using namespace std::chrono_literals;

namespace {

    AoiRequest hyderabad() {
        AoiRequest req;
        req.name = "hyderabad";
        req.latitude = 17.385;
        req.longitude = 78.4867;
        req.area_sq_m = 5e6;
        return req;
    }

    AnalysisConfig test_config() {
        AnalysisConfig config;
        config.fetch.end_time = TimePoint(std::chrono::hours(24 * 20000));
        config.classifier_workers = 2;
        return config;
    }

    std::shared_ptr<sources::SyntheticImagerySource> uniform_source(const Reflectance &surface, int scenes = 3) {
        std::vector<sources::SyntheticScene> recipes;
        for (int i = 0; i < scenes; ++i) {
            recipes.push_back({"scene-" + std::to_string(i), {}, 5 + 30 * i, 0.1, sources::uniform(surface), {}});
        }
        return std::make_shared<sources::SyntheticImagerySource>(recipes);
    }

    double overlap_area(const Region &a, const Region &b) {
        auto pa = geodesy::to_planar(a);
        auto pb = geodesy::to_planar(b);
        if (bg::disjoint(bg::return_envelope<bg::model::box<PlanarPoint>>(pa),
                         bg::return_envelope<bg::model::box<PlanarPoint>>(pb))) {
            return 0.0;
        }
        PlanarMultiPolygon out;
        bg::intersection(pa, pb, out);
        return bg::area(out);
    }

} // namespace

TEST_CASE("All-water scenario") {
    auto source = uniform_source(sources::water());
    AnalysisOrchestrator orchestrator(source, test_config());
    RunReport report;
    auto result = orchestrator.analyze(hyderabad(), CancelToken(), &report);
    const auto &s = result.summary;

    CHECK(s.name == "hyderabad");
    CHECK(s.total_area_sq_m == doctest::Approx(5e6).epsilon(0.005));
    CHECK(s.water_area_sq_m == doctest::Approx(s.total_area_sq_m).epsilon(0.01));
    CHECK(s.water_pct == doctest::Approx(100.0).epsilon(0.01));
    CHECK(s.agriculture_area_sq_m == 0.0);
    CHECK(s.forest_area_sq_m == 0.0);
    CHECK(s.infrastructure_area_sq_m == 0.0);
    CHECK(s.classified_area_sq_m() <= s.total_area_sq_m);
    CHECK(s.calculated_radius_m == doctest::Approx(std::sqrt(5e6 / M_PI)));

    REQUIRE(result.layers.size() == 4);
    CHECK(result.layers.at(LandCoverClass::Water).size() == 1);
    CHECK(result.layers.at(LandCoverClass::Agriculture).empty());
    CHECK(result.layers.at(LandCoverClass::Forest).empty());
    CHECK(result.layers.at(LandCoverClass::Infrastructure).empty());

    CHECK(report.stage == Stage::Done);
    CHECK_FALSE(report.error_kind.has_value());
    CHECK(source->sessions_opened() == 1);
    CHECK(source->open_sessions() == 0);
}

TEST_CASE("AOIs at and around the poles") {
    auto source = uniform_source(sources::water());
    AnalysisOrchestrator orchestrator(source, test_config());

    for (double lat : {90.0, -90.0, 89.999, -89.999}) {
        CAPTURE(lat);
        AoiRequest req = hyderabad();
        req.name = "polar";
        req.latitude = lat;

        RunReport report;
        auto result = orchestrator.analyze(req, CancelToken(), &report);
        const auto &s = result.summary;
        CHECK(report.stage == Stage::Done);
        CHECK(s.total_area_sq_m == doctest::Approx(5e6).epsilon(0.005));
        CHECK(s.water_area_sq_m == doctest::Approx(s.total_area_sq_m).epsilon(0.01));
        CHECK(s.water_pct == doctest::Approx(100.0).epsilon(0.01));
        CHECK(s.classified_area_sq_m() <= s.total_area_sq_m);
        CHECK_FALSE(result.layers.at(LandCoverClass::Water).empty());
    }
    CHECK(source->open_sessions() == 0);
}

TEST_CASE("Vanishing area") {
    AoiRequest req = hyderabad();
    req.area_sq_m = std::numeric_limits<double>::denorm_min();

    auto source = uniform_source(sources::water());
    AnalysisOrchestrator orchestrator(source, test_config());
    RunReport report;
    auto result = orchestrator.analyze(req, CancelToken(), &report);
    const auto &s = result.summary;

    CHECK(report.stage == Stage::Done);
    CHECK(s.total_area_sq_m < 1e-6);
    CHECK(s.classified_area_sq_m() == 0.0);
    CHECK(s.water_pct == 0.0);
    CHECK(s.agriculture_pct == 0.0);
    REQUIRE(result.layers.size() == 4);
    for (auto cls : kReportedClasses) {
        CHECK(result.layers.at(cls).empty());
    }
    CHECK(source->open_sessions() == 0);
}

TEST_CASE("Zero-scene scenario") {
    auto source = std::make_shared<sources::SyntheticImagerySource>();
    AnalysisOrchestrator orchestrator(source, test_config());
    RunReport report;
    CHECK_THROWS_AS(orchestrator.analyze(hyderabad(), CancelToken(), &report), DataUnavailableError);
    CHECK(report.stage == Stage::Failed);
    REQUIRE(report.error_kind.has_value());
    CHECK(*report.error_kind == ErrorKind::DataUnavailable);
    CHECK_FALSE(report.error.empty());
    CHECK(source->sessions_opened() == 1);
    CHECK(source->open_sessions() == 0);
}

TEST_CASE("Checkerboard scenario") {
    AoiRequest req;
    req.name = "checkerboard";
    req.latitude = 45.0;
    req.longitude = 7.0;
    req.area_sq_m = 1e6;

    // 0.002 degree blocks alternating water and forest.
    auto field = [](double lat, double lon) {
        auto i = static_cast<long>(std::floor(lat / 0.002));
        auto j = static_cast<long>(std::floor(lon / 0.002));
        return ((i + j) % 2 == 0) ? sources::water() : sources::forest();
    };
    auto source = std::make_shared<sources::SyntheticImagerySource>(
        std::vector<sources::SyntheticScene>{{"board", {}, 10, 0.05, field, {}}});

    AnalysisOrchestrator orchestrator(source, test_config());
    auto result = orchestrator.analyze(req);
    const auto &s = result.summary;
    const auto &water = result.layers.at(LandCoverClass::Water);
    const auto &forest = result.layers.at(LandCoverClass::Forest);

    REQUIRE_FALSE(water.empty());
    REQUIRE_FALSE(forest.empty());
    CHECK(s.water_area_sq_m + s.forest_area_sq_m == doctest::Approx(s.total_area_sq_m).epsilon(0.01));
    CHECK(s.water_area_sq_m == doctest::Approx(s.total_area_sq_m / 2.0).epsilon(0.2));
    CHECK(s.agriculture_area_sq_m == 0.0);
    CHECK(s.infrastructure_area_sq_m == 0.0);

    double overlap = 0.0;
    for (const auto &w : water.features) {
        for (const auto &f : forest.features) {
            overlap += overlap_area(w.region, f.region);
        }
    }
    // Planar degrees squared; one 10 m cell is about 1e-8.
    CHECK(overlap < 1e-12);

    for (std::size_t i = 0; i < water.features.size(); ++i) {
        for (std::size_t j = i + 1; j < water.features.size(); ++j) {
            CHECK(overlap_area(water.features[i].region, water.features[j].region) < 1e-12);
        }
    }
}

TEST_CASE("Mixed landscape reaches every layer") {
    auto field = [](double lat, double lon) {
        if (lat > 17.385)
            return lon > 78.4867 ? sources::built_up() : sources::cropland();
        return lon > 78.4867 ? sources::forest() : sources::water();
    };
    auto source = std::make_shared<sources::SyntheticImagerySource>(
        std::vector<sources::SyntheticScene>{{"a", {}, 3, 0.1, field, {}}, {"b", {}, 40, 0.2, field, {}}});
    AnalysisOrchestrator orchestrator(source, test_config());
    auto result = orchestrator.analyze(hyderabad());
    const auto &s = result.summary;

    for (auto cls : kReportedClasses) {
        CAPTURE(class_name(cls));
        CHECK(result.layers.at(cls).size() == 1);
        CHECK(s.class_area(cls) == doctest::Approx(s.total_area_sq_m / 4.0).epsilon(0.05));
    }
    CHECK(s.water_pct + s.agriculture_pct + s.forest_pct + s.infrastructure_pct ==
          doctest::Approx(100.0).epsilon(0.01));
}

TEST_CASE("Idempotence") {
    auto field = [](double lat, double lon) {
        return std::sin(lat * 3000.0) + std::cos(lon * 2000.0) > 0.3 ? sources::forest() : sources::cropland();
    };
    auto source = std::make_shared<sources::SyntheticImagerySource>(
        std::vector<sources::SyntheticScene>{{"a", {}, 3, 0.1, field, {}}});
    AnalysisOrchestrator orchestrator(source, test_config());

    auto first = orchestrator.analyze(hyderabad());
    auto second = orchestrator.analyze(hyderabad());
    CHECK(first.summary.forest_area_sq_m == second.summary.forest_area_sq_m);
    CHECK(first.summary.agriculture_area_sq_m == second.summary.agriculture_area_sq_m);
    CHECK(first.summary.total_area_sq_m == second.summary.total_area_sq_m);

    const auto &fa = first.layers.at(LandCoverClass::Forest).features;
    const auto &fb = second.layers.at(LandCoverClass::Forest).features;
    REQUIRE(fa.size() == fb.size());
    for (std::size_t i = 0; i < fa.size(); ++i) {
        CHECK(fa[i].id == fb[i].id);
        CHECK(fa[i].area_sq_m == fb[i].area_sq_m);
    }
}

TEST_CASE("Stage transitions") {
    std::vector<Stage> stages;
    auto observer = [&stages](Stage stage, const std::string &) { stages.push_back(stage); };

    SUBCASE("Successful run") {
        AnalysisOrchestrator orchestrator(uniform_source(sources::cropland()), test_config(), nullptr, observer);
        orchestrator.analyze(hyderabad());
        std::vector<Stage> expected{Stage::Validating, Stage::FetchingImagery, Stage::Classifying,
                                    Stage::Vectorizing, Stage::Aggregating, Stage::Done};
        CHECK(stages == expected);
    }

    SUBCASE("Validation failure stops before any session") {
        auto source = uniform_source(sources::cropland());
        AnalysisOrchestrator orchestrator(source, test_config(), nullptr, observer);
        AoiRequest bad = hyderabad();
        bad.area_sq_m = 0.0;
        RunReport report;
        CHECK_THROWS_AS(orchestrator.analyze(bad, CancelToken(), &report), ValidationError);
        std::vector<Stage> expected{Stage::Validating, Stage::Failed};
        CHECK(stages == expected);
        CHECK(source->sessions_opened() == 0);
        CHECK(*report.error_kind == ErrorKind::Validation);
    }

    SUBCASE("A reused report is reset by the next run") {
        auto source = uniform_source(sources::cropland());
        AnalysisOrchestrator orchestrator(source, test_config());
        AoiRequest bad = hyderabad();
        bad.name = "";
        RunReport report;
        CHECK_THROWS_AS(orchestrator.analyze(bad, CancelToken(), &report), ValidationError);
        CHECK(report.stage == Stage::Failed);
        orchestrator.analyze(hyderabad(), CancelToken(), &report);
        CHECK_FALSE(report.error_kind.has_value());
        CHECK(report.error.empty());
        CHECK(report.stage == Stage::Done);
    }
}

TEST_CASE("Session release and error mapping") {
    SUBCASE("Unexpected upstream failure becomes an internal error") {
        auto source = uniform_source(sources::water());
        source->set_failure("upstream unreachable");
        AnalysisOrchestrator orchestrator(source, test_config());
        try {
            orchestrator.analyze(hyderabad());
            FAIL("expected InternalError");
        } catch (const InternalError &e) {
            CHECK(std::string(e.what()).find("upstream unreachable") != std::string::npos);
            CHECK(std::string(e.what()).find("fetching_imagery") != std::string::npos);
        }
        CHECK(source->sessions_opened() == 1);
        CHECK(source->open_sessions() == 0);
    }

    SUBCASE("Deadline during the imagery query") {
        auto source = uniform_source(sources::water());
        source->set_query_delay(3000ms);
        AnalysisConfig config = test_config();
        config.timeout = 50ms;
        AnalysisOrchestrator orchestrator(source, config);

        RunReport report;
        auto started = std::chrono::steady_clock::now();
        CHECK_THROWS_AS(orchestrator.analyze(hyderabad(), CancelToken(), &report), TimeoutError);
        CHECK(std::chrono::steady_clock::now() - started < 2000ms);
        CHECK(*report.error_kind == ErrorKind::Timeout);
        CHECK(source->open_sessions() == 0);
    }

    SUBCASE("Caller cancellation while fetching") {
        auto source = uniform_source(sources::water());
        source->set_query_delay(3000ms);
        AnalysisOrchestrator orchestrator(source, test_config());

        CancelToken caller;
        std::thread disconnect([caller]() mutable {
            std::this_thread::sleep_for(30ms);
            caller.cancel();
        });
        try {
            orchestrator.analyze(hyderabad(), caller);
            FAIL("expected TimeoutError");
        } catch (const TimeoutError &e) {
            CHECK(std::string(e.what()).find("cancelled") != std::string::npos);
        }
        disconnect.join();
        CHECK(source->open_sessions() == 0);
    }

    SUBCASE("Already cancelled caller never opens a session") {
        auto source = uniform_source(sources::water());
        AnalysisOrchestrator orchestrator(source, test_config());
        CancelToken caller;
        caller.cancel();
        CHECK_THROWS_AS(orchestrator.analyze(hyderabad(), caller), TimeoutError);
        CHECK(source->sessions_opened() == 0);
    }

    SUBCASE("Missing imagery source") {
        CHECK_THROWS_AS(AnalysisOrchestrator(nullptr, test_config()), std::invalid_argument);
    }

    SUBCASE("Invalid configuration") {
        AnalysisConfig config = test_config();
        config.classifier.forest_ndvi = 0.1;
        CHECK_THROWS_AS(AnalysisOrchestrator(uniform_source(sources::water()), config), ValidationError);
    }
}

TEST_CASE("Shared composite cache") {
    auto source = uniform_source(sources::forest());
    auto cache = std::make_shared<CompositeCache>(std::chrono::seconds(3600));
    AnalysisOrchestrator orchestrator(source, test_config(), cache);

    auto first = orchestrator.analyze(hyderabad());
    auto second = orchestrator.analyze(hyderabad());
    CHECK(source->queries() == 1);
    CHECK(source->sessions_opened() == 2);
    CHECK(first.summary.forest_area_sq_m == second.summary.forest_area_sq_m);
    CHECK(cache->size() == 1);
}

TEST_CASE("Concurrent runs on one orchestrator") {
    auto field = [](double lat, double lon) {
        return std::sin(lat * 3000.0) + std::cos(lon * 2000.0) > 0.3 ? sources::water() : sources::cropland();
    };
    auto source = std::make_shared<sources::SyntheticImagerySource>(
        std::vector<sources::SyntheticScene>{{"a", {}, 3, 0.1, field, {}}});
    const AnalysisOrchestrator orchestrator(source, test_config());
    const auto expected = orchestrator.analyze(hyderabad()).summary;

    AoiRequest bad = hyderabad();
    bad.area_sq_m = -1.0;

    const std::size_t runs = 4;
    std::vector<AnalysisSummary> summaries(runs);
    std::vector<RunReport> good_reports(runs);
    std::vector<RunReport> bad_reports(runs);
    std::vector<int> rejected(runs, 0);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < runs; ++i) {
        threads.emplace_back([&, i]() {
            summaries[i] = orchestrator.analyze(hyderabad(), CancelToken(), &good_reports[i]).summary;
            try {
                orchestrator.analyze(bad, CancelToken(), &bad_reports[i]);
            } catch (const ValidationError &) {
                rejected[i] = 1;
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    for (std::size_t i = 0; i < runs; ++i) {
        CAPTURE(i);
        CHECK(summaries[i].total_area_sq_m == expected.total_area_sq_m);
        CHECK(summaries[i].water_area_sq_m == expected.water_area_sq_m);
        CHECK(summaries[i].agriculture_area_sq_m == expected.agriculture_area_sq_m);
        CHECK(good_reports[i].stage == Stage::Done);
        CHECK_FALSE(good_reports[i].error_kind.has_value());
        CHECK(rejected[i] == 1);
        CHECK(bad_reports[i].stage == Stage::Failed);
        CHECK(*bad_reports[i].error_kind == ErrorKind::Validation);
    }
    CHECK(source->sessions_opened() == static_cast<int>(runs) + 1);
    CHECK(source->open_sessions() == 0);
}
