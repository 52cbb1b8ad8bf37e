#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "covertrax/geojson.hpp"

using namespace covertrax;

namespace {

    datapod::Polygon ring(std::initializer_list<std::pair<double, double>> pts) {
        datapod::Polygon out;
        for (const auto &[x, y] : pts) {
            out.vertices.push_back(datapod::Point{x, y, 0.0});
        }
        return out;
    }

    AnalysisResult sample_result() {
        AnalysisResult result;
        result.summary.name = "field \"north\"";
        result.summary.total_area_sq_m = 1000.0;
        result.summary.water_area_sq_m = 250.0;
        result.summary.water_pct = 25.0;
        result.summary.unclassified_area_sq_m = 750.0;
        result.layers = make_empty_layers();

        LayerFeature feature;
        feature.id = "water-1";
        feature.cls = LandCoverClass::Water;
        feature.area_sq_m = 250.0;
        feature.region.outer = ring({{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}, {0.0, 1.0}, {0.0, 0.0}});
        feature.region.holes.push_back(ring({{0.2, 0.2}, {0.2, 0.4}, {0.4, 0.4}, {0.4, 0.2}, {0.2, 0.2}}));
        result.layers[LandCoverClass::Water].features.push_back(feature);
        return result;
    }

    std::size_t count_of(const std::string &haystack, const std::string &needle) {
        std::size_t count = 0;
        for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
            ++count;
        }
        return count;
    }

} // namespace

TEST_CASE("Feature encoding") {
    auto result = sample_result();
    const auto &feature = result.layers.at(LandCoverClass::Water).features[0];
    auto json = feature_to_geojson(feature);

    CHECK(json.find(R"("type":"Feature")") != std::string::npos);
    CHECK(json.find(R"("class":"water")") != std::string::npos);
    CHECK(json.find(R"("area_sq_m":250)") != std::string::npos);
    CHECK(json.find(R"("type":"Polygon")") != std::string::npos);
    // Outer ring then the hole, [lon, lat] positions.
    CHECK(json.find("[[[0,0],[1,0],[1,1],[0,1],[0,0]],[[0.2,0.2],[0.2,0.4]") != std::string::npos);
}

TEST_CASE("Longitudes beyond the antimeridian") {
    SUBCASE("A crossing region becomes one polygon per side") {
        Region region;
        region.outer = ring({{179.5, 0.0}, {180.5, 0.0}, {180.5, 1.0}, {179.5, 1.0}, {179.5, 0.0}});
        auto json = region_to_geojson(region);
        CHECK(json.find(R"("type":"MultiPolygon")") != std::string::npos);
        CHECK(json.find(R"("type":"Polygon")") == std::string::npos);
        CHECK(json.find("180.5") == std::string::npos);
        CHECK(json.find("[179.5,0]") != std::string::npos);
        CHECK(json.find("[-179.5,0]") != std::string::npos);
    }

    SUBCASE("A region wholly past 180 is shifted back") {
        Region region;
        region.outer = ring({{181.0, 0.0}, {182.0, 0.0}, {182.0, 1.0}, {181.0, 1.0}, {181.0, 0.0}});
        auto json = region_to_geojson(region);
        CHECK(json.find(R"("type":"Polygon")") != std::string::npos);
        CHECK(json.find("[-179,0]") != std::string::npos);
        CHECK(json.find("[-178,1]") != std::string::npos);
        CHECK(json.find("181") == std::string::npos);
    }

    SUBCASE("A region ending on the antimeridian keeps its edge") {
        Region region;
        region.outer = ring({{179.0, 0.0}, {180.0, 0.0}, {180.0, 1.0}, {179.0, 1.0}, {179.0, 0.0}});
        CHECK(region_to_geojson(region) ==
              R"({"type":"Polygon","coordinates":[[[179,0],[180,0],[180,1],[179,1],[179,0]]]})");
    }
}

TEST_CASE("Control characters in strings") {
    CHECK(detail::escape_string("a\bb\fc") == "a\\bb\\fc");
    CHECK(detail::escape_string(std::string("x\x01") + "y" + "\x1f") == "x\\u0001y\\u001f");
    CHECK(detail::escape_string("tab\tnew\n") == "tab\\tnew\\n");

    AnalysisSummary summary;
    summary.name = std::string("bell\x07");
    CHECK(to_geojson(summary).find(R"("name":"bell\u0007")") != std::string::npos);
}

TEST_CASE("Layer collections") {
    SUBCASE("Empty collection") {
        LayerFeatureCollection empty{LandCoverClass::Forest, {}};
        CHECK(to_geojson(empty) == R"({"type":"FeatureCollection","features":[]})");
    }

    SUBCASE("Every layer key is present") {
        auto json = to_geojson(sample_result());
        CHECK(json.find(R"("water":{"type":"FeatureCollection")") != std::string::npos);
        CHECK(json.find(R"("agriculture":{"type":"FeatureCollection","features":[]})") != std::string::npos);
        CHECK(json.find(R"("forest":{"type":"FeatureCollection","features":[]})") != std::string::npos);
        CHECK(json.find(R"("infrastructure":{"type":"FeatureCollection","features":[]})") != std::string::npos);
        CHECK(count_of(json, R"("type":"FeatureCollection")") == 4);
    }

    SUBCASE("Missing layers are written empty") {
        AnalysisResult result;
        auto json = to_geojson(result);
        CHECK(count_of(json, R"("features":[])") == 4);
    }
}

TEST_CASE("Summary encoding") {
    auto json = to_geojson(sample_result().summary);
    CHECK(json.find(R"("name":"field \"north\"")") != std::string::npos);
    CHECK(json.find(R"("total_area_sq_m":1000)") != std::string::npos);
    CHECK(json.find(R"("water_area_sq_m":250)") != std::string::npos);
    CHECK(json.find(R"("water_pct":25)") != std::string::npos);
    CHECK(json.find(R"("unclassified_area_sq_m":750)") != std::string::npos);
    CHECK(json.find(R"("calculated_radius_m":0)") != std::string::npos);
    CHECK(json.front() == '{');
    CHECK(json.back() == '}');
}

TEST_CASE("Writing to disk") {
    auto path = std::filesystem::temp_directory_path() / "covertrax_test_result.geojson";
    write_geojson(sample_result(), path);

    std::ifstream ifs(path);
    REQUIRE(ifs.good());
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    CHECK(buffer.str() == to_geojson(sample_result()) + "\n");
    std::filesystem::remove(path);

    CHECK_THROWS_AS(write_geojson(sample_result(), std::filesystem::path("/nonexistent-dir/out.geojson")),
                    std::runtime_error);
}
