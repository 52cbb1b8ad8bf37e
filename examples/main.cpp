#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include <datapod/datapod.hpp>

#include "covertrax/covertrax.hpp"
#include "covertrax/sources/synthetic.hpp"

namespace {

    // A lake west of the center, forest to the north, a town to the south-east, fields elsewhere.
    covertrax::sources::ReflectanceField landscape(double lat0, double lon0, double radius_m) {
        const double m_per_deg_lat = covertrax::geodesy::meters_per_degree_lat();
        const double m_per_deg_lon = m_per_deg_lat * std::cos(covertrax::utils::deg2rad(lat0));
        return [=](double lat, double lon) {
            const double north = (lat - lat0) * m_per_deg_lat;
            const double east = (lon - lon0) * m_per_deg_lon;
            const double lake = std::hypot(east + 0.45 * radius_m, north + 0.1 * radius_m);
            if (lake < 0.3 * radius_m)
                return covertrax::sources::water();
            if (north > 0.35 * radius_m + 0.1 * radius_m * std::sin(east / 80.0))
                return covertrax::sources::forest();
            if (east > 0.2 * radius_m && north < -0.2 * radius_m)
                return covertrax::sources::built_up();
            if (std::fmod(std::abs(east) + 1000.0 * radius_m, 300.0) < 20.0)
                return covertrax::sources::bare();
            return covertrax::sources::cropland();
        };
    }

    void print_summary(const covertrax::AnalysisSummary &s) {
        std::cout << std::fixed << std::setprecision(1);
        std::cout << "Analysis \"" << s.name << "\" at (" << s.latitude << ", " << s.longitude << ")\n";
        std::cout << "  requested area   " << s.input_area_sq_m << " m2 (radius " << s.calculated_radius_m << " m)\n";
        std::cout << "  AOI area         " << s.total_area_sq_m << " m2\n";
        std::cout << "  water            " << s.water_area_sq_m << " m2 (" << s.water_pct << " %)\n";
        std::cout << "  agriculture      " << s.agriculture_area_sq_m << " m2 (" << s.agriculture_pct << " %)\n";
        std::cout << "  forest           " << s.forest_area_sq_m << " m2 (" << s.forest_pct << " %)\n";
        std::cout << "  infrastructure   " << s.infrastructure_area_sq_m << " m2 (" << s.infrastructure_pct << " %)\n";
        std::cout << "  unclassified     " << s.unclassified_area_sq_m << " m2\n";
    }

} // namespace

int main(int argc, char **argv) {
    covertrax::AoiRequest request;
    request.name = argc > 1 ? argv[1] : "hyderabad";
    request.latitude = argc > 2 ? std::atof(argv[2]) : 17.385;
    request.longitude = argc > 3 ? std::atof(argv[3]) : 78.4867;
    request.area_sq_m = argc > 4 ? std::atof(argv[4]) : 5e6;
    const std::string config_path = argc > 5 ? argv[5] : "";
    const std::string output_path = argc > 6 ? argv[6] : "covertrax.geojson";

    try {
        covertrax::AnalysisConfig config;
        if (!config_path.empty() && config_path != "-") {
            config = covertrax::load_config(config_path);
        }
        config.verbose = true;

        const double radius = covertrax::radius_for_area(request.area_sq_m);
        auto field = landscape(request.latitude, request.longitude, radius);
        auto source = std::make_shared<covertrax::sources::SyntheticImagerySource>();
        source->add_scene({"S2A_0001", {}, 12, 0.05, field, {}});
        source->add_scene({"S2B_0002", {}, 40, 0.20, field, {}});
        source->add_scene({"S2A_0003", {}, 75, 0.65, field, {}});
        // Clouds over the lake in one acquisition, masked through QA bit 10.
        source->add_scene({"S2B_0004", {}, 101, 0.15, field, [&request, radius](double lat, double lon) {
                               const double dy = (lat - request.latitude) * covertrax::geodesy::meters_per_degree_lat();
                               const double dx = (lon - request.longitude) * covertrax::geodesy::meters_per_degree_lat();
                               return std::hypot(dx, dy) < 0.3 * radius ? std::uint16_t(1u << 10) : std::uint16_t(0);
                           }});

        covertrax::AnalysisOrchestrator orchestrator(source, config);
        auto result = orchestrator.analyze(request);

        print_summary(result.summary);
        for (auto cls : covertrax::kReportedClasses) {
            std::cout << "  " << covertrax::class_name(cls) << " features: " << result.layers.at(cls).size() << "\n";
        }

        covertrax::write_geojson(result, output_path);
        std::cout << "Wrote " << output_path << std::endl;
    } catch (const covertrax::AnalysisError &e) {
        std::cerr << "Error: " << covertrax::error_kind_name(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
