#include <cmath>
#include <iostream>
#include <memory>

#include <datapod/datapod.hpp>

#include "rerun.hpp"
#include "rerun/recording_stream.hpp"

#include "covertrax/covertrax.hpp"
#include "covertrax/sources/synthetic.hpp"
#include "covertrax/utils/visualize.hpp"

int main() {
    auto rec = std::make_shared<rerun::RecordingStream>("covertrax", "space");
    if (rec->connect_grpc("rerun+http://0.0.0.0:9876/proxy").is_err()) {
        std::cerr << "Failed to connect to rerun\n";
        return 1;
    }

    covertrax::AoiRequest request{"wageningen", 51.98954034749562, 5.6584737410504715, 3e6};

    // Rings of forest and water around fields, with a built-up strip along the river.
    auto field = [&request](double lat, double lon) {
        const double dy = (lat - request.latitude) * covertrax::geodesy::meters_per_degree_lat();
        const double dx = (lon - request.longitude) * covertrax::geodesy::meters_per_degree_lat() *
                          std::cos(covertrax::utils::deg2rad(request.latitude));
        const double d = std::hypot(dx, dy);
        if (std::abs(dy + 0.002 * dx * dx / 10.0) < 40.0)
            return covertrax::sources::water();
        if (std::abs(dy + 0.002 * dx * dx / 10.0) < 90.0)
            return covertrax::sources::built_up();
        if (std::fmod(d, 350.0) < 80.0)
            return covertrax::sources::forest();
        return covertrax::sources::cropland();
    };
    auto source = std::make_shared<covertrax::sources::SyntheticImagerySource>();
    source->add_scene({"scene-1", {}, 20, 0.1, field, {}});
    source->add_scene({"scene-2", {}, 60, 0.3, field, {}});

    covertrax::AnalysisConfig config;
    config.verbose = true;

    try {
        covertrax::AnalysisOrchestrator orchestrator(source, config);
        auto aoi = covertrax::build_aoi(request, config.aoi_segments);
        auto result = orchestrator.analyze(request);

        covertrax::visualize::show_aoi(aoi, rec);
        covertrax::visualize::show_layers(result.layers, rec);

        std::cout << "water " << result.summary.water_pct << " %, agriculture " << result.summary.agriculture_pct
                  << " %, forest " << result.summary.forest_pct << " %, infrastructure "
                  << result.summary.infrastructure_pct << " %" << std::endl;
    } catch (const covertrax::AnalysisError &e) {
        std::cerr << "Error: " << covertrax::error_kind_name(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
