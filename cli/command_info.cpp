#include "cli_common.hpp"
#include <geo/geo_projector.hpp>
#include <route/gpx_codec.hpp>

namespace trailsketch::cli {

int command_info(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: trailsketch info <route.gpx>\n";
            return ctx.help ? 0 : 1;
        }

        std::vector<GeoPoint> points = gpx::read_route_file(ctx.input_path);
        double length_km = route_length_m(points) / 1000.0;
        log->debug("Read {} points from {}", points.size(), ctx.input_path);

        std::cout << ctx.input_path << "\n"
                  << "  points: " << points.size() << "\n"
                  << "  length: " << length_km << " km\n"
                  << "  start:  " << points.front().latitude << ", " << points.front().longitude << "\n"
                  << "  end:    " << points.back().latitude << ", " << points.back().longitude << "\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace trailsketch::cli
