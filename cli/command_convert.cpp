#include "cli_common.hpp"
#include <geo/geo_projector.hpp>
#include <route/gpx_codec.hpp>

namespace trailsketch::cli {

int command_convert(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: trailsketch convert <drawing.svg> [-o <output.gpx>] [-c <config.json>]\n";
            return ctx.help ? 0 : 1;
        }

        PipelineConfig config = load_config(ctx);
        std::string output_path = resolve_output_path(ctx.input_path, ".gpx", ctx.output_path);

        log->info("Reading drawing: {}", ctx.input_path);
        Polyline polyline = load_drawing(read_file(ctx.input_path), config.flatten);
        log->info("Outline: {} points", polyline.size());

        GeoAnchor anchor = anchor_at_centroid(polyline, config.center);
        log->info("Placing at {}, {}", anchor.geo.latitude, anchor.geo.longitude);
        std::vector<GeoPoint> points = render(polyline, config.transform, anchor);

        gpx::write_route_file(output_path, points, config.route_name);

        log->info("Wrote route to {}", output_path);
        std::cerr << "Wrote " << output_path << " (" << points.size() << " points, "
                  << route_length_m(points) / 1000.0 << " km)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace trailsketch::cli
