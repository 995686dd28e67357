#include "cli_common.hpp"
#include <geo/geo_projector.hpp>
#include <route/gpx_codec.hpp>
#include <serialization/polyline_json.hpp>

namespace trailsketch::cli {

int command_render(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: trailsketch render <input.outline.json> [-o <output.gpx>] [-c <config.json>]\n";
            return ctx.help ? 0 : 1;
        }

        nlohmann::json config_json = load_config_json(ctx);
        PipelineConfig config = config_json.get<PipelineConfig>();
        std::string output_path = resolve_output_path(ctx.input_path, ".gpx", ctx.output_path);

        log->info("Loading outline: {}", ctx.input_path);
        json::SerializedData input = json::read_serialized(ctx.input_path);
        json::expect_step(input, "outline");
        OutlineArtifact artifact = outline_from_json(input.data);

        // An outline read back from a route keeps its place unless the
        // config names a new center
        GeoAnchor anchor = anchor_at_centroid(artifact.polyline, config.center);
        if (artifact.anchor) {
            anchor = config_json.contains("center")
                ? move_anchor(*artifact.anchor, config.center)
                : *artifact.anchor;
        }

        log->info("Rendering: rotation {} deg, stretch {}, length {} m",
                  config.transform.rotation, config.transform.stretch,
                  config.transform.target_length);
        std::vector<GeoPoint> points = render(artifact.polyline, config.transform, anchor);

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
