#include "cli_common.hpp"
#include <serialization/polyline_json.hpp>

namespace trailsketch::cli {

int command_unroute(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: trailsketch unroute <route.gpx> [-o <output.outline.json>]\n";
            return ctx.help ? 0 : 1;
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".outline.json", ctx.output_path);

        log->info("Reading route: {}", ctx.input_path);
        LoadedRoute route = load_route(read_file(ctx.input_path));

        json::SerializedData data;
        data.step = "outline";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.input_path;
        data.data = outline_to_json(OutlineArtifact{route.polyline, route.anchor});
        data.stats = {
            {"point_count", route.polyline.size()},
            {"arc_length", route.polyline.arc_length()}
        };

        json::write_serialized(output_path, data);

        log->info("Wrote outline to {}", output_path);
        std::cerr << "Wrote " << output_path << " (" << route.polyline.size() << " points)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace trailsketch::cli
