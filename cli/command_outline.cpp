#include "cli_common.hpp"
#include <serialization/polyline_json.hpp>

namespace trailsketch::cli {

int command_outline(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: trailsketch outline <drawing.svg> [-o <output.outline.json>] [-c <config.json>]\n";
            return ctx.help ? 0 : 1;
        }

        PipelineConfig config = load_config(ctx);
        std::string output_path = resolve_output_path(ctx.input_path, ".outline.json", ctx.output_path);

        log->info("Reading drawing: {}", ctx.input_path);
        Polyline polyline = load_drawing(read_file(ctx.input_path), config.flatten);

        json::SerializedData data;
        data.step = "outline";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.input_path;
        data.config = config.flatten;
        data.data = outline_to_json(OutlineArtifact{polyline, std::nullopt});
        data.stats = {
            {"point_count", polyline.size()},
            {"arc_length", polyline.arc_length()}
        };

        json::write_serialized(output_path, data);

        log->info("Wrote outline to {}", output_path);
        std::cerr << "Wrote " << output_path << " (" << polyline.size() << " points)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace trailsketch::cli
