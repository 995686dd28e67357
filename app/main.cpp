#include <iostream>
#include <string>

#include <cli/cli_common.hpp>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options] <input>\n";
    std::cerr << "\n";
    std::cerr << "Turns vector drawings into GPX routes and back.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  outline   drawing.svg -> planar outline JSON\n";
    std::cerr << "  render    outline JSON -> route.gpx\n";
    std::cerr << "  unroute   route.gpx -> planar outline JSON with anchor\n";
    std::cerr << "  convert   drawing.svg -> route.gpx in one step\n";
    std::cerr << "  info      route.gpx -> point count and length\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <path>   Output file (default derived from input)\n";
    std::cerr << "  -c, --config <path>   Pipeline configuration JSON\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "  -h, --help            Show help\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  TRAILSKETCH_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    using namespace trailsketch::cli;
    if (command == "outline") return command_outline(argc, argv);
    if (command == "render") return command_render(argc, argv);
    if (command == "unroute") return command_unroute(argc, argv);
    if (command == "convert") return command_convert(argc, argv);
    if (command == "info") return command_info(argc, argv);

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
