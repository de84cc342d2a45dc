#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Quivers, mutations and shear coordinates for triangulated polygons.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  polygon <n>        Fan triangulation of an n-gon and its quiver\n";
    std::cerr << "  matrix <in.json>   Exchange matrix, extended by lamination shear rows\n";
    std::cerr << "  mutate <in.json>   Mutate at each -k vertex in order\n";
    std::cerr << "  shear <in.json>    Shear coordinates of the document's laminations\n";
    std::cerr << "  dot <in.json>      Render the quiver as DOT/Graphviz\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <path>   Output file (defaults to stdout where allowed)\n";
    std::cerr << "  -c, --config <path>   JSON configuration file\n";
    std::cerr << "  -k, --at <vertex>     Mutation vertex (repeatable)\n";
    std::cerr << "  -v, --verbose         Debug logging (mutation pivots, crossing sequences)\n";
    std::cerr << "  -h, --help            Show help for a command\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  QUIVERKIT_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    auto log = quiverkit::logging::get_logger();
    log->debug("Running command: {}", command);

    if (command == "polygon") return quiverkit::cli::command_polygon(argc, argv);
    if (command == "matrix") return quiverkit::cli::command_matrix(argc, argv);
    if (command == "mutate") return quiverkit::cli::command_mutate(argc, argv);
    if (command == "shear") return quiverkit::cli::command_shear(argc, argv);
    if (command == "dot") return quiverkit::cli::command_dot(argc, argv);

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
