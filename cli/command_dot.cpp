#include "cli_common.hpp"
#include <render/dot_export.hpp>
#include <common/logging.hpp>

namespace quiverkit::cli {

int command_dot(int argc, char** argv) {
    auto log = quiverkit::logging::get_logger();

    try {
        CommandContext ctx = parse_command_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: quiverkit dot <quiver.json> [-o <quiver.dot>] [-c <config.json>]\n";
            std::cerr << "Options (config \"render\" section):\n";
            std::cerr << "  hide_frozen, show_weights, show_laminations, rankdir\n";
            return ctx.help ? 0 : 1;
        }

        log->info("Rendering quiver from: {}", ctx.input_path);

        json::SerializedData input_data = json::read_serialized(ctx.input_path);
        QuiverDocument doc = document_from_json(input_data.data);
        QuiverkitConfig config = load_config(ctx);

        Quiver quiver = doc.resolve_quiver();

        std::string dot;
        if (doc.triangulation.has_value()) {
            dot = quiver_to_dot(quiver, *doc.triangulation, collect_laminations(doc, config), config.render);
        } else {
            dot = quiver_to_dot(quiver, config.render);
        }

        write_output(ctx, dot);
        if (!ctx.output_path.empty()) {
            log->info("Wrote DOT to {}", ctx.output_path);
            std::cerr << "Wrote " << ctx.output_path << " ("
                      << quiver.vertex_count() << " vertices, "
                      << quiver.edge_count() << " arrows)\n";
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace quiverkit::cli
