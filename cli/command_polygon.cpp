#include "cli_common.hpp"
#include <lamination/triangulation.hpp>
#include <common/logging.hpp>

namespace quiverkit::cli {

int command_polygon(int argc, char** argv) {
    auto log = quiverkit::logging::get_logger();

    try {
        CommandContext ctx = parse_command_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: quiverkit polygon <n> [-o <quiver.json>]\n";
            std::cerr << "Writes the fan triangulation of an n-gon and its quiver.\n";
            return ctx.help ? 0 : 1;
        }

        uint32_t n = static_cast<uint32_t>(std::stoul(ctx.input_path));
        log->info("Building standard triangulation of a {}-gon", n);

        QuiverDocument doc;
        doc.triangulation = PolygonTriangulation::standard(n);
        doc.quiver = doc.triangulation->to_quiver();

        json::SerializedData data = json::make_serialized("polygon", "");
        data.data = document_to_json(doc);
        data.stats = {
            {"marked_points", n},
            {"frozen_count", doc.quiver->vertex_count() - doc.quiver->cluster_count()},
            {"cluster_count", doc.quiver->cluster_count()},
            {"arrow_count", doc.quiver->edge_count()}
        };

        write_output(ctx, data.to_json().dump(2) + "\n");
        if (!ctx.output_path.empty()) {
            std::cerr << "Wrote " << ctx.output_path << " ("
                      << doc.quiver->cluster_count() << " cluster vertices)\n";
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace quiverkit::cli
