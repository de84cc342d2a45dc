#include "cli_common.hpp"
#include <lamination/shear.hpp>
#include <serialization/matrix_json.hpp>
#include <common/logging.hpp>

namespace quiverkit::cli {

int command_shear(int argc, char** argv) {
    auto log = quiverkit::logging::get_logger();

    try {
        CommandContext ctx = parse_command_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: quiverkit shear <quiver.json> [-o <shear.json>] [-c <config.json>]\n";
            std::cerr << "Computes shear coordinates of each lamination. Requires a triangulation.\n";
            return ctx.help ? 0 : 1;
        }

        log->info("Computing shear coordinates from: {}", ctx.input_path);

        json::SerializedData input_data = json::read_serialized(ctx.input_path);
        QuiverDocument doc = document_from_json(input_data.data);
        QuiverkitConfig config = load_config(ctx);

        if (!doc.triangulation.has_value()) {
            throw std::runtime_error("Shear coordinates need a triangulation");
        }

        Quiver quiver = doc.resolve_quiver();
        std::vector<Lamination> laminations = collect_laminations(doc, config);

        std::vector<ShearRow> rows;
        for (const auto& lamination : laminations) {
            rows.push_back({lamination.name,
                            ShearCalculator::shear_vector(quiver, *doc.triangulation, lamination)});
        }

        if (ctx.output_path.empty()) {
            for (const auto& row : rows) {
                std::cout << row.name << ":";
                for (int value : row.values) {
                    std::cout << " " << value;
                }
                std::cout << "\n";
            }
            return 0;
        }

        std::vector<std::string> columns;
        for (VertexId id : quiver.registry().cluster_vertices()) {
            columns.push_back(quiver.vertex(id).name);
        }

        json::SerializedData data = json::make_serialized("shear", ctx.input_path);
        data.data = {
            {"columns", columns},
            {"shear_vectors", rows}
        };
        data.config = config;
        data.stats = {{"lamination_count", rows.size()}};
        json::write_serialized(ctx.output_path, data);

        log->info("Wrote shear coordinates to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << rows.size() << " laminations)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace quiverkit::cli
