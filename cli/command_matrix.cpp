#include "cli_common.hpp"
#include <exchange/matrix_builder.hpp>
#include <lamination/shear.hpp>
#include <serialization/matrix_json.hpp>
#include <common/logging.hpp>

namespace quiverkit::cli {

int command_matrix(int argc, char** argv) {
    auto log = quiverkit::logging::get_logger();

    try {
        CommandContext ctx = parse_command_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: quiverkit matrix <quiver.json> [-o <matrix.json>] [-c <config.json>]\n";
            std::cerr << "Prints the exchange matrix, with one shear row per lamination.\n";
            return ctx.help ? 0 : 1;
        }

        log->info("Building exchange matrix from: {}", ctx.input_path);

        json::SerializedData input_data = json::read_serialized(ctx.input_path);
        QuiverDocument doc = document_from_json(input_data.data);
        QuiverkitConfig config = load_config(ctx);

        Quiver quiver = doc.resolve_quiver();
        std::vector<Lamination> laminations = collect_laminations(doc, config);

        ExtendedExchangeMatrix matrix;
        if (laminations.empty()) {
            matrix = export_exchange_matrix(quiver);
        } else if (doc.triangulation.has_value()) {
            matrix = export_exchange_matrix(quiver, *doc.triangulation, laminations);
        } else {
            throw std::runtime_error("Laminations need a triangulation to compute shear coordinates");
        }

        if (ctx.output_path.empty()) {
            std::cout << matrix.to_string();
            return 0;
        }

        json::SerializedData data = json::make_serialized("exchange_matrix", ctx.input_path);
        data.data = {{"exchange_matrix", matrix}};
        data.config = config;
        data.stats = {
            {"cluster_count", matrix.column_count()},
            {"lamination_count", matrix.shear_rows().size()},
            {"skew_symmetric", matrix.principal().is_skew_symmetric()}
        };
        json::write_serialized(ctx.output_path, data);

        log->info("Wrote exchange matrix to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << matrix.row_count() << "x" << matrix.column_count() << ")\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace quiverkit::cli
