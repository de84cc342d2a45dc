#include "cli_common.hpp"
#include <mutation/mutation.hpp>
#include <common/logging.hpp>

namespace quiverkit::cli {

int command_mutate(int argc, char** argv) {
    auto log = quiverkit::logging::get_logger();

    try {
        CommandContext ctx = parse_command_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty() || ctx.output_path.empty() ||
            ctx.mutation_sequence.empty()) {
            std::cerr << "Usage: quiverkit mutate <quiver.json> -k <vertex> [-k <vertex> ...] -o <out.json>\n";
            std::cerr << "Mutates at each vertex in turn. A triangulation in the input is\n";
            std::cerr << "flipped along with the quiver.\n";
            return ctx.help ? 0 : 1;
        }

        log->info("Mutating quiver from: {}", ctx.input_path);

        json::SerializedData input_data = json::read_serialized(ctx.input_path);
        QuiverDocument doc = document_from_json(input_data.data);

        Quiver quiver = doc.resolve_quiver();
        for (const auto& name : ctx.mutation_sequence) {
            log->info("Mutating at {}", name);
            quiver.mutate(name);
            if (doc.triangulation.has_value()) {
                doc.triangulation->flip(name);
            }
        }
        doc.quiver = quiver;

        json::SerializedData data = json::make_serialized("mutate", input_data.source_file.empty()
                                                                        ? ctx.input_path
                                                                        : input_data.source_file);
        data.data = document_to_json(doc);
        data.stats = {
            {"mutation_sequence", ctx.mutation_sequence},
            {"arrow_count", quiver.edge_count()}
        };
        json::write_serialized(ctx.output_path, data);

        log->info("Wrote mutated quiver to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << ctx.mutation_sequence.size() << " mutations, "
                  << quiver.edge_count() << " arrows)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace quiverkit::cli
