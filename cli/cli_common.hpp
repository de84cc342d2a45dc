#ifndef QUIVERKIT_CLI_COMMON_HPP
#define QUIVERKIT_CLI_COMMON_HPP

#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/document_json.hpp>
#include <common/logging.hpp>
#include <string>
#include <optional>
#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>

namespace quiverkit::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::vector<std::string> mutation_sequence;  // -k, in order given
    bool verbose = false;  // -v, debug logging
    bool help = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    // Parse flags and positional arguments
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (arg == "-k" || arg == "--at") {
            if (i + 1 < argc) {
                ctx.mutation_sequence.push_back(argv[++i]);
                ++i;
            } else {
                throw std::runtime_error("-k/--at requires a vertex name");
            }
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Parse arguments and apply -v to the shared logger
inline CommandContext parse_command_args(int argc, char** argv, int start_idx) {
    CommandContext ctx = parse_common_args(argc, argv, start_idx).first;
    if (ctx.verbose) {
        logging::enable_verbose();
    }
    return ctx;
}

// Configuration from -c, or defaults
inline QuiverkitConfig load_config(const CommandContext& ctx) {
    QuiverkitConfig config;
    if (ctx.config_path.has_value()) {
        config = json::read_json_file(ctx.config_path.value()).get<QuiverkitConfig>();
    }
    return config;
}

// Laminations given in the document, followed by the principal ones if configured
inline std::vector<Lamination> collect_laminations(const QuiverDocument& doc,
                                                   const QuiverkitConfig& config) {
    std::vector<Lamination> laminations = doc.laminations;
    if (config.principal_laminations) {
        if (!doc.triangulation.has_value()) {
            throw std::runtime_error("principal_laminations requires a triangulation");
        }
        auto principal = doc.triangulation->principal_laminations();
        laminations.insert(laminations.end(), principal.begin(), principal.end());
    }
    return laminations;
}

// Write string to file
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Write to the output path, or stdout when none was given
inline void write_output(const CommandContext& ctx, const std::string& content) {
    if (ctx.output_path.empty()) {
        std::cout << content;
    } else {
        write_file(ctx.output_path, content);
    }
}

// Command function declarations
int command_polygon(int argc, char** argv);
int command_matrix(int argc, char** argv);
int command_mutate(int argc, char** argv);
int command_shear(int argc, char** argv);
int command_dot(int argc, char** argv);

}  // namespace quiverkit::cli

#endif // QUIVERKIT_CLI_COMMON_HPP
