#ifndef QUIVERKIT_RENDER_OPTIONS_HPP
#define QUIVERKIT_RENDER_OPTIONS_HPP

#include <string>

namespace quiverkit {

// Visibility and layout flags for the diagram renderer.
// The quiver core never reads these; they only travel to the renderer.
struct RenderOptions {
    // Drop frozen vertices and their arrows from the diagram
    bool hide_frozen = false;

    // Label arrows with their multiplicity when it exceeds 1
    bool show_weights = true;

    // Draw laminations' crossed arcs (requires a triangulation)
    bool show_laminations = true;

    // Graphviz rank direction
    std::string rankdir = "LR";
};

}  // namespace quiverkit

#endif // QUIVERKIT_RENDER_OPTIONS_HPP
