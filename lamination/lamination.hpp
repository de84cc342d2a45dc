#ifndef QUIVERKIT_LAMINATION_HPP
#define QUIVERKIT_LAMINATION_HPP

#include <string>
#include <vector>

namespace quiverkit {

// One shear coordinate per cluster vertex, in cluster order
using ShearVector = std::vector<int>;

// A curve between two frozen vertices (boundary segments of the embedding).
// Only its shear vector is observable.
struct Lamination {
    std::string name;
    std::string from_frozen;
    std::string to_frozen;
};

}  // namespace quiverkit

#endif // QUIVERKIT_LAMINATION_HPP
