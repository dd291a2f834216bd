#pragma once

#include "space/benchmark_description.hpp"
#include <vector>

namespace adabench {

// ─── Space Expander ────────────────────────────────────────────
// Turns declarative templates into concrete descriptions.
//
//   {name: foo, compiler: [g++, clang++]}
//     → {compiler: g++, name: foo}, {compiler: clang++, name: foo}
//
// Dimension names are sorted, then the cartesian product of the value
// lists is taken in that order (the last name varies fastest). A scalar
// counts as a one-element list. A dimension with an empty list makes the
// template expand to nothing.

class SpaceExpander {
public:
    /// Expand a single template. `index` is its position in the
    /// definition, reported when a dimension has no candidates.
    static std::vector<BenchmarkDescription> expand(const BenchmarkTemplate& tmpl, size_t index = 0);

    /// Expand every template in declaration order and concatenate.
    static std::vector<BenchmarkDescription> expandAll(const std::vector<BenchmarkTemplate>& templates);
};

} // namespace adabench
