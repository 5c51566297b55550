/*
 * The core imports for bspgraph. Include this first so formatting support and the forward declarations are
 * available everywhere in a consistent order.
 */

#ifndef BSPGRAPH_BASE_H
#define BSPGRAPH_BASE_H

#include <fmt/format.h>
#include <fmt/chrono.h>
#include <fmt/ranges.h>

#include <bspgraph/bspgraph_export.h>
#include <bspgraph/bspgraph_forward_declarations.h>
#include <bspgraph/util/date_time.h>

namespace bspgraph {
    // Reserved node names for the virtual entry and exit of a graph.
    inline constexpr const char *START = "__start__";
    inline constexpr const char *END = "__end__";
} // namespace bspgraph

#endif  // BSPGRAPH_BASE_H
