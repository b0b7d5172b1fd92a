// Graph visualizer
//
// Mermaid and Graphviz renderings of a graph for documentation and review.
// Conditional branches carry their labels; the terminal is drawn as END.
#pragma once
#include "FlowGenIR.hpp"
#include "TopologyResolver.hpp"
#include <optional>
#include <string>

namespace FlowGen {

enum class VisualFormat { Mermaid, Dot };

std::optional<VisualFormat> parseVisualFormat(const std::string& text);

// When `resolved` is given, unreachable nodes are drawn dashed and
// loop-back transitions are marked. Throws GraphError for graphs that fail
// validateGraph().
std::string visualize(const GraphInfo& graph, VisualFormat format, const ResolvedGraph* resolved = nullptr);

} // namespace FlowGen
