// GraphVisualizer.cpp
//
// Nodes are numbered in declaration order (n0, n1, ...) so labels never have
// to be valid diagram identifiers.
#include "GraphVisualizer.hpp"
#include <fmt/core.h>
#include <sstream>
#include <unordered_map>

namespace FlowGen {

std::optional<VisualFormat> parseVisualFormat(const std::string& text) {
    if (text == "mermaid" || text == "mmd") return VisualFormat::Mermaid;
    if (text == "dot" || text == "graphviz") return VisualFormat::Dot;
    return std::nullopt;
}

namespace {

struct Transition {
    NodeId from;
    NodeId to;
    std::optional<std::string> label;
};

std::vector<Transition> transitions(const GraphInfo& graph) {
    std::vector<Transition> out;
    for (const auto& e : graph.edges) out.push_back({e.from, e.to, std::nullopt});
    for (const auto& ce : graph.conditionalEdges) {
        for (const auto& b : ce.mapping) out.push_back({ce.from, b.second, b.first});
    }
    return out;
}

bool isLoopBack(const ResolvedGraph* resolved, const Transition& t) {
    if (!resolved) return false;
    for (const auto& l : resolved->loopBackEdges) {
        if (l.from == t.from && l.to == t.to && l.label == t.label) return true;
    }
    return false;
}

std::string mermaidText(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"') out += "#quot;";
        else if (c == '\n' || c == '\r') out += ' ';
        else out.push_back(c);
    }
    return out;
}

std::string dotText(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        if (c == '\n') {
            out += "\\n";
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string renderMermaid(const GraphInfo& graph, const ResolvedGraph* resolved,
                          const std::unordered_map<NodeId, std::string>& ids) {
    auto idOf = [&](const NodeId& n) { return isTerminal(n) ? std::string("END") : ids.at(n); };
    std::ostringstream out;
    out << "graph TD\n";
    out << "    START([START])\n";
    out << "    END([END])\n";
    for (const auto& n : graph.nodes) out << "    " << ids.at(n.id) << "[\"" << mermaidText(n.id) << "\"]\n";
    if (ids.count(graph.entryPoint)) out << "    START --> " << ids.at(graph.entryPoint) << "\n";
    for (const auto& t : transitions(graph)) {
        std::string label = t.label ? *t.label : std::string();
        if (isLoopBack(resolved, t)) label += label.empty() ? "loop" : " (loop)";
        out << "    " << idOf(t.from);
        if (label.empty()) out << " --> ";
        else out << " -->|\"" << mermaidText(label) << "\"| ";
        out << idOf(t.to) << "\n";
    }
    if (resolved && !resolved->unreachable.empty()) {
        out << "    classDef unreachable stroke-dasharray: 5 5\n";
        for (const auto& n : resolved->unreachable) out << "    class " << ids.at(n) << " unreachable\n";
    }
    return out.str();
}

std::string renderDot(const GraphInfo& graph, const ResolvedGraph* resolved,
                      const std::unordered_map<NodeId, std::string>& ids) {
    auto idOf = [&](const NodeId& n) { return isTerminal(n) ? std::string("END") : ids.at(n); };
    std::ostringstream out;
    out << "digraph \"" << dotText(graph.name) << "\" {\n";
    out << "    rankdir=TB;\n";
    out << "    START [shape=circle, label=\"START\"];\n";
    out << "    END [shape=doublecircle, label=\"END\"];\n";
    for (const auto& n : graph.nodes) {
        out << "    " << ids.at(n.id) << " [shape=box, label=\"" << dotText(n.id) << "\"";
        if (resolved && !resolved->isReachable(n.id)) out << ", style=dashed";
        out << "];\n";
    }
    if (ids.count(graph.entryPoint)) out << "    START -> " << ids.at(graph.entryPoint) << ";\n";
    for (const auto& t : transitions(graph)) {
        out << "    " << idOf(t.from) << " -> " << idOf(t.to);
        std::vector<std::string> attrs;
        if (t.label) attrs.push_back(fmt::format("label=\"{}\"", dotText(*t.label)));
        if (isLoopBack(resolved, t)) attrs.push_back("constraint=false, color=blue");
        if (!attrs.empty()) {
            out << " [";
            for (size_t i = 0; i < attrs.size(); ++i) out << (i ? ", " : "") << attrs[i];
            out << "]";
        }
        out << ";\n";
    }
    out << "}\n";
    return out.str();
}

} // namespace

std::string visualize(const GraphInfo& graph, VisualFormat format, const ResolvedGraph* resolved) {
    validateGraph(graph);
    std::unordered_map<NodeId, std::string> ids;
    for (size_t i = 0; i < graph.nodes.size(); ++i) ids.emplace(graph.nodes[i].id, fmt::format("n{}", i));
    switch (format) {
    case VisualFormat::Mermaid: return renderMermaid(graph, resolved, ids);
    case VisualFormat::Dot: return renderDot(graph, resolved, ids);
    }
    return std::string();
}

} // namespace FlowGen
