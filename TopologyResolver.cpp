// TopologyResolver.cpp
//
// Effective-edge selection, breadth-first reachability, depth-first loop-back
// marking and dispatch table construction.
#include "TopologyResolver.hpp"
#include "FlowGenErrors.hpp"
#include <deque>
#include <fmt/core.h>
#include <unordered_map>
#include <unordered_set>

namespace FlowGen {

const DispatchEntry* ResolvedGraph::find(const NodeId& id) const {
    for (const auto& e : dispatch) if (e.nodeId == id) return &e;
    return nullptr;
}

namespace {

struct Successor {
    std::optional<std::string> label;
    NodeId target;
};

// Outgoing transition chosen for a node after the tie-break policy.
struct Outgoing {
    const EdgeSpec* edge = nullptr;
    const ConditionalEdgeSpec* conditional = nullptr;
    std::vector<Successor> successors;
};

std::string edgeName(const NodeId& from, const NodeId& to) {
    return fmt::format("{}->{}", from, isTerminal(to) ? std::string("END") : to);
}

void checkLimits(const GraphInfo& graph, const ResolveLimits& limits) {
    size_t edgeCount = graph.edges.size();
    for (const auto& ce : graph.conditionalEdges) edgeCount += ce.mapping.size();
    if (graph.nodes.size() > limits.maxNodes) {
        throw GraphError(GraphErrorCode::GraphTooLarge, graph.name,
                         fmt::format("Graph declares {} nodes (limit {})", graph.nodes.size(), limits.maxNodes));
    }
    if (edgeCount > limits.maxEdges) {
        throw GraphError(GraphErrorCode::GraphTooLarge, graph.name,
                         fmt::format("Graph declares {} transitions (limit {})", edgeCount, limits.maxEdges));
    }
}

std::unordered_map<NodeId, Outgoing> selectOutgoing(const GraphInfo& graph, Diagnostics& warnings) {
    std::unordered_map<NodeId, std::vector<const EdgeSpec*>> plain;
    std::unordered_map<NodeId, std::vector<const ConditionalEdgeSpec*>> cond;
    for (const auto& e : graph.edges) plain[e.from].push_back(&e);
    for (const auto& ce : graph.conditionalEdges) cond[ce.from].push_back(&ce);

    std::unordered_map<NodeId, Outgoing> out;
    for (const auto& node : graph.nodes) {
        Outgoing o;
        const auto& edges = plain[node.id];
        const auto& conds = cond[node.id];
        if (!conds.empty()) {
            o.conditional = conds.front();
            for (const auto& branch : o.conditional->mapping) o.successors.push_back({branch.first, branch.second});
            for (size_t i = 1; i < conds.size(); ++i) {
                warnings.push_back({DiagnosticKind::DeadEdge, fmt::format("{}->{}", node.id, conds[i]->routerName),
                                    fmt::format("conditional edge via router '{}' is shadowed by router '{}'",
                                                conds[i]->routerName, o.conditional->routerName)});
            }
            for (const auto* e : edges) {
                warnings.push_back({DiagnosticKind::DeadEdge, edgeName(e->from, e->to),
                                    fmt::format("unconditional edge is shadowed by the conditional edge via router '{}'",
                                                o.conditional->routerName)});
            }
        } else if (!edges.empty()) {
            o.edge = edges.front();
            o.successors.push_back({std::nullopt, o.edge->to});
            for (size_t i = 1; i < edges.size(); ++i) {
                warnings.push_back({DiagnosticKind::DeadEdge, edgeName(edges[i]->from, edges[i]->to),
                                    fmt::format("node already continues to '{}'; only the first edge is dispatched",
                                                isTerminal(o.edge->to) ? std::string("END") : o.edge->to)});
            }
        }
        out.emplace(node.id, std::move(o));
    }
    return out;
}

std::vector<NodeId> breadthFirst(const NodeId& entry, const std::unordered_map<NodeId, Outgoing>& outgoing) {
    std::vector<NodeId> order;
    std::unordered_set<NodeId> seen{entry};
    std::deque<NodeId> queue{entry};
    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop_front();
        order.push_back(current);
        for (const auto& s : outgoing.at(current).successors) {
            if (isTerminal(s.target) || seen.count(s.target)) continue;
            seen.insert(s.target);
            queue.push_back(s.target);
        }
    }
    return order;
}

// Iterative DFS with in-progress marking; an edge into an in-progress node
// closes a loop.
std::vector<LoopBackEdge> findLoopBacks(const NodeId& entry, const std::unordered_map<NodeId, Outgoing>& outgoing) {
    enum class Mark { Unvisited, InProgress, Done };
    std::unordered_map<NodeId, Mark> marks;
    std::vector<LoopBackEdge> loops;
    std::vector<std::pair<NodeId, size_t>> stack;

    marks[entry] = Mark::InProgress;
    stack.emplace_back(entry, 0);
    while (!stack.empty()) {
        auto& frame = stack.back();
        const auto& succ = outgoing.at(frame.first).successors;
        if (frame.second >= succ.size()) {
            marks[frame.first] = Mark::Done;
            stack.pop_back();
            continue;
        }
        const Successor& s = succ[frame.second++];
        if (isTerminal(s.target)) continue;
        Mark m = marks.count(s.target) ? marks[s.target] : Mark::Unvisited;
        if (m == Mark::InProgress) {
            loops.push_back({frame.first, s.target, s.label});
        } else if (m == Mark::Unvisited) {
            marks[s.target] = Mark::InProgress;
            stack.emplace_back(s.target, 0);
        }
    }
    return loops;
}

bool isLoopBack(const std::vector<LoopBackEdge>& loops, const NodeId& from, const NodeId& to,
                const std::optional<std::string>& label) {
    for (const auto& l : loops) {
        if (l.from == from && l.to == to && l.label == label) return true;
    }
    return false;
}

} // namespace

ResolvedGraph resolve(const GraphInfo& graph, const ResolveLimits& limits) {
    checkLimits(graph, limits);
    validateGraph(graph);

    ResolvedGraph resolved;
    resolved.entryPoint = graph.entryPoint;

    Diagnostics deadEdges;
    const auto outgoing = selectOutgoing(graph, deadEdges);
    if (outgoing.at(graph.entryPoint).successors.empty()) {
        throw GraphError(GraphErrorCode::UnreachableEntry, graph.entryPoint,
                         fmt::format("Entry point '{}' has no outgoing edge", graph.entryPoint));
    }

    resolved.reachable = breadthFirst(graph.entryPoint, outgoing);
    resolved.loopBackEdges = findLoopBacks(graph.entryPoint, outgoing);

    bool terminates = false;
    for (const auto& id : resolved.reachable) {
        const Outgoing& o = outgoing.at(id);
        DispatchEntry entry;
        entry.nodeId = id;
        if (o.conditional) {
            ConditionalDispatch cd;
            cd.routerName = o.conditional->routerName;
            for (const auto& s : o.successors) {
                const bool back = isLoopBack(resolved.loopBackEdges, id, s.target, s.label);
                cd.branches.push_back({*s.label, s.target, back});
                terminates = terminates || isTerminal(s.target);
            }
            entry.conditional = std::move(cd);
        } else if (o.edge) {
            entry.unconditionalNext = o.edge->to;
            entry.loopBack = isLoopBack(resolved.loopBackEdges, id, o.edge->to, std::nullopt);
            terminates = terminates || isTerminal(o.edge->to);
        } else {
            entry.unconditionalNext = NodeId(kTerminal);
            entry.implicitTerminal = true;
            terminates = true;
        }
        resolved.dispatch.push_back(std::move(entry));
    }
    if (!terminates) {
        throw GraphError(GraphErrorCode::UnreachableEntry, graph.entryPoint,
                         fmt::format("No path from entry point '{}' reaches the end of the graph", graph.entryPoint));
    }

    resolved.warnings = std::move(deadEdges);
    std::unordered_set<NodeId> reached(resolved.reachable.begin(), resolved.reachable.end());
    for (const auto& n : graph.nodes) {
        if (reached.count(n.id)) continue;
        resolved.unreachable.push_back(n.id);
        resolved.warnings.push_back({DiagnosticKind::UnreachableNode, n.id,
                                     fmt::format("not reachable from entry point '{}'; emitted as an unused stub",
                                                 graph.entryPoint)});
    }
    return resolved;
}

} // namespace FlowGen
