// Topology resolver
//
// Turns the edge set of a GraphInfo into a dispatch plan: which nodes run,
// in what discovery order, where each one goes next, and which transitions
// jump back to a node already on the current path (loops).
#pragma once
#include "Diagnostics.hpp"
#include "FlowGenIR.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace FlowGen {

struct BranchTarget {
    std::string label;
    NodeId target; // node id or kTerminal
    bool loopBack = false;
};

struct ConditionalDispatch {
    std::string routerName;
    std::vector<BranchTarget> branches;
};

// Resolved outgoing transition of one reachable node. Exactly one of
// `unconditionalNext` / `conditional` is set.
struct DispatchEntry {
    NodeId nodeId;
    std::optional<NodeId> unconditionalNext; // node id or kTerminal
    bool implicitTerminal = false;           // node declared no outgoing edge
    bool loopBack = false;                   // unconditionalNext re-enters the current path
    std::optional<ConditionalDispatch> conditional;
};

struct LoopBackEdge {
    NodeId from;
    NodeId to;
    std::optional<std::string> label; // set for conditional branches
};

struct ResolvedGraph {
    NodeId entryPoint;
    std::vector<NodeId> reachable;      // breadth-first order from entryPoint
    std::vector<NodeId> unreachable;    // declaration order
    std::vector<DispatchEntry> dispatch; // parallel to `reachable`
    std::vector<LoopBackEdge> loopBackEdges;
    Diagnostics warnings;

    const DispatchEntry* find(const NodeId& id) const;
    bool isReachable(const NodeId& id) const { return find(id) != nullptr; }
    bool hasLoops() const { return !loopBackEdges.empty(); }
};

// Bounds on traversal cost; exceeding them raises GraphTooLarge.
struct ResolveLimits {
    size_t maxNodes = 10000;
    size_t maxEdges = 100000;
};

// Validates the graph, then resolves it. Throws GraphError with
// DanglingEdge for undeclared endpoints and UnreachableEntry when the entry
// point has no outgoing transition or no terminating path. When a node has
// both conditional and unconditional edges the conditional one wins and the
// others are reported as DeadEdge.
ResolvedGraph resolve(const GraphInfo& graph, const ResolveLimits& limits = ResolveLimits{});

} // namespace FlowGen
