// TopologyResolverTests.cpp
//
// Reachability, loop-backs, tie-breaks and graph errors.
#include <gtest/gtest.h>
#include "FlowGenErrors.hpp"
#include "TestGraphs.hpp"
#include "TopologyResolver.hpp"

#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

using namespace FlowGen;
using namespace FlowGenTest;

namespace {

GraphErrorCode resolveError(const GraphInfo& graph, const ResolveLimits& limits = ResolveLimits{}) {
    try {
        resolve(graph, limits);
    } catch (const GraphError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected GraphError";
    return GraphErrorCode::MalformedInput;
}

} // namespace

TEST(TopologyResolverTests, Linear_DispatchFollowsEdges) {
    auto resolved = resolve(linearGraph());
    EXPECT_EQ(resolved.entryPoint, "a");
    EXPECT_EQ(resolved.reachable, (std::vector<NodeId>{"a", "b", "c"}));
    ASSERT_EQ(resolved.dispatch.size(), 3u);
    EXPECT_EQ(resolved.find("a")->unconditionalNext, std::optional<NodeId>("b"));
    EXPECT_EQ(resolved.find("b")->unconditionalNext, std::optional<NodeId>("c"));
    EXPECT_EQ(resolved.find("c")->unconditionalNext, std::optional<NodeId>(kTerminal));
    EXPECT_FALSE(resolved.find("c")->implicitTerminal);
    EXPECT_TRUE(resolved.warnings.empty());
    EXPECT_FALSE(resolved.hasLoops());
}

TEST(TopologyResolverTests, Branching_DispatchInvokesRouter) {
    auto resolved = resolve(branchingGraph());
    EXPECT_EQ(resolved.reachable, (std::vector<NodeId>{"start", "high_path", "low_path"}));
    const DispatchEntry* start = resolved.find("start");
    ASSERT_NE(start, nullptr);
    EXPECT_FALSE(start->unconditionalNext);
    ASSERT_TRUE(start->conditional);
    EXPECT_EQ(start->conditional->routerName, "route_based_on_value");
    ASSERT_EQ(start->conditional->branches.size(), 2u);
    EXPECT_EQ(start->conditional->branches[0].label, "high");
    EXPECT_EQ(start->conditional->branches[0].target, "high_path");
    EXPECT_EQ(start->conditional->branches[1].label, "low");
    EXPECT_FALSE(start->conditional->branches[1].loopBack);
    EXPECT_TRUE(resolved.warnings.empty());
}

TEST(TopologyResolverTests, Unreachable_NodeExcludedWithWarning) {
    GraphInfo graph = linearGraph();
    graph.nodes.push_back(node("orphan"));
    graph.edges.push_back({"orphan", "c"});
    auto resolved = resolve(graph);
    EXPECT_FALSE(resolved.isReachable("orphan"));
    EXPECT_EQ(resolved.unreachable, (std::vector<NodeId>{"orphan"}));
    EXPECT_EQ(resolved.dispatch.size(), 3u);
    ASSERT_EQ(resolved.warnings.size(), 1u);
    EXPECT_EQ(resolved.warnings[0].kind, DiagnosticKind::UnreachableNode);
    EXPECT_EQ(resolved.warnings[0].subject, "orphan");
}

TEST(TopologyResolverTests, Loop_SelfLoopMarkedOnce) {
    auto resolved = resolve(loopGraph());
    ASSERT_EQ(resolved.loopBackEdges.size(), 1u);
    EXPECT_EQ(resolved.loopBackEdges[0].from, "loop");
    EXPECT_EQ(resolved.loopBackEdges[0].to, "loop");
    EXPECT_EQ(resolved.loopBackEdges[0].label, std::optional<std::string>("continue"));

    const auto& branches = resolved.find("loop")->conditional->branches;
    EXPECT_TRUE(branches[0].loopBack);
    EXPECT_FALSE(branches[1].loopBack);
    // The loop does not duplicate dispatch entries
    EXPECT_EQ(resolved.dispatch.size(), 2u);
}

TEST(TopologyResolverTests, Loop_UnconditionalBackEdge) {
    GraphInfo graph = graphOf("cycle", "a", {"a", "b", "c"});
    graph.edges = {{"a", "b"}, {"c", "a"}};
    graph.conditionalEdges.push_back({"b", "again", {{"retry", "c"}, {"stop", kTerminal}}});
    auto resolved = resolve(graph);
    ASSERT_EQ(resolved.loopBackEdges.size(), 1u);
    EXPECT_EQ(resolved.loopBackEdges[0].from, "c");
    EXPECT_EQ(resolved.loopBackEdges[0].to, "a");
    EXPECT_FALSE(resolved.loopBackEdges[0].label);
    EXPECT_TRUE(resolved.find("c")->loopBack);
    EXPECT_FALSE(resolved.find("a")->loopBack);
}

TEST(TopologyResolverTests, Diamond_ConvergenceIsNotALoop) {
    GraphInfo graph = graphOf("diamond", "top", {"top", "left", "right", "bottom"});
    graph.conditionalEdges.push_back({"top", "split", {{"l", "left"}, {"r", "right"}}});
    graph.edges = {{"left", "bottom"}, {"right", "bottom"}, {"bottom", kTerminal}};
    auto resolved = resolve(graph);
    EXPECT_FALSE(resolved.hasLoops());
    EXPECT_EQ(resolved.reachable, (std::vector<NodeId>{"top", "left", "right", "bottom"}));
}

TEST(TopologyResolverTests, TieBreak_ConditionalWinsOverUnconditional) {
    GraphInfo graph = branchingGraph();
    graph.edges.push_back({"start", "low_path"});
    auto resolved = resolve(graph);
    EXPECT_TRUE(resolved.find("start")->conditional);
    ASSERT_EQ(resolved.warnings.size(), 1u);
    EXPECT_EQ(resolved.warnings[0].kind, DiagnosticKind::DeadEdge);
    EXPECT_EQ(resolved.warnings[0].subject, "start->low_path");
}

TEST(TopologyResolverTests, TieBreak_FirstConditionalWins) {
    GraphInfo graph = branchingGraph();
    graph.conditionalEdges.push_back({"start", "other_router", {{"x", "low_path"}}});
    auto resolved = resolve(graph);
    EXPECT_EQ(resolved.find("start")->conditional->routerName, "route_based_on_value");
    ASSERT_EQ(resolved.warnings.size(), 1u);
    EXPECT_EQ(resolved.warnings[0].kind, DiagnosticKind::DeadEdge);
    EXPECT_EQ(resolved.warnings[0].subject, "start->other_router");
}

TEST(TopologyResolverTests, TieBreak_FirstUnconditionalWins) {
    GraphInfo graph = linearGraph();
    graph.edges.push_back({"a", "c"});
    auto resolved = resolve(graph);
    EXPECT_EQ(resolved.find("a")->unconditionalNext, std::optional<NodeId>("b"));
    ASSERT_EQ(resolved.warnings.size(), 1u);
    EXPECT_EQ(resolved.warnings[0].subject, "a->c");
}

TEST(TopologyResolverTests, ImplicitTerminal_NoWarning) {
    GraphInfo graph = graphOf("implicit", "a", {"a", "b"});
    graph.edges = {{"a", "b"}};
    auto resolved = resolve(graph);
    const DispatchEntry* b = resolved.find("b");
    ASSERT_NE(b, nullptr);
    EXPECT_TRUE(b->implicitTerminal);
    EXPECT_EQ(b->unconditionalNext, std::optional<NodeId>(kTerminal));
    EXPECT_TRUE(resolved.warnings.empty());
}

TEST(TopologyResolverTests, Errors_DanglingEdges) {
    GraphInfo target = linearGraph();
    target.edges.push_back({"b", "ghost"});
    EXPECT_EQ(resolveError(target), GraphErrorCode::DanglingEdge);

    GraphInfo source = linearGraph();
    source.edges.push_back({"ghost", "a"});
    EXPECT_EQ(resolveError(source), GraphErrorCode::DanglingEdge);

    GraphInfo branch = branchingGraph();
    branch.conditionalEdges[0].mapping.emplace_back("mid", "ghost");
    try {
        resolve(branch);
        FAIL() << "expected GraphError";
    } catch (const GraphError& e) {
        EXPECT_EQ(e.code(), GraphErrorCode::DanglingEdge);
        EXPECT_EQ(e.subject(), "start->ghost");
    }
}

TEST(TopologyResolverTests, Errors_UnreachableEntry) {
    GraphInfo undeclared = linearGraph();
    undeclared.entryPoint = "z";
    EXPECT_EQ(resolveError(undeclared), GraphErrorCode::UnreachableEntry);

    GraphInfo empty = linearGraph();
    empty.entryPoint.clear();
    EXPECT_EQ(resolveError(empty), GraphErrorCode::UnreachableEntry);

    GraphInfo isolated = graphOf("isolated", "a", {"a", "b"});
    isolated.edges = {{"b", kTerminal}};
    EXPECT_EQ(resolveError(isolated), GraphErrorCode::UnreachableEntry);

    GraphInfo endless = graphOf("endless", "a", {"a", "b"});
    endless.edges = {{"a", "b"}, {"b", "a"}};
    EXPECT_EQ(resolveError(endless), GraphErrorCode::UnreachableEntry);
}

TEST(TopologyResolverTests, Errors_StructuralViolations) {
    GraphInfo duplicate = linearGraph();
    duplicate.nodes.push_back(node("b"));
    EXPECT_EQ(resolveError(duplicate), GraphErrorCode::DuplicateNode);

    GraphInfo emptyTable = branchingGraph();
    emptyTable.conditionalEdges[0].mapping.clear();
    EXPECT_EQ(resolveError(emptyTable), GraphErrorCode::EmptyBranchTable);

    GraphInfo duplicateField = linearGraph();
    duplicateField.stateSchema.fields.push_back(field("input", integer()));
    EXPECT_EQ(resolveError(duplicateField), GraphErrorCode::DuplicateField);
}

TEST(TopologyResolverTests, Errors_GraphTooLarge) {
    ResolveLimits nodes;
    nodes.maxNodes = 2;
    EXPECT_EQ(resolveError(linearGraph(), nodes), GraphErrorCode::GraphTooLarge);

    ResolveLimits edges;
    edges.maxEdges = 1;
    EXPECT_EQ(resolveError(branchingGraph(), edges), GraphErrorCode::GraphTooLarge);
}

TEST(TopologyResolverTests, Scale_LongChainResolvesIteratively) {
    GraphInfo graph;
    graph.name = "chain";
    const int count = 5000;
    for (int i = 0; i < count; ++i) graph.nodes.push_back(node("n" + std::to_string(i)));
    for (int i = 0; i + 1 < count; ++i) graph.edges.push_back({"n" + std::to_string(i), "n" + std::to_string(i + 1)});
    graph.edges.push_back({"n" + std::to_string(count - 1), kTerminal});
    graph.edges.push_back({"n" + std::to_string(count - 1), "n0"});
    graph.entryPoint = "n0";

    auto resolved = resolve(graph);
    EXPECT_EQ(resolved.reachable.size(), static_cast<size_t>(count));
    EXPECT_FALSE(resolved.hasLoops());
    EXPECT_EQ(countKind(resolved.warnings, DiagnosticKind::DeadEdge), 1u);
}

TEST(TopologyResolverTests, Property_DispatchTargetsAreReachableOrTerminal) {
    std::vector<GraphInfo> graphs{linearGraph(), branchingGraph(), loopGraph()};
    GraphInfo withOrphan = loopGraph();
    withOrphan.nodes.push_back(node("orphan"));
    graphs.push_back(withOrphan);

    for (const auto& graph : graphs) {
        auto resolved = resolve(graph);
        std::unordered_set<NodeId> reachable(resolved.reachable.begin(), resolved.reachable.end());
        ASSERT_EQ(resolved.dispatch.size(), resolved.reachable.size());
        for (size_t i = 0; i < resolved.dispatch.size(); ++i) {
            const DispatchEntry& entry = resolved.dispatch[i];
            EXPECT_EQ(entry.nodeId, resolved.reachable[i]);
            EXPECT_NE(entry.unconditionalNext.has_value(), entry.conditional.has_value()) << entry.nodeId;
            std::vector<NodeId> targets;
            if (entry.unconditionalNext) targets.push_back(*entry.unconditionalNext);
            if (entry.conditional) {
                for (const auto& b : entry.conditional->branches) targets.push_back(b.target);
            }
            for (const auto& t : targets) {
                EXPECT_TRUE(isTerminal(t) || reachable.count(t)) << graph.name << ": " << entry.nodeId << "->" << t;
            }
        }
        EXPECT_EQ(resolved.reachable.size() + resolved.unreachable.size(), graph.nodes.size());
    }
}
