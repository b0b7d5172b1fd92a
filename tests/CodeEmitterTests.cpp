// CodeEmitterTests.cpp
//
// Emitted sections, symbols and file layout for both targets.
#include <gtest/gtest.h>
#include "CodeEmitter.hpp"
#include "EmitModel.hpp"
#include "TestGraphs.hpp"

#include <string>
#include <vector>

using namespace FlowGen;
using namespace FlowGenTest;

namespace {

SourceArtifact emitGraph(const GraphInfo& graph, TargetLanguage target, EmitOptions options = EmitOptions{}) {
    options.target = target;
    ResolvedGraph resolved = resolve(graph);
    Diagnostics typeWarnings;
    FieldTypeMap types = mapSchema(graph.stateSchema, typeWarnings);
    return emit(graph, resolved, types, options);
}

std::vector<std::string> sectionNames(const SourceArtifact& artifact) {
    std::vector<std::string> names;
    for (const auto& s : artifact.sections) names.push_back(s.name);
    return names;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

const OutputFile* fileNamed(const std::vector<OutputFile>& files, const std::string& path) {
    for (const auto& f : files) if (f.path == path) return &f;
    return nullptr;
}

} // namespace

TEST(CodeEmitterTests, Target_ParseNames) {
    EXPECT_EQ(parseTargetLanguage("rust"), TargetLanguage::Rust);
    EXPECT_EQ(parseTargetLanguage("RS"), TargetLanguage::Rust);
    EXPECT_EQ(parseTargetLanguage("C++"), TargetLanguage::Cpp);
    EXPECT_EQ(parseTargetLanguage("cpp"), TargetLanguage::Cpp);
    EXPECT_FALSE(parseTargetLanguage("go"));
    EXPECT_STREQ(toString(TargetLanguage::Cpp), "cpp");
}

TEST(CodeEmitterTests, Sections_OrderedForBothTargets) {
    const std::vector<std::string> expected{"prelude", "state_type", "node:start", "node:high_path", "node:low_path",
                                            "router:route_based_on_value", "dispatch", "tests"};
    EXPECT_EQ(sectionNames(emitGraph(branchingGraph(), TargetLanguage::Rust)), expected);
    EXPECT_EQ(sectionNames(emitGraph(branchingGraph(), TargetLanguage::Cpp)), expected);
}

TEST(CodeEmitterTests, Rust_StateStructAndDefaults) {
    GraphInfo graph = linearGraph();
    graph.stateSchema.fields.push_back(field("ratio", real(), false, nlohmann::json(1)));
    graph.stateSchema.fields.push_back(field("label", str(), true));
    auto artifact = emitGraph(graph, TargetLanguage::Rust);
    const std::string& body = artifact.section("state_type")->body;
    EXPECT_TRUE(contains(body, "#[derive(Debug, Clone, PartialEq, Serialize, Deserialize)]"));
    EXPECT_TRUE(contains(body, "pub struct GraphState {"));
    EXPECT_TRUE(contains(body, "    pub input: String,\n"));
    EXPECT_TRUE(contains(body, "    pub steps: i64,\n"));
    EXPECT_TRUE(contains(body, "    pub label: Option<String>,\n"));
    EXPECT_TRUE(contains(body, "            input: String::new(),\n"));
    EXPECT_TRUE(contains(body, "            steps: 0,\n"));
    EXPECT_TRUE(contains(body, "            ratio: 1.0,\n"));
    EXPECT_TRUE(contains(body, "            label: None,\n"));

    const std::string& tests = artifact.section("tests")->body;
    EXPECT_TRUE(contains(tests, "assert_eq!(state.steps, 0);"));
    EXPECT_TRUE(contains(tests, "assert!(state.label.is_none());"));
}

TEST(CodeEmitterTests, Cpp_StateStructAndDefaults) {
    GraphInfo graph = linearGraph();
    graph.stateSchema.fields.push_back(field("scores", DynamicType::makeMapping(str(), real())));
    auto artifact = emitGraph(graph, TargetLanguage::Cpp);
    const ArtifactSection* state = artifact.section("state_type");
    ASSERT_NE(state, nullptr);
    EXPECT_TRUE(state->body.empty());
    EXPECT_TRUE(contains(state->declaration, "struct GraphState {"));
    EXPECT_TRUE(contains(state->declaration, "    std::string input{};\n"));
    EXPECT_TRUE(contains(state->declaration, "    std::int64_t steps = 0;\n"));
    EXPECT_TRUE(contains(state->declaration, "    std::map<std::string, double> scores{};\n"));
}

TEST(CodeEmitterTests, Rust_LinearDispatch) {
    auto artifact = emitGraph(linearGraph(), TargetLanguage::Rust);
    const std::string& body = artifact.section("dispatch")->body;
    EXPECT_TRUE(contains(body, "pub enum Node {\n    a,\n    b,\n    c,\n}"));
    EXPECT_TRUE(contains(body, "let mut current = Some(Node::a);"));
    EXPECT_TRUE(contains(body, "state = a(state)?;\n                Some(Node::b)\n"));
    EXPECT_TRUE(contains(body, "state = c(state)?;\n                None\n"));
    EXPECT_FALSE(contains(body, "loop-back"));

    const std::string& stub = artifact.section("node:a")->body;
    EXPECT_TRUE(contains(stub, "pub fn a(state: GraphState) -> Result<GraphState, FlowError> {"));
    EXPECT_TRUE(contains(stub, "node: \"a\","));
}

TEST(CodeEmitterTests, Rust_BranchTableRejectsUnknownLabels) {
    auto artifact = emitGraph(branchingGraph(), TargetLanguage::Rust);
    const std::string& body = artifact.section("dispatch")->body;
    EXPECT_TRUE(contains(body, "pub fn branch_start(label: &str) -> Result<Option<Node>, FlowError> {"));
    EXPECT_TRUE(contains(body, "\"high\" => Ok(Some(Node::high_path)),"));
    EXPECT_TRUE(contains(body, "\"low\" => Ok(Some(Node::low_path)),"));
    EXPECT_TRUE(contains(body, "other => Err(FlowError::DispatchFailed {"));
    EXPECT_TRUE(contains(body, "branch_start(&route_based_on_value(&state))?"));

    const std::string& router = artifact.section("router:route_based_on_value")->body;
    EXPECT_TRUE(contains(router, "pub fn route_based_on_value(state: &GraphState) -> String {"));
    EXPECT_TRUE(contains(router, "/// Must return one of: \"high\", \"low\"."));

    const std::string& tests = artifact.section("tests")->body;
    EXPECT_TRUE(contains(tests, "fn branch_table_start()"));
    EXPECT_TRUE(contains(tests, "branch_start(\"__undeclared__\")"));
}

TEST(CodeEmitterTests, Cpp_BranchTableAndRunLoop) {
    auto artifact = emitGraph(branchingGraph(), TargetLanguage::Cpp);
    const ArtifactSection* dispatch = artifact.section("dispatch");
    ASSERT_NE(dispatch, nullptr);
    EXPECT_TRUE(contains(dispatch->declaration, "enum class Node {"));
    EXPECT_TRUE(contains(dispatch->declaration, "FlowResult<std::optional<Node>> branch_start(const std::string& label);"));
    EXPECT_TRUE(contains(dispatch->body, "if (label == \"high\") return std::optional<Node>(Node::high_path);"));
    EXPECT_TRUE(contains(dispatch->body, "return FlowError{FlowErrorKind::DispatchFailed, \"start\", label};"));
    EXPECT_TRUE(contains(dispatch->body, "branch_start(route_based_on_value(state));"));
    EXPECT_TRUE(contains(dispatch->body, "case Node::high_path: {"));
    EXPECT_TRUE(contains(dispatch->body, "next = std::nullopt;"));

    const ArtifactSection* router = artifact.section("router:route_based_on_value");
    EXPECT_TRUE(contains(router->declaration, "std::string route_based_on_value(const GraphState& state);"));
    EXPECT_TRUE(contains(router->body, "throw std::logic_error("));

    const std::string& tests = artifact.section("tests")->body;
    EXPECT_TRUE(contains(tests, "TEST(GeneratedGraph, BranchTable1)"));
    EXPECT_TRUE(contains(tests, "branch_start(\"__undeclared__\")"));
}

TEST(CodeEmitterTests, Names_ReservedNodeIdsAreRenamed) {
    GraphInfo graph = graphOf("reserved", "state", {"state", "match"});
    graph.edges = {{"state", "match"}, {"match", kTerminal}};
    graph.stateSchema.fields.push_back(field("type", str()));
    graph.stateSchema.fields.push_back(field("result", integer()));

    auto rust = emitGraph(graph, TargetLanguage::Rust);
    EXPECT_TRUE(contains(rust.section("node:state")->body, "pub fn state_2(state: GraphState)"));
    EXPECT_TRUE(contains(rust.section("node:match")->body, "pub fn r_match(state: GraphState)"));
    EXPECT_TRUE(contains(rust.section("node:match")->body, "node: \"match\","));
    const std::string& state = rust.section("state_type")->body;
    EXPECT_TRUE(contains(state, "    #[serde(rename = \"type\")]\n    pub r_type: String,\n"));
    // Field members live in their own scope
    EXPECT_TRUE(contains(state, "    pub result: i64,\n"));

    auto cpp = emitGraph(graph, TargetLanguage::Cpp);
    EXPECT_TRUE(contains(cpp.section("state_type")->declaration, "std::string r_type{}; // key \"type\""));
    EXPECT_TRUE(contains(cpp.section("dispatch")->body, "case Node::state_2: {"));
}

TEST(CodeEmitterTests, Names_RouterSharingNodeNameGetsSuffix) {
    GraphInfo graph = graphOf("clash", "route", {"route", "x"});
    graph.conditionalEdges.push_back({"route", "route", {{"go", "x"}}});
    graph.edges = {{"x", kTerminal}};
    auto artifact = emitGraph(graph, TargetLanguage::Rust);
    EXPECT_TRUE(contains(artifact.section("node:route")->body, "pub fn route(state: GraphState)"));
    EXPECT_TRUE(contains(artifact.section("router:route")->body, "pub fn route_2(state: &GraphState)"));
    EXPECT_TRUE(contains(artifact.section("dispatch")->body, "branch_route(&route_2(&state))?"));
}

TEST(CodeEmitterTests, Names_GraphNamedAfterEntryNode) {
    GraphInfo graph = graphOf("start", "start", {"start"});
    graph.edges = {{"start", kTerminal}};

    auto cpp = emitGraph(graph, TargetLanguage::Cpp);
    EXPECT_EQ(cpp.moduleName, "start");
    EXPECT_TRUE(contains(cpp.section("node:start")->declaration, "FlowResult<GraphState> start_2(GraphState state);"));
    EXPECT_TRUE(contains(cpp.section("tests")->body, "result = start_2(GraphState{});"));
    auto files = layoutFiles(cpp);
    const OutputFile* test = fileNamed(files, "start_graph_test.cpp");
    ASSERT_NE(test, nullptr);
    EXPECT_TRUE(contains(test->contents, "using namespace start;"));

    auto rust = emitGraph(graph, TargetLanguage::Rust);
    EXPECT_TRUE(contains(rust.section("node:start")->body, "pub fn start_2(state: GraphState)"));
}

TEST(CodeEmitterTests, Stub_CarriesSourceSignature) {
    GraphInfo graph = linearGraph();
    graph.nodes[0].sourceLocation = "wf.py:3";
    graph.nodes[0].signature = "(state: WfState) -> WfState";

    auto rust = emitGraph(graph, TargetLanguage::Rust);
    EXPECT_TRUE(contains(rust.section("node:a")->body,
                         "/// Source: wf.py:3\n/// Signature: (state: WfState) -> WfState\n"));
    EXPECT_FALSE(contains(rust.section("node:b")->body, "Signature:"));

    auto cpp = emitGraph(graph, TargetLanguage::Cpp);
    EXPECT_TRUE(contains(cpp.section("node:a")->declaration, "// Signature: (state: WfState) -> WfState\n"));
}

TEST(CodeEmitterTests, Names_CustomStateType) {
    EmitOptions options;
    options.stateTypeName = "WorkflowState";
    auto artifact = emitGraph(linearGraph(), TargetLanguage::Rust, options);
    EXPECT_TRUE(contains(artifact.section("state_type")->body, "pub struct WorkflowState {"));
    EXPECT_TRUE(contains(artifact.section("dispatch")->body, "pub fn run_graph(mut state: WorkflowState)"));

    options.stateTypeName = "Node";
    auto clashing = emitGraph(linearGraph(), TargetLanguage::Cpp, options);
    EXPECT_TRUE(contains(clashing.section("state_type")->declaration, "struct Node_2 {"));
}

TEST(CodeEmitterTests, Unreachable_StubKeptOutOfDispatch) {
    GraphInfo graph = linearGraph();
    graph.nodes.push_back(node("orphan", "Never called."));

    auto rust = emitGraph(graph, TargetLanguage::Rust);
    const std::string& stub = rust.section("node:orphan")->body;
    EXPECT_TRUE(contains(stub, "/// orphan: Never called.\n"));
    EXPECT_TRUE(contains(stub, "// Unreachable from entry point \"a\""));
    EXPECT_TRUE(contains(stub, "#[allow(dead_code)]\npub fn orphan("));
    EXPECT_FALSE(contains(rust.section("dispatch")->body, "orphan"));
    ASSERT_EQ(rust.diagnostics.size(), 1u);
    EXPECT_EQ(rust.diagnostics[0].kind, DiagnosticKind::UnreachableNode);

    auto cpp = emitGraph(graph, TargetLanguage::Cpp);
    EXPECT_TRUE(contains(cpp.section("node:orphan")->declaration, "// Unreachable from entry point \"a\""));
    EXPECT_FALSE(contains(cpp.section("dispatch")->declaration, "orphan"));
}

TEST(CodeEmitterTests, Escaping_CommentsAndLiterals) {
    GraphInfo graph = graphOf("esc", "say \"hi\"", {"say \"hi\""});
    graph.nodes[0].doc = "First line.\nSecond line \\";
    graph.edges = {{"say \"hi\"", kTerminal}};
    graph.stateSchema.fields.push_back(field("greeting", str(), false, nlohmann::json("tab\there")));

    auto rust = emitGraph(graph, TargetLanguage::Rust);
    const std::string& stub = rust.section("node:say \"hi\"")->body;
    EXPECT_TRUE(contains(stub, ": First line. Second line\n"));
    EXPECT_TRUE(contains(stub, "node: \"say \\\"hi\\\"\","));
    EXPECT_TRUE(contains(rust.section("state_type")->body, "String::from(\"tab\\there\")"));

    auto cpp = emitGraph(graph, TargetLanguage::Cpp);
    EXPECT_TRUE(contains(cpp.section("state_type")->declaration, "std::string greeting = \"tab\\there\";"));
}

TEST(CodeEmitterTests, ProbeLabel_AvoidsDeclaredLabels) {
    GraphInfo graph = branchingGraph();
    graph.conditionalEdges[0].mapping.emplace_back("__undeclared__", kTerminal);
    auto artifact = emitGraph(graph, TargetLanguage::Rust);
    const std::string& tests = artifact.section("tests")->body;
    EXPECT_TRUE(contains(tests, "branch_start(\"__undeclared___\")"));
    EXPECT_TRUE(contains(tests, "assert_eq!(branch_start(\"__undeclared__\").unwrap(), None);"));
}

TEST(CodeEmitterTests, WithoutTests_NoScaffold) {
    EmitOptions options;
    options.withTests = false;
    auto rust = emitGraph(linearGraph(), TargetLanguage::Rust, options);
    EXPECT_EQ(rust.section("tests"), nullptr);
    EXPECT_FALSE(contains(rust.render(), "#[cfg(test)]"));

    auto cpp = emitGraph(linearGraph(), TargetLanguage::Cpp, options);
    EXPECT_TRUE(cpp.dependencies.empty());
    auto files = layoutFiles(cpp);
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(fileNamed(files, "linear_graph_test.cpp"), nullptr);
    EXPECT_FALSE(contains(fileNamed(files, "CMakeLists.txt")->contents, "GTest"));
}

TEST(CodeEmitterTests, Layout_RustCrate) {
    auto artifact = emitGraph(linearGraph(), TargetLanguage::Rust);
    auto files = layoutFiles(artifact);
    ASSERT_EQ(files.size(), 2u);
    const OutputFile* lib = fileNamed(files, "src/lib.rs");
    ASSERT_NE(lib, nullptr);
    EXPECT_EQ(lib->contents, artifact.render());
    const OutputFile* cargo = fileNamed(files, "Cargo.toml");
    ASSERT_NE(cargo, nullptr);
    EXPECT_TRUE(contains(cargo->contents, "name = \"linear\""));
    EXPECT_TRUE(contains(cargo->contents, "serde = { version = \"1\", features = [\"derive\"] }"));
    EXPECT_TRUE(contains(cargo->contents, "serde_json = \"1\""));

    auto renamed = layoutFiles(artifact, "my_crate");
    EXPECT_TRUE(contains(fileNamed(renamed, "Cargo.toml")->contents, "name = \"my_crate\""));
}

TEST(CodeEmitterTests, Layout_CppProject) {
    GraphInfo graph = linearGraph();
    graph.stateSchema.fields.push_back(field("meta", DynamicType::makeOpaque("Any")));
    auto artifact = emitGraph(graph, TargetLanguage::Cpp);
    EXPECT_EQ(artifact.dependencies, (std::vector<std::string>{"nlohmann_json", "GTest"}));

    auto files = layoutFiles(artifact);
    ASSERT_EQ(files.size(), 4u);
    const OutputFile* header = fileNamed(files, "linear_graph.hpp");
    ASSERT_NE(header, nullptr);
    EXPECT_TRUE(contains(header->contents, "#pragma once\n"));
    EXPECT_TRUE(contains(header->contents, "#include <nlohmann/json.hpp>\n"));
    EXPECT_TRUE(contains(header->contents, "namespace linear {\n"));
    EXPECT_TRUE(contains(header->contents, "nlohmann::json meta{};"));

    const OutputFile* source = fileNamed(files, "linear_graph.cpp");
    ASSERT_NE(source, nullptr);
    EXPECT_TRUE(contains(source->contents, "#include \"linear_graph.hpp\"\n"));
    EXPECT_TRUE(contains(source->contents, "FlowResult<GraphState> run_graph(GraphState state) {"));
    EXPECT_FALSE(contains(source->contents, "TEST("));

    const OutputFile* test = fileNamed(files, "linear_graph_test.cpp");
    ASSERT_NE(test, nullptr);
    EXPECT_TRUE(contains(test->contents, "using namespace linear;"));
    EXPECT_TRUE(contains(test->contents, "TEST(GeneratedGraph, StateDefaults)"));
    EXPECT_TRUE(contains(test->contents, "EXPECT_TRUE(state.meta.is_null());"));

    const std::string& cmake = fileNamed(files, "CMakeLists.txt")->contents;
    EXPECT_TRUE(contains(cmake, "find_package(nlohmann_json 3 REQUIRED)"));
    EXPECT_TRUE(contains(cmake, "gtest_discover_tests(linear_graph_test)"));
}

TEST(CodeEmitterTests, Helpers_Formatting) {
    EXPECT_EQ(floatLiteral(1.0), "1.0");
    EXPECT_EQ(floatLiteral(2.5), "2.5");
    EXPECT_EQ(floatLiteral(-0.125), "-0.125");
    EXPECT_EQ(commentText("  a\n\tb  c \\\\"), "a b c");
    EXPECT_EQ(indentLines("x\n\ny\n", "  "), "  x\n\n  y\n");
}
