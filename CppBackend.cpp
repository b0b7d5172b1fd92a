// CppBackend.cpp
//
// C++17 rendering of the emit model. Declarations go to the header and
// definitions to the source file; results travel as
// std::variant<T, FlowError> and the scaffold is a GoogleTest file.
#include "EmitModel.hpp"
#include <algorithm>
#include <cstdint>
#include <fmt/core.h>
#include <sstream>

namespace FlowGen {

namespace {

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        switch (ch) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            // Octal escapes stop after three digits, unlike \x
            if (c < 0x20 || c == 0x7f) out += fmt::format("\\{:03o}", c);
            else out.push_back(ch);
        }
    }
    out += "\"";
    return out;
}

std::string typeName(const StaticType& type) {
    auto arg = [&](size_t i) { return i < type.args.size() ? typeName(type.args[i]) : std::string("nlohmann::json"); };
    switch (type.kind) {
    case StaticKind::Text: return "std::string";
    case StaticKind::Int64: return "std::int64_t";
    case StaticKind::Float64: return "double";
    case StaticKind::Bool: return "bool";
    case StaticKind::Sequence: return fmt::format("std::vector<{}>", arg(0));
    case StaticKind::OrderedDict: return fmt::format("std::map<{}, {}>", arg(0), arg(1));
    case StaticKind::Nullable: return fmt::format("std::optional<{}>", arg(0));
    case StaticKind::Dynamic: return "nlohmann::json";
    }
    return "nlohmann::json";
}

std::string intLiteral(std::int64_t v) {
    // -9223372036854775808 is a negated literal that overflows
    if (v == INT64_MIN) return "(-9223372036854775807 - 1)";
    return std::to_string(v);
}

// Copy-initializer for a field whose default passed defaultFits().
std::string valueOf(const StaticType& type, const nlohmann::json& value) {
    switch (type.kind) {
    case StaticKind::Text: return quote(value.get<std::string>());
    case StaticKind::Int64: return intLiteral(value.get<std::int64_t>());
    case StaticKind::Float64: return floatLiteral(value.get<double>());
    case StaticKind::Bool: return value.get<bool>() ? "true" : "false";
    case StaticKind::Sequence:
    case StaticKind::OrderedDict: return typeName(type) + "{}";
    case StaticKind::Nullable:
        if (value.is_null() || type.args.empty()) return "std::nullopt";
        return valueOf(type.args[0], value);
    case StaticKind::Dynamic: return "nullptr";
    }
    return "nullptr";
}

void fieldAssertions(std::ostringstream& out, const StaticType& type, const std::string& expr,
                     const nlohmann::json* value) {
    switch (type.kind) {
    case StaticKind::Text:
        if (value) out << "    EXPECT_EQ(" << expr << ", " << quote(value->get<std::string>()) << ");\n";
        else out << "    EXPECT_TRUE(" << expr << ".empty());\n";
        break;
    case StaticKind::Int64:
        out << "    EXPECT_EQ(" << expr << ", " << (value ? intLiteral(value->get<std::int64_t>()) : "0") << ");\n";
        break;
    case StaticKind::Float64:
        out << "    EXPECT_DOUBLE_EQ(" << expr << ", " << (value ? floatLiteral(value->get<double>()) : "0.0") << ");\n";
        break;
    case StaticKind::Bool:
        out << "    " << (value && value->get<bool>() ? "EXPECT_TRUE(" : "EXPECT_FALSE(") << expr << ");\n";
        break;
    case StaticKind::Sequence:
    case StaticKind::OrderedDict: out << "    EXPECT_TRUE(" << expr << ".empty());\n"; break;
    case StaticKind::Nullable:
        if (!value || value->is_null() || type.args.empty()) {
            out << "    EXPECT_FALSE(" << expr << ".has_value());\n";
        } else {
            out << "    ASSERT_TRUE(" << expr << ".has_value());\n";
            fieldAssertions(out, type.args[0], "(*" + expr + ")", value);
        }
        break;
    case StaticKind::Dynamic: out << "    EXPECT_TRUE(" << expr << ".is_null());\n"; break;
    }
}

std::string targetExpr(const std::optional<std::string>& symbol) {
    return symbol ? "std::optional<Node>(Node::" + *symbol + ")" : std::string("std::optional<Node>()");
}

std::string resultOf(const EmitModel& model) { return "FlowResult<" + model.stateType + ">"; }

ArtifactSection prelude() {
    std::ostringstream decl;
    decl << "// Failure raised while running the graph.\n";
    decl << "enum class FlowErrorKind {\n";
    decl << "    NodeFailed,    // a node function reported an error\n";
    decl << "    DispatchFailed // a router returned a label that is not in its branch table\n";
    decl << "};\n\n";
    decl << "struct FlowError {\n";
    decl << "    FlowErrorKind kind;\n";
    decl << "    std::string node;   // node id as declared in the graph\n";
    decl << "    std::string detail; // node message, or the rejected label\n";
    decl << "};\n\n";
    decl << "template <typename T>\n";
    decl << "using FlowResult = std::variant<T, FlowError>;\n";
    return {"prelude", decl.str(), std::string()};
}

ArtifactSection stateType(const EmitModel& model) {
    std::ostringstream decl;
    decl << "// Workflow state passed through every node.\n";
    decl << "struct " << model.stateType << " {\n";
    for (const auto& f : model.fields) {
        decl << "    " << typeName(f.type) << " " << f.symbol;
        if (f.defaultValue) decl << " = " << valueOf(f.type, *f.defaultValue) << ";";
        else decl << "{};";
        if (f.symbol != f.name) decl << " // key " << commentText(quote(f.name));
        decl << "\n";
    }
    decl << "};\n";
    return {"state_type", decl.str(), std::string()};
}

ArtifactSection nodeStub(const EmitModel& model, const EmitNode& node) {
    const std::string signature =
        resultOf(model) + " " + node.symbol + "(" + model.stateType + " state)";
    std::ostringstream decl, body;
    decl << "// " << node.summary << "\n";
    if (node.sourceLocation) decl << "// Source: " << commentText(*node.sourceLocation) << "\n";
    if (node.signature) decl << "// Signature: " << commentText(*node.signature) << "\n";
    if (!node.reachable) {
        decl << "// Unreachable from entry point " << commentText(quote(model.entry().id))
             << "; kept for later completion and excluded from dispatch.\n";
    }
    decl << signature << ";\n";

    body << signature << " {\n";
    body << "    (void)state;\n";
    body << "    return FlowError{FlowErrorKind::NodeFailed, " << quote(node.id) << ", \"not implemented\"};\n";
    body << "}\n";
    return {"node:" + node.id, decl.str(), body.str()};
}

ArtifactSection routerStub(const EmitModel& model, const EmitRouter& router) {
    const std::string signature = "std::string " + router.symbol + "(const " + model.stateType + "& state)";
    std::string callers, labels;
    for (const auto& c : router.callers) callers += (callers.empty() ? "" : ", ") + quote(c);
    for (const auto& l : router.labels) labels += (labels.empty() ? "" : ", ") + quote(l);

    std::ostringstream decl, body;
    decl << "// Router " << commentText(quote(router.name)) << ", consulted after " << commentText(callers) << ".\n";
    decl << "// Must return one of: " << commentText(labels) << ".\n";
    decl << signature << ";\n";

    body << signature << " {\n";
    body << "    (void)state;\n";
    body << "    throw std::logic_error(\"router " << router.symbol << " is not implemented\");\n";
    body << "}\n";
    return {"router:" + router.name, decl.str(), body.str()};
}

ArtifactSection dispatch(const EmitModel& model) {
    std::ostringstream decl, body;
    decl << "// Nodes reachable from the entry point.\n";
    decl << "enum class Node {\n";
    for (const auto& d : model.dispatch) decl << "    " << d.nodeSymbol << ",\n";
    decl << "};\n\n";

    for (const auto& d : model.dispatch) {
        if (!d.isConditional()) continue;
        const std::string signature =
            "FlowResult<std::optional<Node>> " + d.branchSymbol + "(const std::string& label)";
        decl << "// Branch table of the router consulted after " << commentText(quote(d.nodeId)) << ".\n";
        decl << signature << ";\n";

        body << signature << " {\n";
        for (const auto& b : d.branches) {
            body << "    if (label == " << quote(b.label) << ") return " << targetExpr(b.targetSymbol) << ";";
            if (b.loopBack) body << " // loop-back";
            body << "\n";
        }
        body << "    return FlowError{FlowErrorKind::DispatchFailed, " << quote(d.nodeId) << ", label};\n";
        body << "}\n\n";
    }

    const EmitDispatch& entry = model.dispatch.front();
    const bool loops = std::any_of(model.dispatch.begin(), model.dispatch.end(), [](const EmitDispatch& d) {
        return d.loopBack ||
               std::any_of(d.branches.begin(), d.branches.end(), [](const EmitBranch& b) { return b.loopBack; });
    });
    const std::string signature = resultOf(model) + " run_graph(" + model.stateType + " state)";
    decl << "// Runs the graph from " << commentText(quote(entry.nodeId)) << " until a transition reaches END.\n";
    if (loops) decl << "// Loop-back transitions re-enter the loop; only the routers bound the iteration count.\n";
    decl << signature << ";\n";

    body << signature << " {\n";
    body << "    std::optional<Node> current = Node::" << entry.nodeSymbol << ";\n";
    body << "    while (current) {\n";
    body << "        std::optional<Node> next;\n";
    body << "        switch (*current) {\n";
    for (const auto& d : model.dispatch) {
        body << "        case Node::" << d.nodeSymbol << ": {\n";
        body << "            " << resultOf(model) << " result = " << d.nodeSymbol << "(std::move(state));\n";
        body << "            if (auto* err = std::get_if<FlowError>(&result)) return *err;\n";
        body << "            state = std::move(std::get<" << model.stateType << ">(result));\n";
        if (d.isConditional()) {
            body << "            FlowResult<std::optional<Node>> branch = " << d.branchSymbol << "(" << d.routerSymbol
                 << "(state));\n";
            body << "            if (auto* err = std::get_if<FlowError>(&branch)) return *err;\n";
            body << "            next = std::get<std::optional<Node>>(branch);\n";
        } else {
            if (d.loopBack) body << "            // loop-back: re-enters " << commentText(quote(d.next)) << "\n";
            if (d.implicitTerminal) body << "            // no outgoing edge\n";
            body << "            next = " << (d.nextSymbol ? "Node::" + *d.nextSymbol : std::string("std::nullopt"))
                 << ";\n";
        }
        body << "            break;\n";
        body << "        }\n";
    }
    body << "        }\n";
    body << "        current = next;\n";
    body << "    }\n";
    body << "    return state;\n";
    body << "}\n";
    return {"dispatch", decl.str(), body.str()};
}

ArtifactSection tests(const EmitModel& model) {
    std::ostringstream out;
    const EmitNode& entry = model.entry();

    out << "TEST(GeneratedGraph, StateDefaults) {\n";
    out << "    " << model.stateType << " state;\n";
    if (model.fields.empty()) out << "    (void)state;\n";
    for (const auto& f : model.fields) {
        fieldAssertions(out, f.type, "state." + f.symbol, f.defaultValue ? &*f.defaultValue : nullptr);
    }
    out << "}\n\n";

    out << "TEST(GeneratedGraph, EntryNodeAcceptsState) {\n";
    out << "    " << resultOf(model) << " result = " << entry.symbol << "(" << model.stateType << "{});\n";
    out << "    if (const FlowError* err = std::get_if<FlowError>(&result)) {\n";
    out << "        EXPECT_TRUE(err->kind == FlowErrorKind::NodeFailed);\n";
    out << "        EXPECT_EQ(err->node, " << quote(entry.id) << ");\n";
    out << "    }\n";
    out << "}\n";

    int index = 0;
    for (const auto& d : model.dispatch) {
        if (!d.isConditional()) continue;
        out << "\n// Branch table after " << commentText(quote(d.nodeId)) << "\n";
        out << "TEST(GeneratedGraph, BranchTable" << ++index << ") {\n";
        for (const auto& b : d.branches) {
            out << "    EXPECT_TRUE(std::get<std::optional<Node>>(" << d.branchSymbol << "(" << quote(b.label)
                << ")) == " << targetExpr(b.targetSymbol) << ");\n";
        }
        out << "    FlowResult<std::optional<Node>> probe = " << d.branchSymbol << "(" << quote(d.undeclaredLabel)
            << ");\n";
        out << "    ASSERT_TRUE(std::holds_alternative<FlowError>(probe));\n";
        out << "    EXPECT_TRUE(std::get<FlowError>(probe).kind == FlowErrorKind::DispatchFailed);\n";
        out << "}\n";
    }
    return {"tests", std::string(), out.str()};
}

std::string banner(const SourceArtifact& artifact) {
    return "// Generated by flowgen from graph " + commentText(quote(artifact.graphName)) +
           ".\n// Node and router bodies are placeholders to be completed by hand.\n";
}

bool needs(const SourceArtifact& artifact, const std::string& dependency) {
    return std::find(artifact.dependencies.begin(), artifact.dependencies.end(), dependency) !=
           artifact.dependencies.end();
}

} // namespace

std::vector<ArtifactSection> renderCpp(const EmitModel& model) {
    std::vector<ArtifactSection> sections;
    sections.push_back(prelude());
    sections.push_back(stateType(model));
    for (const auto& n : model.nodes) sections.push_back(nodeStub(model, n));
    for (const auto& r : model.routers) sections.push_back(routerStub(model, r));
    sections.push_back(dispatch(model));
    if (model.withTests) sections.push_back(tests(model));
    return sections;
}

std::vector<OutputFile> layoutCpp(const SourceArtifact& artifact, const std::string& baseName) {
    const std::string stem = baseName + "_graph";
    const std::string& ns = artifact.moduleName;

    std::ostringstream header, source, test, cmake;
    header << banner(artifact);
    header << "#pragma once\n";
    header << "#include <cstdint>\n#include <map>\n#include <optional>\n#include <string>\n";
    header << "#include <variant>\n#include <vector>\n";
    if (needs(artifact, "nlohmann_json")) header << "#include <nlohmann/json.hpp>\n";
    header << "\nnamespace " << ns << " {\n";

    source << banner(artifact);
    source << "#include \"" << stem << ".hpp\"\n";
    source << "#include <stdexcept>\n#include <utility>\n";
    source << "\nnamespace " << ns << " {\n";

    const ArtifactSection* tests = nullptr;
    for (const auto& s : artifact.sections) {
        if (s.name == "tests") {
            tests = &s;
            continue;
        }
        if (!s.declaration.empty()) header << "\n" << s.declaration;
        if (!s.body.empty()) source << "\n" << s.body;
    }
    header << "\n} // namespace " << ns << "\n";
    source << "\n} // namespace " << ns << "\n";

    std::vector<OutputFile> files{{stem + ".hpp", header.str()}, {stem + ".cpp", source.str()}};

    cmake << "cmake_minimum_required(VERSION 3.16)\n";
    cmake << "project(" << stem << " LANGUAGES CXX)\n\n";
    cmake << "set(CMAKE_CXX_STANDARD 17)\n";
    cmake << "set(CMAKE_CXX_STANDARD_REQUIRED ON)\n\n";
    if (needs(artifact, "nlohmann_json")) cmake << "find_package(nlohmann_json 3 REQUIRED)\n\n";
    cmake << "add_library(" << stem << " " << stem << ".cpp)\n";
    cmake << "target_include_directories(" << stem << " PUBLIC ${CMAKE_CURRENT_SOURCE_DIR})\n";
    if (needs(artifact, "nlohmann_json")) {
        cmake << "target_link_libraries(" << stem << " PUBLIC nlohmann_json::nlohmann_json)\n";
    }

    if (tests) {
        test << banner(artifact);
        test << "#include \"" << stem << ".hpp\"\n";
        test << "#include <gtest/gtest.h>\n\n";
        test << "using namespace " << ns << ";\n\n";
        test << tests->body;
        files.push_back({stem + "_test.cpp", test.str()});

        cmake << "\nenable_testing()\n";
        cmake << "find_package(GTest REQUIRED)\n";
        cmake << "include(GoogleTest)\n";
        cmake << "add_executable(" << stem << "_test " << stem << "_test.cpp)\n";
        cmake << "target_link_libraries(" << stem << "_test PRIVATE " << stem << " GTest::gtest_main)\n";
        cmake << "gtest_discover_tests(" << stem << "_test)\n";
    }
    files.push_back({"CMakeLists.txt", cmake.str()});
    return files;
}

} // namespace FlowGen
