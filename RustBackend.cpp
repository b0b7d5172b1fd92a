// RustBackend.cpp
//
// Rust rendering of the emit model: serde-derived state struct, node and
// router stubs, a Node enum driven by one `while let` dispatch loop, and a
// #[cfg(test)] scaffold.
#include "EmitModel.hpp"
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
            if (c < 0x20 || c == 0x7f) out += fmt::format("\\x{:02x}", c);
            else out.push_back(ch);
        }
    }
    out += "\"";
    return out;
}

std::string typeName(const StaticType& type) {
    auto arg = [&](size_t i) { return i < type.args.size() ? typeName(type.args[i]) : std::string("serde_json::Value"); };
    switch (type.kind) {
    case StaticKind::Text: return "String";
    case StaticKind::Int64: return "i64";
    case StaticKind::Float64: return "f64";
    case StaticKind::Bool: return "bool";
    case StaticKind::Sequence: return fmt::format("Vec<{}>", arg(0));
    case StaticKind::OrderedDict: return fmt::format("std::collections::BTreeMap<{}, {}>", arg(0), arg(1));
    case StaticKind::Nullable: return fmt::format("Option<{}>", arg(0));
    case StaticKind::Dynamic: return "serde_json::Value";
    }
    return "serde_json::Value";
}

// Initializer expression; `value` has already passed defaultFits().
std::string valueOf(const StaticType& type, const nlohmann::json* value) {
    switch (type.kind) {
    case StaticKind::Text: return value ? "String::from(" + quote(value->get<std::string>()) + ")" : "String::new()";
    case StaticKind::Int64: return value ? std::to_string(value->get<std::int64_t>()) : "0";
    case StaticKind::Float64: return value ? floatLiteral(value->get<double>()) : "0.0";
    case StaticKind::Bool: return value && value->get<bool>() ? "true" : "false";
    case StaticKind::Sequence: return "Vec::new()";
    case StaticKind::OrderedDict: return "std::collections::BTreeMap::new()";
    case StaticKind::Nullable:
        if (!value || value->is_null() || type.args.empty()) return "None";
        return "Some(" + valueOf(type.args[0], value) + ")";
    case StaticKind::Dynamic: return "serde_json::Value::Null";
    }
    return "serde_json::Value::Null";
}

std::string fieldAssertion(const EmitField& f) {
    const std::string member = "state." + f.symbol;
    const nlohmann::json* value = f.defaultValue ? &*f.defaultValue : nullptr;
    switch (f.type.kind) {
    case StaticKind::Text: return fmt::format("assert_eq!({}, {});", member, quote(value ? value->get<std::string>() : ""));
    case StaticKind::Int64:
    case StaticKind::Float64: return fmt::format("assert_eq!({}, {});", member, valueOf(f.type, value));
    case StaticKind::Bool: return fmt::format("assert!({}{});", value && value->get<bool>() ? "" : "!", member);
    case StaticKind::Sequence:
    case StaticKind::OrderedDict: return fmt::format("assert!({}.is_empty());", member);
    case StaticKind::Nullable:
        if (!value || value->is_null()) return fmt::format("assert!({}.is_none());", member);
        return fmt::format("assert_eq!({}, {});", member, valueOf(f.type, value));
    case StaticKind::Dynamic: return fmt::format("assert!({}.is_null());", member);
    }
    return std::string();
}

std::string targetExpr(const std::optional<std::string>& symbol) {
    return symbol ? "Some(Node::" + *symbol + ")" : std::string("None");
}

ArtifactSection prelude(const EmitModel& model) {
    std::ostringstream out;
    out << "// Generated by flowgen from graph " << commentText(quote(model.graphName)) << ".\n";
    out << "// Node and router bodies are placeholders to be completed by hand.\n\n";
    out << "use serde::{Deserialize, Serialize};\n";
    out << "use std::fmt;\n\n";
    out << "/// Failure raised while running the graph.\n";
    out << "#[derive(Debug, Clone, PartialEq)]\n";
    out << "pub enum FlowError {\n";
    out << "    /// A node function reported an error.\n";
    out << "    NodeFailed { node: &'static str, message: String },\n";
    out << "    /// A router returned a label that is not in its branch table.\n";
    out << "    DispatchFailed { node: &'static str, label: String },\n";
    out << "}\n\n";
    out << "impl fmt::Display for FlowError {\n";
    out << "    fn fmt(&self, f: &mut fmt::Formatter<'_>) -> fmt::Result {\n";
    out << "        match self {\n";
    out << "            FlowError::NodeFailed { node, message } => write!(f, \"node '{}' failed: {}\", node, message),\n";
    out << "            FlowError::DispatchFailed { node, label } => {\n";
    out << "                write!(f, \"router after node '{}' returned undeclared label '{}'\", node, label)\n";
    out << "            }\n";
    out << "        }\n";
    out << "    }\n";
    out << "}\n\n";
    out << "impl std::error::Error for FlowError {}\n";
    return {"prelude", std::string(), out.str()};
}

ArtifactSection stateType(const EmitModel& model) {
    std::ostringstream out;
    out << "/// Workflow state passed through every node.\n";
    out << "#[derive(Debug, Clone, PartialEq, Serialize, Deserialize)]\n";
    out << "#[serde(default)]\n";
    out << "pub struct " << model.stateType << " {\n";
    for (const auto& f : model.fields) {
        if (f.symbol != f.name) out << "    #[serde(rename = " << quote(f.name) << ")]\n";
        out << "    pub " << f.symbol << ": " << typeName(f.type) << ",\n";
    }
    out << "}\n\n";
    out << "impl Default for " << model.stateType << " {\n";
    out << "    fn default() -> Self {\n";
    out << "        " << model.stateType << " {\n";
    for (const auto& f : model.fields) {
        out << "            " << f.symbol << ": " << valueOf(f.type, f.defaultValue ? &*f.defaultValue : nullptr)
            << ",\n";
    }
    out << "        }\n";
    out << "    }\n";
    out << "}\n";
    return {"state_type", std::string(), out.str()};
}

ArtifactSection nodeStub(const EmitModel& model, const EmitNode& node) {
    std::ostringstream out;
    out << "/// " << node.summary << "\n";
    if (node.sourceLocation) out << "/// Source: " << commentText(*node.sourceLocation) << "\n";
    if (node.signature) out << "/// Signature: " << commentText(*node.signature) << "\n";
    if (!node.reachable) {
        out << "// Unreachable from entry point " << commentText(quote(model.entry().id))
            << "; kept for later completion and excluded from dispatch.\n";
        out << "#[allow(dead_code)]\n";
    }
    out << "pub fn " << node.symbol << "(state: " << model.stateType << ") -> Result<" << model.stateType
        << ", FlowError> {\n";
    out << "    let _ = state;\n";
    out << "    Err(FlowError::NodeFailed {\n";
    out << "        node: " << quote(node.id) << ",\n";
    out << "        message: String::from(\"not implemented\"),\n";
    out << "    })\n";
    out << "}\n";
    return {"node:" + node.id, std::string(), out.str()};
}

ArtifactSection routerStub(const EmitModel& model, const EmitRouter& router) {
    std::ostringstream out;
    std::string callers, labels;
    for (const auto& c : router.callers) callers += (callers.empty() ? "" : ", ") + quote(c);
    for (const auto& l : router.labels) labels += (labels.empty() ? "" : ", ") + quote(l);
    out << "/// Router " << commentText(quote(router.name)) << ", consulted after " << commentText(callers) << ".\n";
    out << "/// Must return one of: " << commentText(labels) << ".\n";
    out << "pub fn " << router.symbol << "(state: &" << model.stateType << ") -> String {\n";
    out << "    let _ = state;\n";
    out << "    unimplemented!(\"router " << router.symbol << "\")\n";
    out << "}\n";
    return {"router:" + router.name, std::string(), out.str()};
}

void branchFunction(std::ostringstream& out, const EmitDispatch& d) {
    out << "/// Branch table of the router consulted after " << commentText(quote(d.nodeId)) << ".\n";
    out << "pub fn " << d.branchSymbol << "(label: &str) -> Result<Option<Node>, FlowError> {\n";
    out << "    match label {\n";
    for (const auto& b : d.branches) {
        out << "        " << quote(b.label) << " => Ok(" << targetExpr(b.targetSymbol) << "),";
        if (b.loopBack) out << " // loop-back";
        out << "\n";
    }
    out << "        other => Err(FlowError::DispatchFailed {\n";
    out << "            node: " << quote(d.nodeId) << ",\n";
    out << "            label: other.to_string(),\n";
    out << "        }),\n";
    out << "    }\n";
    out << "}\n\n";
}

ArtifactSection dispatch(const EmitModel& model) {
    std::ostringstream out;
    out << "/// Nodes reachable from the entry point.\n";
    out << "#[allow(non_camel_case_types)]\n";
    out << "#[derive(Debug, Clone, Copy, PartialEq, Eq)]\n";
    out << "pub enum Node {\n";
    for (const auto& d : model.dispatch) out << "    " << d.nodeSymbol << ",\n";
    out << "}\n\n";

    for (const auto& d : model.dispatch) {
        if (d.isConditional()) branchFunction(out, d);
    }

    const EmitDispatch& entry = model.dispatch.front();
    out << "/// Runs the graph from " << commentText(quote(entry.nodeId)) << " until a transition reaches END.\n";
    bool loops = false;
    for (const auto& d : model.dispatch) {
        loops = loops || d.loopBack;
        for (const auto& b : d.branches) loops = loops || b.loopBack;
    }
    if (loops) out << "/// Loop-back transitions re-enter the loop; only the routers bound the iteration count.\n";
    out << "pub fn run_graph(mut state: " << model.stateType << ") -> Result<" << model.stateType << ", FlowError> {\n";
    out << "    let mut current = Some(Node::" << entry.nodeSymbol << ");\n";
    out << "    while let Some(node) = current {\n";
    out << "        current = match node {\n";
    for (const auto& d : model.dispatch) {
        out << "            Node::" << d.nodeSymbol << " => {\n";
        out << "                state = " << d.nodeSymbol << "(state)?;\n";
        if (d.isConditional()) {
            out << "                " << d.branchSymbol << "(&" << d.routerSymbol << "(&state))?\n";
        } else {
            if (d.loopBack) out << "                // loop-back: re-enters " << commentText(quote(d.next)) << "\n";
            if (d.implicitTerminal) out << "                // no outgoing edge\n";
            out << "                " << targetExpr(d.nextSymbol) << "\n";
        }
        out << "            }\n";
    }
    out << "        };\n";
    out << "    }\n";
    out << "    Ok(state)\n";
    out << "}\n";
    return {"dispatch", std::string(), out.str()};
}

ArtifactSection tests(const EmitModel& model) {
    std::ostringstream out;
    const EmitNode& entry = model.entry();
    out << "#[cfg(test)]\n";
    out << "mod tests {\n";
    out << "    use super::*;\n\n";

    out << "    #[test]\n";
    out << "    fn state_defaults() {\n";
    if (model.fields.empty()) {
        out << "        let _ = " << model.stateType << "::default();\n";
    } else {
        out << "        let state = " << model.stateType << "::default();\n";
        for (const auto& f : model.fields) out << "        " << fieldAssertion(f) << "\n";
    }
    out << "    }\n\n";

    out << "    #[test]\n";
    out << "    fn entry_node_accepts_state() {\n";
    out << "        match " << entry.symbol << "(" << model.stateType << "::default()) {\n";
    out << "            Ok(_) => {}\n";
    out << "            Err(FlowError::NodeFailed { node, .. }) => assert_eq!(node, " << quote(entry.id) << "),\n";
    out << "            Err(other) => panic!(\"unexpected error: {}\", other),\n";
    out << "        }\n";
    out << "    }\n";

    for (const auto& d : model.dispatch) {
        if (!d.isConditional()) continue;
        out << "\n    #[test]\n";
        out << "    fn branch_table_" << d.nodeSymbol << "() {\n";
        for (const auto& b : d.branches) {
            out << "        assert_eq!(" << d.branchSymbol << "(" << quote(b.label) << ").unwrap(), "
                << targetExpr(b.targetSymbol) << ");\n";
        }
        out << "        assert!(matches!(\n";
        out << "            " << d.branchSymbol << "(" << quote(d.undeclaredLabel) << "),\n";
        out << "            Err(FlowError::DispatchFailed { .. })\n";
        out << "        ));\n";
        out << "    }\n";
    }
    out << "}\n";
    return {"tests", std::string(), out.str()};
}

} // namespace

std::vector<ArtifactSection> renderRust(const EmitModel& model) {
    std::vector<ArtifactSection> sections;
    sections.push_back(prelude(model));
    sections.push_back(stateType(model));
    for (const auto& n : model.nodes) sections.push_back(nodeStub(model, n));
    for (const auto& r : model.routers) sections.push_back(routerStub(model, r));
    sections.push_back(dispatch(model));
    if (model.withTests) sections.push_back(tests(model));
    return sections;
}

std::vector<OutputFile> layoutRust(const SourceArtifact& artifact, const std::string& baseName) {
    std::ostringstream cargo;
    cargo << "[package]\n";
    cargo << "name = " << quote(baseName) << "\n";
    cargo << "version = \"0.1.0\"\n";
    cargo << "edition = \"2021\"\n\n";
    cargo << "[dependencies]\n";
    for (const auto& dep : artifact.dependencies) {
        if (dep == "serde") cargo << "serde = { version = \"1\", features = [\"derive\"] }\n";
        else cargo << dep << " = \"1\"\n";
    }
    return {{"src/lib.rs", artifact.render()}, {"Cargo.toml", cargo.str()}};
}

} // namespace FlowGen
