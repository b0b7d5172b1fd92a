// CodeEmitter.cpp
//
// Builds the emit model (symbols, checked defaults, branch targets) and hands
// it to the selected backend.
#include "CodeEmitter.hpp"
#include "EmitModel.hpp"
#include "IdentifierSanitizer.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <sstream>

namespace FlowGen {

const char* toString(TargetLanguage target) {
    switch (target) {
    case TargetLanguage::Rust: return "rust";
    case TargetLanguage::Cpp: return "cpp";
    }
    return "rust";
}

std::optional<TargetLanguage> parseTargetLanguage(const std::string& text) {
    std::string t;
    for (char c : text) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (t == "rust" || t == "rs") return TargetLanguage::Rust;
    if (t == "cpp" || t == "c++" || t == "cxx") return TargetLanguage::Cpp;
    return std::nullopt;
}

const ArtifactSection* SourceArtifact::section(const std::string& name) const {
    for (const auto& s : sections) if (s.name == name) return &s;
    return nullptr;
}

std::string SourceArtifact::render() const {
    std::string out;
    auto append = [&](const std::string& block) {
        if (block.empty()) return;
        if (!out.empty()) out += "\n";
        out += block;
    };
    for (const auto& s : sections) {
        append(s.declaration);
        append(s.body);
    }
    return out;
}

const EmitNode& EmitModel::entry() const {
    const NodeId& id = dispatch.front().nodeId;
    for (const auto& n : nodes) if (n.id == id) return n;
    return nodes.front();
}

std::string indentLines(const std::string& text, const std::string& prefix) {
    std::string out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out += prefix;
        out += line;
        out += "\n";
    }
    return out;
}

std::string floatLiteral(double value) {
    std::string s = fmt::format("{}", value);
    if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
    return s;
}

std::string commentText(const std::string& text) {
    std::string out;
    bool space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = !out.empty();
            continue;
        }
        if (space) out.push_back(' ');
        space = false;
        out.push_back(c);
    }
    while (!out.empty() && (out.back() == '\\' || out.back() == ' ')) out.pop_back();
    return out;
}

namespace {

// Names the generated code defines or uses as locals in function scope.
const char* const kEmitterNames[] = {
    "FlowError", "FlowErrorKind", "FlowResult", "Node", "run_graph", "state", "current", "next",
    "node", "label", "other", "result", "err", "branch", "probe", "fmt", "Serialize", "Deserialize",
    "state_defaults", "entry_node_accepts_state",
};

std::string nodeSummary(const NodeSpec& node) {
    std::string summary = node.id;
    if (!node.displayName.empty() && node.displayName != node.id) summary += " (" + node.displayName + ")";
    if (node.doc && !commentText(*node.doc).empty()) summary += ": " + *node.doc;
    return commentText(summary);
}

std::string undeclaredLabel(const std::vector<EmitBranch>& branches) {
    std::string label = "__undeclared__";
    auto taken = [&](const std::string& l) {
        return std::any_of(branches.begin(), branches.end(), [&](const EmitBranch& b) { return b.label == l; });
    };
    while (taken(label)) label += "_";
    return label;
}

bool containsDynamic(const StaticType& type) {
    if (type.kind == StaticKind::Dynamic) return true;
    return std::any_of(type.args.begin(), type.args.end(), containsDynamic);
}

EmitModel buildModel(const GraphInfo& graph, const ResolvedGraph& resolved, const FieldTypeMap& types,
                     const EmitOptions& options) {
    EmitModel model;
    model.graphName = options.graphName.empty() ? graph.name : options.graphName;
    std::unordered_set<std::string> moduleScope;
    model.moduleName = sanitize(model.graphName.empty() ? std::string("graph") : model.graphName, moduleScope);
    model.withTests = options.withTests;

    SymbolTable functions;
    for (const char* name : kEmitterNames) functions.reserve(name);
    // The C++ test scaffold pulls the namespace in with a using-directive
    functions.reserve(model.moduleName);
    model.stateType = functions.assign("type:state",
                                       options.stateTypeName.empty() ? std::string("GraphState") : options.stateTypeName);

    SymbolTable members;
    for (const auto& field : graph.stateSchema.fields) {
        EmitField f;
        f.name = field.name;
        f.symbol = members.assign(field.name);
        auto it = types.find(field.name);
        f.type = it != types.end() ? it->second : StaticType::dynamic();
        if (field.defaultValue && defaultFits(f.type, *field.defaultValue)) f.defaultValue = field.defaultValue;
        model.usesDynamic = model.usesDynamic || containsDynamic(f.type);
        model.fields.push_back(std::move(f));
    }

    for (const auto& node : graph.nodes) {
        EmitNode n;
        n.id = node.id;
        n.symbol = functions.assign("node:" + node.id, node.id);
        n.summary = nodeSummary(node);
        n.sourceLocation = node.sourceLocation;
        n.signature = node.signature;
        n.reachable = resolved.isReachable(node.id);
        model.nodes.push_back(std::move(n));
    }

    auto symbolOf = [&](const NodeId& id) -> std::optional<std::string> {
        if (isTerminal(id)) return std::nullopt;
        return functions.lookup("node:" + id);
    };

    for (const auto& entry : resolved.dispatch) {
        EmitDispatch d;
        d.nodeId = entry.nodeId;
        d.nodeSymbol = functions.lookup("node:" + entry.nodeId);
        if (entry.conditional) {
            const auto& cond = *entry.conditional;
            d.routerSymbol = functions.assign("router:" + cond.routerName, cond.routerName);
            d.branchSymbol = functions.assign("branch:" + entry.nodeId, "branch_" + d.nodeSymbol);
            for (const auto& b : cond.branches) d.branches.push_back({b.label, symbolOf(b.target), b.target, b.loopBack});
            d.undeclaredLabel = undeclaredLabel(d.branches);

            auto router = std::find_if(model.routers.begin(), model.routers.end(),
                                       [&](const EmitRouter& r) { return r.name == cond.routerName; });
            if (router == model.routers.end()) {
                model.routers.push_back({cond.routerName, d.routerSymbol, {}, {}});
                router = model.routers.end() - 1;
            }
            router->callers.push_back(entry.nodeId);
            for (const auto& b : cond.branches) {
                if (std::find(router->labels.begin(), router->labels.end(), b.label) == router->labels.end()) {
                    router->labels.push_back(b.label);
                }
            }
        } else {
            d.next = entry.unconditionalNext.value_or(NodeId(kTerminal));
            d.nextSymbol = symbolOf(d.next);
            d.implicitTerminal = entry.implicitTerminal;
            d.loopBack = entry.loopBack;
        }
        model.dispatch.push_back(std::move(d));
    }
    return model;
}

} // namespace

SourceArtifact emit(const GraphInfo& graph, const ResolvedGraph& resolved, const FieldTypeMap& types,
                    const EmitOptions& options) {
    const EmitModel model = buildModel(graph, resolved, types, options);

    SourceArtifact artifact;
    artifact.target = options.target;
    artifact.graphName = model.graphName;
    artifact.moduleName = model.moduleName;
    artifact.diagnostics = resolved.warnings;
    switch (options.target) {
    case TargetLanguage::Rust:
        artifact.sections = renderRust(model);
        artifact.dependencies = {"serde", "serde_json"};
        break;
    case TargetLanguage::Cpp:
        artifact.sections = renderCpp(model);
        if (model.usesDynamic) artifact.dependencies.push_back("nlohmann_json");
        if (model.withTests) artifact.dependencies.push_back("GTest");
        break;
    }
    return artifact;
}

std::vector<OutputFile> layoutFiles(const SourceArtifact& artifact, const std::string& baseName) {
    const std::string base = baseName.empty() ? artifact.moduleName : baseName;
    switch (artifact.target) {
    case TargetLanguage::Rust: return layoutRust(artifact, base);
    case TargetLanguage::Cpp: return layoutCpp(artifact, base);
    }
    return {};
}

} // namespace FlowGen
