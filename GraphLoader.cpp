// GraphLoader.cpp
//
// JSON <-> GraphInfo for the structured and introspector dialects.
#include "GraphLoader.hpp"
#include "FlowGenErrors.hpp"
#include "TypeAnnotation.hpp"
#include <fmt/core.h>
#include <fstream>

namespace FlowGen {

using ordered_json = nlohmann::ordered_json;

namespace {

const char* const kStart = "__start__";

[[noreturn]] void malformed(const std::string& path, const std::string& message) {
    throw GraphError(GraphErrorCode::MalformedInput, path, fmt::format("{}: {}", path, message));
}

const ordered_json* member(const ordered_json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

std::string requireString(const ordered_json& obj, const char* key, const std::string& path) {
    const ordered_json* v = member(obj, key);
    if (!v) malformed(path, fmt::format("missing \"{}\"", key));
    if (!v->is_string()) malformed(path + "." + key, "expected a string");
    return v->get<std::string>();
}

std::optional<std::string> optionalString(const ordered_json& obj, const char* key, const std::string& path) {
    const ordered_json* v = member(obj, key);
    if (!v) return std::nullopt;
    if (!v->is_string()) malformed(path + "." + key, "expected a string");
    return v->get<std::string>();
}

bool optionalBool(const ordered_json& obj, const char* key, const std::string& path) {
    const ordered_json* v = member(obj, key);
    if (!v) return false;
    if (!v->is_boolean()) malformed(path + "." + key, "expected a boolean");
    return v->get<bool>();
}

// Terminal aliases produced by different front-ends
NodeId normalizeTarget(const std::string& id) {
    if (id == "END" || id == kTerminal) return NodeId(kTerminal);
    return id;
}

PrimitiveKind parsePrimitive(const std::string& text, const std::string& path) {
    if (text == "string" || text == "str") return PrimitiveKind::String;
    if (text == "integer" || text == "int") return PrimitiveKind::Integer;
    if (text == "float") return PrimitiveKind::Float;
    if (text == "bool" || text == "boolean") return PrimitiveKind::Bool;
    malformed(path, fmt::format("unknown primitive '{}'", text));
}

NodeSpec parseNode(const ordered_json& doc, const std::string& path) {
    if (!doc.is_object()) malformed(path, "expected an object");
    NodeSpec node;
    if (member(doc, "id")) {
        node.id = requireString(doc, "id", path);
        node.displayName = optionalString(doc, "display_name", path).value_or(node.id);
        node.doc = optionalString(doc, "doc", path);
        node.sourceLocation = optionalString(doc, "source_location", path);
        node.signature = optionalString(doc, "signature", path);
    } else {
        node.id = requireString(doc, "name", path);
        node.displayName = optionalString(doc, "func_name", path).value_or(node.id);
        node.doc = optionalString(doc, "docstring", path);
        node.sourceLocation = optionalString(doc, "source_hint", path);
        node.signature = optionalString(doc, "signature", path);
    }
    if (node.doc && node.doc->empty()) node.doc.reset();
    if (node.sourceLocation && node.sourceLocation->empty()) node.sourceLocation.reset();
    if (node.signature && node.signature->empty()) node.signature.reset();
    return node;
}

FieldSpec parseField(const ordered_json& doc, const std::string& path) {
    if (!doc.is_object()) malformed(path, "expected an object");
    FieldSpec field;
    field.name = requireString(doc, "name", path);
    if (const ordered_json* t = member(doc, "dynamic_type")) {
        field.dynamicType = parseDynamicType(*t, path + ".dynamic_type");
        field.optional = optionalBool(doc, "optional", path);
        if (const ordered_json* d = member(doc, "default")) field.defaultValue = nlohmann::json(*d);
    } else if (member(doc, "type_name")) {
        field.dynamicType = parseTypeAnnotation(requireString(doc, "type_name", path));
        field.optional = optionalBool(doc, "is_optional", path);
        if (const ordered_json* d = member(doc, "default_value")) field.defaultValue = nlohmann::json(*d);
    } else {
        malformed(path, "missing \"dynamic_type\" or \"type_name\"");
    }
    // An explicit null default on a non-optional field carries no information
    if (field.defaultValue && field.defaultValue->is_null() && !field.optional) field.defaultValue.reset();
    return field;
}

ConditionalEdgeSpec parseBranches(const NodeId& from, const std::string& router, const ordered_json& branches,
                                  const std::string& path) {
    if (!branches.is_object()) malformed(path, "expected an object of label -> target");
    ConditionalEdgeSpec ce{from, router, {}};
    for (auto it = branches.begin(); it != branches.end(); ++it) {
        if (!it.value().is_string()) malformed(path + "." + it.key(), "expected a node id");
        ce.mapping.emplace_back(it.key(), normalizeTarget(it.value().get<std::string>()));
    }
    return ce;
}

void parseConditionalEdges(const ordered_json& doc, GraphInfo& graph) {
    if (doc.is_array()) {
        for (size_t i = 0; i < doc.size(); ++i) {
            const std::string path = fmt::format("conditional_edges[{}]", i);
            const ordered_json& ce = doc[i];
            if (!ce.is_object()) malformed(path, "expected an object");
            const ordered_json* mapping = member(ce, "mapping");
            if (!mapping) malformed(path, "missing \"mapping\"");
            graph.conditionalEdges.push_back(parseBranches(requireString(ce, "from", path),
                                                           requireString(ce, "router_name", path), *mapping,
                                                           path + ".mapping"));
        }
    } else if (doc.is_object()) {
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            const std::string path = "conditional_edges." + it.key();
            if (!it.value().is_object()) malformed(path, "expected an object");
            const ordered_json* branches = member(it.value(), "branches");
            if (!branches) malformed(path, "missing \"branches\"");
            graph.conditionalEdges.push_back(parseBranches(it.key(), requireString(it.value(), "condition_func", path),
                                                           *branches, path + ".branches"));
        }
    } else {
        malformed("conditional_edges", "expected an array or an object");
    }
}

// Edges carrying a branch label ("condition") in introspector dumps duplicate
// a conditional edge. Labels without a matching conditional entry are grouped
// per source node under a synthesized router name.
void parseEdges(const ordered_json& doc, GraphInfo& graph) {
    if (!doc.is_array()) malformed("edges", "expected an array");
    std::vector<ConditionalEdgeSpec> synthesized;
    for (size_t i = 0; i < doc.size(); ++i) {
        const std::string path = fmt::format("edges[{}]", i);
        const ordered_json& e = doc[i];
        if (!e.is_object()) malformed(path, "expected an object");
        EdgeSpec edge{requireString(e, "from", path), normalizeTarget(requireString(e, "to", path))};
        std::optional<std::string> condition = optionalString(e, "condition", path);
        if (!condition) {
            graph.edges.push_back(std::move(edge));
            continue;
        }
        bool declared = false;
        for (const auto& ce : graph.conditionalEdges) declared = declared || ce.from == edge.from;
        if (declared) continue;
        ConditionalEdgeSpec* group = nullptr;
        for (auto& ce : synthesized) if (ce.from == edge.from) group = &ce;
        if (!group) {
            synthesized.push_back({edge.from, "route_" + edge.from, {}});
            group = &synthesized.back();
        }
        group->mapping.emplace_back(*condition, edge.to);
    }
    for (auto& ce : synthesized) graph.conditionalEdges.push_back(std::move(ce));
}

// Folds a virtual "__start__" node into the entry point.
void normalizeStart(GraphInfo& graph) {
    std::vector<NodeId> starts;
    std::vector<EdgeSpec> kept;
    for (auto& e : graph.edges) {
        if (e.from == kStart) starts.push_back(e.to);
        else kept.push_back(std::move(e));
    }
    graph.edges = std::move(kept);
    if (graph.entryPoint.empty() || graph.entryPoint == kStart) {
        if (starts.size() > 1) {
            malformed("entry_point", fmt::format("{} edges leave {}; the entry point is ambiguous", starts.size(),
                                                 kStart));
        }
        // Without a start edge the entry stays unresolved and validation rejects it
        if (starts.size() == 1) graph.entryPoint = starts.front();
    }
    std::vector<NodeSpec> nodes;
    for (auto& n : graph.nodes) {
        if (n.id != kStart && !isTerminal(n.id) && n.id != "END") nodes.push_back(std::move(n));
    }
    graph.nodes = std::move(nodes);
}

ordered_json targetJson(const NodeId& id) { return ordered_json(id); }

} // namespace

DynamicType parseDynamicType(const ordered_json& doc, const std::string& path) {
    if (doc.is_string()) return parseTypeAnnotation(doc.get<std::string>());
    if (!doc.is_object()) malformed(path, "expected a type object or annotation string");
    const std::string kind = requireString(doc, "kind", path);
    auto child = [&](const char* key) {
        const ordered_json* v = member(doc, key);
        if (!v) malformed(path, fmt::format("{} type is missing \"{}\"", kind, key));
        return parseDynamicType(*v, path + "." + key);
    };
    if (kind == "primitive") return DynamicType::makePrimitive(parsePrimitive(requireString(doc, "primitive", path), path));
    if (kind == "collection") return DynamicType::makeCollection(child("element"));
    if (kind == "mapping") {
        DynamicType key = child("key");
        return DynamicType::makeMapping(std::move(key), child("value"));
    }
    if (kind == "optional") return DynamicType::makeOptional(child("inner"));
    if (kind == "opaque") return DynamicType::makeOpaque(optionalString(doc, "hint", path).value_or(std::string()));
    malformed(path, fmt::format("unknown type kind '{}'", kind));
}

GraphInfo loadGraph(const ordered_json& doc, const std::string& fallbackName) {
    if (!doc.is_object()) malformed("<document>", "expected a JSON object");
    GraphInfo graph;
    graph.name = optionalString(doc, "name", "<document>").value_or(fallbackName);

    const ordered_json* nodes = member(doc, "nodes");
    if (!nodes || !nodes->is_array()) malformed("nodes", "expected an array");
    for (size_t i = 0; i < nodes->size(); ++i) graph.nodes.push_back(parseNode((*nodes)[i], fmt::format("nodes[{}]", i)));

    if (const ordered_json* ce = member(doc, "conditional_edges")) parseConditionalEdges(*ce, graph);
    if (const ordered_json* edges = member(doc, "edges")) parseEdges(*edges, graph);

    if (const ordered_json* schema = member(doc, "state_schema")) {
        const ordered_json* fields = schema->is_object() ? member(*schema, "fields") : nullptr;
        if (!fields || !fields->is_array()) malformed("state_schema.fields", "expected an array");
        for (size_t i = 0; i < fields->size(); ++i) {
            graph.stateSchema.fields.push_back(parseField((*fields)[i], fmt::format("state_schema.fields[{}]", i)));
        }
    }

    graph.entryPoint = optionalString(doc, "entry_point", "<document>").value_or(std::string());
    normalizeStart(graph);
    return graph;
}

GraphInfo loadGraphFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) throw GraphError(GraphErrorCode::MalformedInput, path, "Could not open graph file: " + path);
    ordered_json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw GraphError(GraphErrorCode::MalformedInput, path, fmt::format("{}: {}", path, e.what()));
    }
    auto slash = path.find_last_of("/\\");
    std::string stem = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = stem.rfind('.');
    if (dot != std::string::npos && dot > 0) stem = stem.substr(0, dot);
    return loadGraph(doc, stem);
}

ordered_json toJson(const DynamicType& type) {
    ordered_json j;
    switch (type.kind) {
    case DynamicKind::Primitive:
        j["kind"] = "primitive";
        j["primitive"] = toString(type.primitive);
        break;
    case DynamicKind::Collection:
        j["kind"] = "collection";
        if (!type.args.empty()) j["element"] = toJson(type.args[0]);
        break;
    case DynamicKind::Mapping:
        j["kind"] = "mapping";
        if (type.args.size() == 2) {
            j["key"] = toJson(type.args[0]);
            j["value"] = toJson(type.args[1]);
        }
        break;
    case DynamicKind::Optional:
        j["kind"] = "optional";
        if (!type.args.empty()) j["inner"] = toJson(type.args[0]);
        break;
    case DynamicKind::Opaque:
        j["kind"] = "opaque";
        if (!type.hint.empty()) j["hint"] = type.hint;
        break;
    }
    return j;
}

ordered_json toJson(const GraphInfo& graph) {
    ordered_json j;
    j["name"] = graph.name;
    j["entry_point"] = graph.entryPoint;
    j["nodes"] = ordered_json::array();
    for (const auto& n : graph.nodes) {
        ordered_json node;
        node["id"] = n.id;
        node["display_name"] = n.displayName;
        if (n.doc) node["doc"] = *n.doc;
        if (n.sourceLocation) node["source_location"] = *n.sourceLocation;
        if (n.signature) node["signature"] = *n.signature;
        j["nodes"].push_back(std::move(node));
    }
    j["edges"] = ordered_json::array();
    for (const auto& e : graph.edges) j["edges"].push_back({{"from", e.from}, {"to", targetJson(e.to)}});
    j["conditional_edges"] = ordered_json::array();
    for (const auto& ce : graph.conditionalEdges) {
        ordered_json mapping = ordered_json::object();
        for (const auto& branch : ce.mapping) mapping[branch.first] = targetJson(branch.second);
        j["conditional_edges"].push_back({{"from", ce.from}, {"router_name", ce.routerName}, {"mapping", mapping}});
    }
    ordered_json fields = ordered_json::array();
    for (const auto& f : graph.stateSchema.fields) {
        ordered_json field;
        field["name"] = f.name;
        field["dynamic_type"] = toJson(f.dynamicType);
        field["optional"] = f.optional;
        if (f.defaultValue) field["default"] = ordered_json(*f.defaultValue);
        fields.push_back(std::move(field));
    }
    j["state_schema"] = {{"fields", fields}};
    return j;
}

ordered_json toJson(const ResolvedGraph& resolved) {
    ordered_json j;
    j["entry_point"] = resolved.entryPoint;
    j["reachable"] = resolved.reachable;
    j["unreachable"] = resolved.unreachable;
    j["dispatch"] = ordered_json::array();
    for (const auto& d : resolved.dispatch) {
        ordered_json entry;
        entry["node"] = d.nodeId;
        if (d.conditional) {
            entry["router"] = d.conditional->routerName;
            ordered_json branches = ordered_json::array();
            for (const auto& b : d.conditional->branches) {
                branches.push_back({{"label", b.label}, {"target", targetJson(b.target)}, {"loop_back", b.loopBack}});
            }
            entry["branches"] = std::move(branches);
        } else if (d.unconditionalNext) {
            entry["next"] = targetJson(*d.unconditionalNext);
            entry["loop_back"] = d.loopBack;
            if (d.implicitTerminal) entry["implicit_terminal"] = true;
        }
        j["dispatch"].push_back(std::move(entry));
    }
    j["loop_back_edges"] = ordered_json::array();
    for (const auto& l : resolved.loopBackEdges) {
        ordered_json edge{{"from", l.from}, {"to", l.to}};
        if (l.label) edge["label"] = *l.label;
        j["loop_back_edges"].push_back(std::move(edge));
    }
    return j;
}

} // namespace FlowGen
