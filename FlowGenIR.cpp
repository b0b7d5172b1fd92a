// FlowGenIR.cpp
//
// IR constructors, structural validation and readable descriptions.
#include "FlowGenIR.hpp"
#include "FlowGenErrors.hpp"
#include <fmt/core.h>
#include <unordered_set>

namespace FlowGen {

DynamicType DynamicType::makePrimitive(PrimitiveKind p) {
    DynamicType t;
    t.kind = DynamicKind::Primitive;
    t.primitive = p;
    return t;
}

DynamicType DynamicType::makeCollection(DynamicType element) {
    DynamicType t;
    t.kind = DynamicKind::Collection;
    t.args.push_back(std::move(element));
    return t;
}

DynamicType DynamicType::makeMapping(DynamicType key, DynamicType value) {
    DynamicType t;
    t.kind = DynamicKind::Mapping;
    t.args.push_back(std::move(key));
    t.args.push_back(std::move(value));
    return t;
}

DynamicType DynamicType::makeOptional(DynamicType inner) {
    DynamicType t;
    t.kind = DynamicKind::Optional;
    t.args.push_back(std::move(inner));
    return t;
}

DynamicType DynamicType::makeOpaque(std::string hint) {
    DynamicType t;
    t.kind = DynamicKind::Opaque;
    t.hint = std::move(hint);
    return t;
}

// Structural equality; `hint` is informational and ignored.
bool DynamicType::operator==(const DynamicType& other) const {
    if (kind != other.kind) return false;
    if (kind == DynamicKind::Primitive && primitive != other.primitive) return false;
    return args == other.args;
}

const char* toString(GraphErrorCode code) {
    switch (code) {
    case GraphErrorCode::UnreachableEntry: return "UnreachableEntry";
    case GraphErrorCode::DanglingEdge: return "DanglingEdge";
    case GraphErrorCode::DuplicateNode: return "DuplicateNode";
    case GraphErrorCode::DuplicateField: return "DuplicateField";
    case GraphErrorCode::EmptyBranchTable: return "EmptyBranchTable";
    case GraphErrorCode::GraphTooLarge: return "GraphTooLarge";
    case GraphErrorCode::MalformedInput: return "MalformedInput";
    }
    return "Unknown";
}

void validateGraph(const GraphInfo& graph) {
    std::unordered_set<std::string> ids;
    for (const auto& n : graph.nodes) {
        if (n.id.empty() || isTerminal(n.id)) {
            throw GraphError(GraphErrorCode::MalformedInput, n.id, fmt::format("Invalid node id '{}'", n.id));
        }
        if (!ids.insert(n.id).second) {
            throw GraphError(GraphErrorCode::DuplicateNode, n.id, fmt::format("Duplicate node id '{}'", n.id));
        }
    }

    std::unordered_set<std::string> fieldNames;
    for (const auto& f : graph.stateSchema.fields) {
        if (!fieldNames.insert(f.name).second) {
            throw GraphError(GraphErrorCode::DuplicateField, f.name, fmt::format("Duplicate state field '{}'", f.name));
        }
    }

    if (graph.entryPoint.empty() || !ids.count(graph.entryPoint)) {
        throw GraphError(GraphErrorCode::UnreachableEntry, graph.entryPoint,
                         fmt::format("Entry point '{}' is not a declared node", graph.entryPoint));
    }

    auto checkEdge = [&](const NodeId& from, const NodeId& to) {
        const std::string edgeId = from + "->" + to;
        if (!ids.count(from)) {
            throw GraphError(GraphErrorCode::DanglingEdge, edgeId,
                             fmt::format("Edge '{}' starts at undeclared node '{}'", edgeId, from));
        }
        if (!isTerminal(to) && !ids.count(to)) {
            throw GraphError(GraphErrorCode::DanglingEdge, edgeId,
                             fmt::format("Edge '{}' targets undeclared node '{}'", edgeId, to));
        }
    };

    for (const auto& e : graph.edges) checkEdge(e.from, e.to);

    for (const auto& ce : graph.conditionalEdges) {
        if (ce.mapping.empty()) {
            throw GraphError(GraphErrorCode::EmptyBranchTable, ce.from,
                             fmt::format("Conditional edge from '{}' (router '{}') has no branches", ce.from, ce.routerName));
        }
        std::unordered_set<std::string> labels;
        for (const auto& branch : ce.mapping) {
            if (!labels.insert(branch.first).second) {
                throw GraphError(GraphErrorCode::MalformedInput, ce.from,
                                 fmt::format("Conditional edge from '{}' repeats label '{}'", ce.from, branch.first));
            }
            checkEdge(ce.from, branch.second);
        }
    }
}

std::string toString(PrimitiveKind kind) {
    switch (kind) {
    case PrimitiveKind::String: return "string";
    case PrimitiveKind::Integer: return "integer";
    case PrimitiveKind::Float: return "float";
    case PrimitiveKind::Bool: return "bool";
    }
    return "string";
}

std::string describe(const DynamicType& type) {
    auto arg = [&](size_t i) { return i < type.args.size() ? describe(type.args[i]) : std::string("?"); };
    switch (type.kind) {
    case DynamicKind::Primitive: return toString(type.primitive);
    case DynamicKind::Collection: return fmt::format("Collection({})", arg(0));
    case DynamicKind::Mapping: return fmt::format("Mapping({}, {})", arg(0), arg(1));
    case DynamicKind::Optional: return fmt::format("Optional({})", arg(0));
    case DynamicKind::Opaque: return type.hint.empty() ? "Opaque" : fmt::format("Opaque({})", type.hint);
    }
    return "Opaque";
}

} // namespace FlowGen
