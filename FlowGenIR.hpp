// FlowGen intermediate representation
//
// This header defines the language-neutral description of a workflow graph
// (nodes, unconditional and conditional edges, state schema) that every later
// stage consumes. Values are built once by a producer (see GraphLoader) and
// only read afterwards; nothing downstream mutates a GraphInfo.
#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace FlowGen {

using NodeId = std::string;

// Reserved target id marking the end of execution.
inline constexpr const char* kTerminal = "__end__";

inline bool isTerminal(const std::string& id) { return id == kTerminal; }

enum class PrimitiveKind { String, Integer, Float, Bool };

enum class DynamicKind { Primitive, Collection, Mapping, Optional, Opaque };

// Runtime-observed type of a state field. Children live in `args`:
// Collection -> [element], Mapping -> [key, value], Optional -> [inner].
struct DynamicType {
    DynamicKind kind = DynamicKind::Opaque;
    PrimitiveKind primitive = PrimitiveKind::String;
    std::vector<DynamicType> args;
    std::string hint; // source annotation text, informational only

    static DynamicType makePrimitive(PrimitiveKind p);
    static DynamicType makeCollection(DynamicType element);
    static DynamicType makeMapping(DynamicType key, DynamicType value);
    static DynamicType makeOptional(DynamicType inner);
    static DynamicType makeOpaque(std::string hint = std::string());

    bool operator==(const DynamicType& other) const;
    bool operator!=(const DynamicType& other) const { return !(*this == other); }
};

struct NodeSpec {
    NodeId id;
    std::string displayName;
    std::optional<std::string> doc;
    std::optional<std::string> sourceLocation;
    std::optional<std::string> signature; // source-language signature, traceability only
};

struct EdgeSpec {
    NodeId from;
    NodeId to; // node id or kTerminal
};

struct ConditionalEdgeSpec {
    NodeId from;
    std::string routerName;
    // label -> node id or kTerminal, in declaration order
    std::vector<std::pair<std::string, NodeId>> mapping;
};

struct FieldSpec {
    std::string name;
    DynamicType dynamicType;
    bool optional = false;
    std::optional<nlohmann::json> defaultValue;
};

struct StateSchema {
    std::vector<FieldSpec> fields;
};

struct GraphInfo {
    std::string name;
    std::vector<NodeSpec> nodes;
    std::vector<EdgeSpec> edges;
    std::vector<ConditionalEdgeSpec> conditionalEdges;
    StateSchema stateSchema;
    NodeId entryPoint;
};

// Checks the structural invariants a producer must uphold (unique node ids
// and field names, non-empty branch tables, declared entry point, edge
// endpoints declared or terminal). Throws GraphError on the first violation.
void validateGraph(const GraphInfo& graph);

std::string toString(PrimitiveKind kind);
// Compact readable form, e.g. "Mapping(string, Optional(float))".
std::string describe(const DynamicType& type);

} // namespace FlowGen
