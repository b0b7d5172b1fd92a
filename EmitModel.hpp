// Emit model
//
// Target-neutral view of everything the backends print: every name is
// already sanitized, every default already checked, every branch already
// resolved to a symbol. Backends only format; they make no decisions.
#pragma once
#include "CodeEmitter.hpp"
#include "TypeMapper.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace FlowGen {

struct EmitField {
    std::string name;   // key as declared in the schema
    std::string symbol; // member name in the generated struct
    StaticType type;
    std::optional<nlohmann::json> defaultValue; // only set when defaultFits()
};

struct EmitNode {
    NodeId id;
    std::string symbol;
    std::string summary; // one line: display name and doc
    std::optional<std::string> sourceLocation;
    std::optional<std::string> signature;
    bool reachable = true;
};

struct EmitBranch {
    std::string label;
    std::optional<std::string> targetSymbol; // nullopt: END
    NodeId target;
    bool loopBack = false;
};

struct EmitDispatch {
    NodeId nodeId;
    std::string nodeSymbol;
    // Unconditional transition (used when routerSymbol is empty)
    std::optional<std::string> nextSymbol; // nullopt: END
    NodeId next;
    bool implicitTerminal = false;
    bool loopBack = false;
    // Conditional transition
    std::string routerSymbol;
    std::string branchSymbol;
    std::vector<EmitBranch> branches;
    std::string undeclaredLabel; // label absent from `branches`, for tests

    bool isConditional() const { return !routerSymbol.empty(); }
};

struct EmitRouter {
    std::string name;
    std::string symbol;
    std::vector<NodeId> callers;
    std::vector<std::string> labels; // union over callers, first-seen order
};

struct EmitModel {
    std::string graphName;
    std::string moduleName;
    std::string stateType;
    bool withTests = true;
    bool usesDynamic = false;
    std::vector<EmitField> fields;
    std::vector<EmitNode> nodes; // declaration order
    std::vector<EmitRouter> routers;
    std::vector<EmitDispatch> dispatch; // breadth-first order, entry first

    const EmitNode& entry() const;
};

// Backends. Each returns the sections in artifact order.
std::vector<ArtifactSection> renderRust(const EmitModel& model);
std::vector<ArtifactSection> renderCpp(const EmitModel& model);
std::vector<OutputFile> layoutRust(const SourceArtifact& artifact, const std::string& baseName);
std::vector<OutputFile> layoutCpp(const SourceArtifact& artifact, const std::string& baseName);

// Shared formatting helpers
std::string indentLines(const std::string& text, const std::string& prefix);
// Float text with a guaranteed decimal point or exponent ("1" -> "1.0").
std::string floatLiteral(double value);
// Single-line comment text: whitespace runs collapsed, no trailing backslash.
std::string commentText(const std::string& text);

} // namespace FlowGen
