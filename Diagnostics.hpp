// Non-fatal conversion findings
//
// Warnings raised by the type mapper and topology resolver. They never stop
// the pipeline; they travel with the emitted artifact.
#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace FlowGen {

enum class DiagnosticKind {
    OpaqueFallback,      // type mapping degraded to the dynamic value type
    DefaultValueIgnored, // IR default could not be expressed for the mapped type
    UnreachableNode,     // node not reachable from the entry point
    DeadEdge             // edge shadowed by another outgoing edge
};

struct Diagnostic {
    DiagnosticKind kind;
    std::string subject; // field path, node id or "from->to"
    std::string message;
};

using Diagnostics = std::vector<Diagnostic>;

const char* toString(DiagnosticKind kind);
// "Category::Kind", e.g. "TopologyWarning::DeadEdge"
std::string qualifiedName(DiagnosticKind kind);
std::string formatDiagnostic(const Diagnostic& d);
nlohmann::json toJson(const Diagnostic& d);
nlohmann::json toJson(const Diagnostics& ds);
size_t countKind(const Diagnostics& ds, DiagnosticKind kind);

} // namespace FlowGen
