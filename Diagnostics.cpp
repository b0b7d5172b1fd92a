// Diagnostics.cpp
//
// Naming and serialization of conversion diagnostics.
#include "Diagnostics.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace FlowGen {

const char* toString(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::OpaqueFallback: return "OpaqueFallback";
    case DiagnosticKind::DefaultValueIgnored: return "DefaultValueIgnored";
    case DiagnosticKind::UnreachableNode: return "UnreachableNode";
    case DiagnosticKind::DeadEdge: return "DeadEdge";
    }
    return "Unknown";
}

std::string qualifiedName(DiagnosticKind kind) {
    const bool typing = kind == DiagnosticKind::OpaqueFallback || kind == DiagnosticKind::DefaultValueIgnored;
    return fmt::format("{}::{}", typing ? "TypeMappingWarning" : "TopologyWarning", toString(kind));
}

std::string formatDiagnostic(const Diagnostic& d) {
    return fmt::format("{} [{}]: {}", qualifiedName(d.kind), d.subject, d.message);
}

nlohmann::json toJson(const Diagnostic& d) {
    return nlohmann::json{{"kind", qualifiedName(d.kind)}, {"subject", d.subject}, {"message", d.message}};
}

nlohmann::json toJson(const Diagnostics& ds) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& d : ds) out.push_back(toJson(d));
    return out;
}

size_t countKind(const Diagnostics& ds, DiagnosticKind kind) {
    return static_cast<size_t>(std::count_if(ds.begin(), ds.end(), [&](const Diagnostic& d) { return d.kind == kind; }));
}

} // namespace FlowGen
