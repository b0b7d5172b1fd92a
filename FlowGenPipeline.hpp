// FlowGen pipeline
//
// resolve -> mapSchema -> emit, driven by one GeneratorOptions value. The
// pipeline owns no state between calls; distinct graphs may be converted
// concurrently.
#pragma once
#include "CodeEmitter.hpp"
#include "FlowGenIR.hpp"
#include "TopologyResolver.hpp"
#include "TypeMapper.hpp"
#include <cstddef>
#include <string>

namespace FlowGen {

struct GeneratorOptions {
    TargetLanguage target = TargetLanguage::Rust;
    std::string stateTypeName = "GraphState";
    std::string graphName; // overrides GraphInfo::name when set
    bool withTests = true;
    size_t maxNodes = 10000;
    size_t maxEdges = 100000;
};

struct ConversionResult {
    ResolvedGraph resolved;
    FieldTypeMap types;
    SourceArtifact artifact; // artifact.diagnostics: topology then type mapping
};

// Throws GraphError before anything is emitted when the graph is rejected.
ConversionResult convert(const GraphInfo& graph, const GeneratorOptions& options = GeneratorOptions{});

} // namespace FlowGen
