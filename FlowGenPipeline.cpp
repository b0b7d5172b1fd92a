// FlowGenPipeline.cpp
//
// Chains the core components and traces each stage at debug level.
#include "FlowGenPipeline.hpp"
#include "Log.hpp"

namespace FlowGen {

ConversionResult convert(const GraphInfo& graph, const GeneratorOptions& options) {
    Log::debug("convert graph='{}' target={} nodes={} edges={} conditional={} fields={}", graph.name,
               toString(options.target), graph.nodes.size(), graph.edges.size(), graph.conditionalEdges.size(),
               graph.stateSchema.fields.size());

    ConversionResult result;
    result.resolved = resolve(graph, ResolveLimits{options.maxNodes, options.maxEdges});
    Log::debug("resolved entry='{}' reachable={} unreachable={} loop-backs={}", result.resolved.entryPoint,
               result.resolved.reachable.size(), result.resolved.unreachable.size(),
               result.resolved.loopBackEdges.size());

    Diagnostics typeWarnings;
    result.types = mapSchema(graph.stateSchema, typeWarnings);
    for (const auto& field : graph.stateSchema.fields) {
        Log::debug("field '{}' -> {}", field.name, describe(result.types.at(field.name)));
    }

    EmitOptions emitOptions;
    emitOptions.target = options.target;
    emitOptions.stateTypeName = options.stateTypeName;
    emitOptions.graphName = options.graphName;
    emitOptions.withTests = options.withTests;
    result.artifact = emit(graph, result.resolved, result.types, emitOptions);
    result.artifact.diagnostics.insert(result.artifact.diagnostics.end(), typeWarnings.begin(), typeWarnings.end());

    Log::debug("emitted {} sections, {} diagnostics", result.artifact.sections.size(),
               result.artifact.diagnostics.size());
    for (const auto& d : result.artifact.diagnostics) Log::debug("{}", formatDiagnostic(d));
    return result;
}

} // namespace FlowGen
