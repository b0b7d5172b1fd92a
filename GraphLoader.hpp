// Graph loader
//
// Builds GraphInfo values from serialized graph descriptions and writes them
// back out. Two producer dialects are read: the structured FlowGen form and
// the introspector dump (nodes by name, conditional edges keyed by source
// node, fields typed by annotation text). Output is always the structured form.
#pragma once
#include "FlowGenIR.hpp"
#include "TopologyResolver.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace FlowGen {

// Throws GraphError(MalformedInput) when the document does not describe a
// graph. `fallbackName` names graphs whose document carries no "name".
// The result is not validated; resolve() does that.
GraphInfo loadGraph(const nlohmann::ordered_json& doc, const std::string& fallbackName = "graph");

// Reads and parses `path`; the file stem is the fallback graph name.
GraphInfo loadGraphFile(const std::string& path);

DynamicType parseDynamicType(const nlohmann::ordered_json& doc, const std::string& path = "dynamic_type");

nlohmann::ordered_json toJson(const DynamicType& type);
nlohmann::ordered_json toJson(const GraphInfo& graph);
nlohmann::ordered_json toJson(const ResolvedGraph& resolved);

} // namespace FlowGen
