// Code emitter
//
// Renders a resolved graph into a target-language source artifact: the state
// type, one stub per node, one stub per router, the dispatch loop and a test
// scaffold. Emission never fails for a graph that resolve() accepted.
#pragma once
#include "Diagnostics.hpp"
#include "FlowGenIR.hpp"
#include "TopologyResolver.hpp"
#include "TypeMapper.hpp"
#include <optional>
#include <string>
#include <vector>

namespace FlowGen {

enum class TargetLanguage { Rust, Cpp };

const char* toString(TargetLanguage target);
// Accepts "rust" / "rs" and "cpp" / "c++"; nullopt otherwise.
std::optional<TargetLanguage> parseTargetLanguage(const std::string& text);

// One named block of generated text. `declaration` is only used by targets
// that split interface from implementation (the C++ header).
struct ArtifactSection {
    std::string name; // "prelude", "state_type", "node:<id>", "router:<name>", "dispatch", "tests"
    std::string declaration;
    std::string body;
};

struct SourceArtifact {
    TargetLanguage target = TargetLanguage::Rust;
    std::string graphName;
    std::string moduleName; // sanitized graph name; crate / namespace / file stem
    std::vector<ArtifactSection> sections;
    // Third-party packages the generated code needs (crates, CMake packages)
    std::vector<std::string> dependencies;
    Diagnostics diagnostics;

    const ArtifactSection* section(const std::string& name) const;
    // Declarations then bodies of every section, in section order.
    std::string render() const;
};

struct OutputFile {
    std::string path; // relative to the output directory
    std::string contents;
};

struct EmitOptions {
    TargetLanguage target = TargetLanguage::Rust;
    std::string stateTypeName = "GraphState";
    std::string graphName; // empty: use GraphInfo::name
    bool withTests = true;
};

// `types` must hold an entry for every state field (see mapSchema).
// `resolved.warnings` are copied into the artifact's diagnostics.
SourceArtifact emit(const GraphInfo& graph, const ResolvedGraph& resolved, const FieldTypeMap& types,
                    const EmitOptions& options = EmitOptions{});

// Maps an artifact onto files. Rust: src/lib.rs, Cargo.toml. C++:
// <base>_graph.hpp, <base>_graph.cpp, <base>_graph_test.cpp, CMakeLists.txt.
// An empty `baseName` uses the artifact's moduleName.
std::vector<OutputFile> layoutFiles(const SourceArtifact& artifact, const std::string& baseName = std::string());

} // namespace FlowGen
