// main.cpp
//
// flowgen command line. Parses CLI (CLI11), loads a graph description and
// runs one of:
// - convert:   generate Rust or C++ sources plus diagnostics.json
// - inspect:   print the normalized IR, dispatch table and diagnostics
// - visualize: render the graph as Mermaid or Graphviz
#include "FlowGenErrors.hpp"
#include "FlowGenPipeline.hpp"
#include "GraphLoader.hpp"
#include "GraphVisualizer.hpp"
#include "Log.hpp"
#include <CLI/CLI.hpp>
#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {

void writeFile(const fs::path& path, const std::string& contents) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error("Could not write " + path.string());
    out << contents;
    if (!out) throw std::runtime_error("Could not write " + path.string());
    FlowGen::Log::debug("wrote {} ({} bytes)", path.string(), contents.size());
}

void emitText(const std::string& text, const std::string& outputPath) {
    if (outputPath.empty() || outputPath == "-") {
        std::cout << text;
        if (!text.empty() && text.back() != '\n') std::cout << '\n';
    } else {
        writeFile(outputPath, text);
        FlowGen::Log::info("Wrote {}", outputPath);
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace FlowGen;

    FlowGen::GeneratorOptions options;
    int verbosity = 0;
    std::string graphPath;
    std::string outDir = ".";
    std::string targetName = "rust";
    bool noTests = false;
    std::string format = "mermaid";
    std::string outputPath;

    CLI::App app{"flowgen: generate statically typed Rust or C++ from workflow graph descriptions"};
    app.set_version_flag("--version", FLOWGEN_VERSION);
    app.add_flag("-v,--verbose", verbosity, "Increase log verbosity (-v info, -vv debug)");
    app.set_config("--config", "", "Read options from an INI or TOML file");
    app.require_subcommand(1);

    auto* convertCmd = app.add_subcommand("convert", "Generate source files from a graph description");
    convertCmd->add_option("graph", graphPath, "Graph JSON file")->required()->check(CLI::ExistingFile);
    convertCmd->add_option("--out-dir", outDir, "Directory to write generated files");
    convertCmd->add_option("--target", targetName, "Target language: rust|cpp");
    convertCmd->add_option("--name", options.graphName, "Graph name (crate / namespace / file stem)");
    convertCmd->add_option("--state-type", options.stateTypeName, "Name of the generated state type");
    convertCmd->add_flag("--no-tests", noTests, "Do not generate the test scaffold");
    convertCmd->add_option("--max-nodes", options.maxNodes, "Reject graphs with more nodes");
    convertCmd->add_option("--max-edges", options.maxEdges, "Reject graphs with more transitions");

    auto* inspectCmd = app.add_subcommand("inspect", "Print the normalized graph, dispatch table and diagnostics");
    inspectCmd->add_option("graph", graphPath, "Graph JSON file")->required()->check(CLI::ExistingFile);

    auto* visualizeCmd = app.add_subcommand("visualize", "Render the graph as a diagram");
    visualizeCmd->add_option("graph", graphPath, "Graph JSON file")->required()->check(CLI::ExistingFile);
    visualizeCmd->add_option("--format", format, "Diagram format: mermaid|dot");
    visualizeCmd->add_option("-o,--output", outputPath, "Output file (default: stdout)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    Log::setLevel(verbosity >= 2 ? Log::Level::Debug : verbosity == 1 ? Log::Level::Info : Log::Level::Warn);

    try {
        const GraphInfo graph = loadGraphFile(graphPath);
        Log::info("Loaded graph '{}' from {} ({} nodes)", graph.name, graphPath, graph.nodes.size());

        if (*convertCmd) {
            auto target = parseTargetLanguage(targetName);
            if (!target) {
                Log::error("unknown target '{}' (expected rust or cpp)", targetName);
                return 2;
            }
            options.target = *target;
            options.withTests = !noTests;

            const ConversionResult result = convert(graph, options);
            for (const auto& d : result.artifact.diagnostics) Log::warn("{}", formatDiagnostic(d));

            const auto files = layoutFiles(result.artifact);
            for (const auto& f : files) writeFile(fs::path(outDir) / f.path, f.contents);
            writeFile(fs::path(outDir) / "diagnostics.json", toJson(result.artifact.diagnostics).dump(2) + "\n");
            Log::info("Generated {} files for '{}' ({}) in {}", files.size() + 1, result.artifact.graphName,
                      toString(options.target), outDir);
            fmt::print("{}: {} nodes, {} diagnostics -> {}\n", result.artifact.graphName, graph.nodes.size(),
                       result.artifact.diagnostics.size(), outDir);
        } else if (*inspectCmd) {
            const ConversionResult result = convert(graph, options);
            nlohmann::ordered_json report;
            report["graph"] = toJson(graph);
            report["resolved"] = toJson(result.resolved);
            nlohmann::ordered_json types = nlohmann::ordered_json::object();
            for (const auto& f : graph.stateSchema.fields) types[f.name] = describe(result.types.at(f.name));
            report["types"] = types;
            report["diagnostics"] = nlohmann::ordered_json(toJson(result.artifact.diagnostics));
            std::cout << report.dump(2) << "\n";
        } else if (*visualizeCmd) {
            auto visualFormat = parseVisualFormat(format);
            if (!visualFormat) {
                Log::error("unknown format '{}' (expected mermaid or dot)", format);
                return 2;
            }
            // Structural errors leave nothing to draw; topology errors still do
            validateGraph(graph);
            std::optional<ResolvedGraph> resolved;
            try {
                resolved = resolve(graph);
            } catch (const GraphError& e) {
                Log::warn("{}: {}; drawing the declared graph only", toString(e.code()), e.what());
            }
            emitText(visualize(graph, *visualFormat, resolved ? &*resolved : nullptr), outputPath);
        }
    } catch (const GraphError& e) {
        Log::error("{}: {}", toString(e.code()), e.what());
        return 1;
    } catch (const std::exception& e) {
        Log::error("{}", e.what());
        return 2;
    }
    return 0;
}
