#include "container/Container.hpp"
#include "merge/MergeOptions.hpp"
#include "serialization/ContainerCodec.hpp"
#include "tools/cli/ToolCli.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace {

struct MergeCliOptions {
    std::filesystem::path                existingPath;
    std::filesystem::path                incomingPath;
    std::optional<RT::ValueMergePolicy>  policy;
    int                                  indent = 2;
    std::optional<std::filesystem::path> outputPath;
    bool                                 report = false;
};

void print_usage() {
    std::cout << "Usage: replicatrie_merge <existing.json> <incoming.json> [options]\n"
                 "Options:\n"
                 "  --policy <name>    Value/value policy: incoming, existing or ordered\n"
                 "                     (default from REPLICATRIE_VALUE_MERGE_POLICY, else incoming)\n"
                 "  --indent <n>       JSON indent (default 2, -1 for compact)\n"
                 "  --output <file>    Write the merged container to file instead of stdout\n"
                 "  --report           List merge conflicts on stderr\n"
                 "  --help             Show this message\n";
}

auto parse_cli(int argc, char** argv) -> std::optional<MergeCliOptions> {
    using RT::Tools::CLI::ToolCli;
    MergeCliOptions options;

    ToolCli cli;
    cli.set_program_name("replicatrie_merge");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });

    ToolCli::ValueOption policyOption{};
    policyOption.on_value = [&](std::string_view value) -> ToolCli::ParseError {
        auto policy = RT::parseValueMergePolicy(value);
        if (!policy) {
            return "--policy: " + RT::describeError(policy.error());
        }
        options.policy = *policy;
        return std::nullopt;
    };
    cli.add_value("--policy", std::move(policyOption));

    cli.add_int("--indent", [&](int value) { options.indent = value; });

    ToolCli::ValueOption outputOption{};
    outputOption.on_value = [&](std::string_view value) -> ToolCli::ParseError {
        if (value.empty()) {
            return std::string{"--output requires a file"};
        }
        options.outputPath = std::filesystem::path(std::string{value});
        return std::nullopt;
    };
    cli.add_value("--output", std::move(outputOption));

    cli.add_flag("--report", {.on_set = [&] { options.report = true; }});

    auto helpHandler = [] {
        print_usage();
        std::exit(0);
    };
    cli.add_flag("--help", {.on_set = helpHandler});
    cli.add_flag("-h", {.on_set = helpHandler});

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    auto const& positionals = cli.positionals();
    if (positionals.size() != 2) {
        std::cerr << "replicatrie_merge: expected two input files, got " << positionals.size() << "\n";
        return std::nullopt;
    }
    options.existingPath = positionals[0];
    options.incomingPath = positionals[1];
    return options;
}

auto load_container(std::filesystem::path const& path) -> std::optional<RT::Container> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open input file '" << path.string() << "'" << std::endl;
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    auto container = RT::Serialization::deserializeContainer(buffer.str());
    if (!container) {
        std::cerr << "Failed to decode '" << path.string() << "': " << RT::describeError(container.error())
                  << std::endl;
        return std::nullopt;
    }
    return std::move(*container);
}

auto write_output(std::string const& jsonString, std::optional<std::filesystem::path> const& output)
    -> bool {
    if (!output) {
        std::cout << jsonString << std::endl;
        return true;
    }
    std::ofstream stream(*output, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open output file '" << output->string() << "'" << std::endl;
        return false;
    }
    stream << jsonString;
    if (!stream.good()) {
        std::cerr << "Failed to write JSON output" << std::endl;
        return false;
    }
    return true;
}

void print_report(RT::MergeReport const& report) {
    std::cerr << report.conflicts.size() << " conflict(s), " << report.schemaEvolutionEvents
              << " schema evolution event(s)\n";
    for (auto const& conflict : report.conflicts) {
        std::cerr << "  " << RT::Trie::pathToString(conflict.path) << " "
                  << RT::conflictKindToString(conflict.kind) << " -> "
                  << RT::conflictResolutionToString(conflict.resolution) << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    auto cliOptions = parse_cli(argc, argv);
    if (!cliOptions) {
        print_usage();
        return EXIT_FAILURE;
    }

    auto existing = load_container(cliOptions->existingPath);
    if (!existing) {
        return EXIT_FAILURE;
    }
    auto incoming = load_container(cliOptions->incomingPath);
    if (!incoming) {
        return EXIT_FAILURE;
    }

    auto mergeOptions = RT::mergeOptionsFromEnvironment();
    if (cliOptions->policy) {
        mergeOptions.valuePolicy = *cliOptions->policy;
    }

    RT::MergeReport report;
    auto merged = RT::mergeContainers(*existing, *incoming, mergeOptions, &report);
    if (cliOptions->report) {
        print_report(report);
    }

    auto jsonString = RT::Serialization::serializeContainer(merged, cliOptions->indent);
    if (!jsonString) {
        std::cerr << "Export failed: " << RT::describeError(jsonString.error()) << std::endl;
        return EXIT_FAILURE;
    }

    if (!write_output(*jsonString, cliOptions->outputPath)) {
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
