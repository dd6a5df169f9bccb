#include "cli/cli.hpp"
#include "index/triple_index.hpp"
#include "pipeline/study_converter.hpp"
#include "query/dataset_queries.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

using namespace dats;

namespace {

TripleIndex load_index(const Args& args) {
    std::string path = args.require("dats-file");
    if (!fs::exists(path)) {
        throw std::runtime_error("DATS file not found: " + path);
    }
    return TripleIndex::load_from_json(path);
}

std::optional<std::string> optional_arg(const Args& args, const std::string& name) {
    if (!args.has(name)) return std::nullopt;
    return args.get(name).value;
}

} // namespace

// ============== dats convert ==============
int cmd_convert(const Args& args) {
    std::string input_path = args.require("input");
    std::string output_path = args.require("output");

    // Config file (or the environment when none is given), then explicit flags
    ConversionConfig config = args.has("config")
        ? ConversionConfig::from_json_file(args.get("config").value)
        : ConversionConfig::from_environment();

    if (args.has("no-circular-links")) config.allow_back_links = false;
    if (args.has("max-output-samples")) config.max_output_samples = args.get("max-output-samples").as_int();
    if (args.has("quiet")) config.verbose = false;

    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    if (config.verbose) {
        std::cout << "Loading study records from: " << input_path << "\n";
    }
    StudyRecords records = StudyRecords::load_from_json(input_path);

    fs::path out_path(output_path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }

    StudyConverter converter(config);
    converter.convert_to_file(records, output_path);
    return 0;
}

// ============== dats variables ==============
int cmd_variables(const Args& args) {
    TripleIndex index = load_index(args);
    auto dataset_id = optional_arg(args, "dataset-id");

    ResultSet result = list_dataset_variables(index, dataset_id);
    std::string title = dataset_id ? "Variables in dataset " + *dataset_id : "Dataset variables";
    print_results(result, title);
    return 0;
}

// ============== dats datasets ==============
int cmd_datasets(const Args& args) {
    TripleIndex index = load_index(args);
    print_results(list_second_level_datasets(index), "Second-level datasets");
    return 0;
}

// ============== dats members ==============
int cmd_members(const Args& args) {
    TripleIndex index = load_index(args);
    std::string dataset_id = args.require("dataset-id");
    std::string group = args.require("study-group");

    ResultSet result = list_study_group_members(index, dataset_id, group);
    print_results(result, "Members of study group '" + group + "' in " + dataset_id);
    return 0;
}

// ============== dats samples ==============
int cmd_samples(const Args& args) {
    TripleIndex index = load_index(args);
    auto dataset_id = optional_arg(args, "dataset-id");

    ResultSet result = list_dataset_samples(index, dataset_id);
    std::string title = dataset_id ? "Samples in dataset " + *dataset_id : "Dataset samples";
    print_results(result, title);
    return 0;
}

// ============== dats check ==============
int cmd_check(const Args& args) {
    TripleIndex index = load_index(args);
    index.print_summary();

    bool acyclic = index.is_acyclic();
    std::cout << "Reference graph: " << (acyclic ? "acyclic" : "contains cycles") << "\n";
    std::cout << "\nDocument is well formed.\n";
    return 0;
}

int main(int argc, char** argv) {
    CLI cli("dats", "1.0.0");

    cli.register_command({
        "convert",
        "Convert parsed study records into a DATS JSON-LD document",
        {
            {"input", "i", "Study records JSON file", "", true, false},
            {"output", "o", "Output DATS JSON-LD file", "", true, false},
            {"config", "c", "Conversion config JSON file (optional)", "", false, false},
            {"no-circular-links", "n", "Do not link subjects back to their study groups", "", false, true},
            {"max-output-samples", "m", "Maximum number of sample Materials (0 = all)", "", false, false},
            {"quiet", "q", "Suppress progress output", "", false, true}
        },
        cmd_convert
    });

    cli.register_command({
        "variables",
        "List the variables of each dataset",
        {
            {"dats-file", "f", "DATS JSON-LD file", "", true, false},
            {"dataset-id", "d", "Restrict to one dataset accession", "", false, false}
        },
        cmd_variables
    });

    cli.register_command({
        "datasets",
        "List datasets that are part of another dataset",
        {
            {"dats-file", "f", "DATS JSON-LD file", "", true, false}
        },
        cmd_datasets
    });

    cli.register_command({
        "members",
        "List the subjects in a study group",
        {
            {"dats-file", "f", "DATS JSON-LD file", "", true, false},
            {"dataset-id", "d", "Dataset accession", "", true, false},
            {"study-group", "g", "Study group name", "", true, false}
        },
        cmd_members
    });

    cli.register_command({
        "samples",
        "List samples and the subjects they derive from",
        {
            {"dats-file", "f", "DATS JSON-LD file", "", true, false},
            {"dataset-id", "d", "Restrict to one dataset accession", "", false, false}
        },
        cmd_samples
    });

    cli.register_command({
        "check",
        "Validate a DATS JSON-LD document and print its statistics",
        {
            {"dats-file", "f", "DATS JSON-LD file", "", true, false}
        },
        cmd_check
    });

    return cli.run(argc, argv);
}
