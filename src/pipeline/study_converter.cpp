#include "pipeline/study_converter.hpp"
#include "graph/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {

const char* const kMemberOfStudyGroup = "member of study group";

// Field value as text: strings verbatim, other scalars as JSON
std::optional<std::string> field_text(const dats::Record& record, const std::string& field) {
    const ordered_json* value = dats::find_field(record, field);
    if (!value || value->is_null()) return std::nullopt;
    if (value->is_string()) {
        std::string s = value->get<std::string>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    return value->dump();
}

std::string string_or_empty(const ordered_json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return "";
    return j[key].get<std::string>();
}

dats::DatasetRecord dataset_from_json(const ordered_json& j, const char* what) {
    if (!j.is_object() || !j.contains("identifier")) {
        throw std::runtime_error(std::string("study records: ") + what + " has no identifier");
    }
    dats::DatasetRecord d;
    d.identifier = j["identifier"].get<std::string>();
    d.title = string_or_empty(j, "title");
    return d;
}

dats::Record record_from_json(const ordered_json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("study records: subject/sample entries must be objects");
    }
    dats::Record record;
    for (auto it = j.begin(); it != j.end(); ++it) {
        record.emplace_back(it.key(), it.value());
    }
    return record;
}

bool env_flag(const char* value) {
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // namespace

namespace dats {

const ordered_json* find_field(const Record& record, const std::string& field) {
    for (const auto& [name, value] : record) {
        if (name == field) return &value;
    }
    return nullptr;
}

// ============================================================================
// ConversionConfig
// ============================================================================

ConversionConfig ConversionConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    ConversionConfig config;

    if (j.contains("allow_back_links")) config.allow_back_links = j["allow_back_links"];
    // Accept the inverse flag used by the command line
    if (j.contains("no_circular_links")) config.allow_back_links = !j["no_circular_links"].get<bool>();
    if (j.contains("verbose")) config.verbose = j["verbose"];
    if (j.contains("max_output_samples")) config.max_output_samples = j["max_output_samples"];
    if (j.contains("indent")) config.indent = j["indent"];
    if (j.contains("jsonld_context")) config.jsonld_context = j["jsonld_context"].get<std::string>();
    if (j.contains("identifier_source")) config.identifier_source = j["identifier_source"].get<std::string>();

    return config;
}

void ConversionConfig::to_json_file(const std::string& path) const {
    json j;

    j["allow_back_links"] = allow_back_links;
    j["verbose"] = verbose;
    j["max_output_samples"] = max_output_samples;
    j["indent"] = indent;
    j["jsonld_context"] = jsonld_context;
    j["identifier_source"] = identifier_source;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << j.dump(2);
}

ConversionConfig ConversionConfig::from_environment() {
    ConversionConfig config;

    const char* back_links = std::getenv("DATS_ALLOW_BACK_LINKS");
    if (back_links) config.allow_back_links = env_flag(back_links);

    const char* verbose = std::getenv("DATS_VERBOSE");
    if (verbose) config.verbose = env_flag(verbose);

    const char* max_samples = std::getenv("DATS_MAX_OUTPUT_SAMPLES");
    if (max_samples) {
        try {
            config.max_output_samples = std::stoi(max_samples);
        } catch (const std::logic_error&) {
            throw std::invalid_argument(std::string("DATS_MAX_OUTPUT_SAMPLES is not a number: ") + max_samples);
        }
    }

    return config;
}

bool ConversionConfig::validate(std::string& error_message) const {
    if (max_output_samples < 0) {
        error_message = "max_output_samples must not be negative";
        return false;
    }

    if (indent < -1) {
        error_message = "indent must be -1 (compact) or greater";
        return false;
    }

    if (identifier_source.empty()) {
        error_message = "identifier_source must not be empty";
        return false;
    }

    return true;
}

// ============================================================================
// StudyRecords
// ============================================================================

StudyRecords StudyRecords::from_json(const ordered_json& j) {
    StudyRecords records;

    if (!j.contains("dataset")) {
        throw std::runtime_error("study records: missing 'dataset'");
    }
    records.dataset = dataset_from_json(j["dataset"], "dataset");
    if (j.contains("collection")) {
        records.collection = dataset_from_json(j["collection"], "collection");
        if (j["collection"].contains("datasets")) {
            for (const auto& d : j["collection"]["datasets"]) {
                DatasetRecord part = dataset_from_json(d, "collection dataset");
                if (part.identifier == records.dataset.identifier) {
                    throw std::runtime_error("study records: collection dataset " + part.identifier +
                                             " repeats the converted dataset");
                }
                records.other_parts.push_back(part);
            }
        }
    }

    if (j.contains("study")) {
        records.study_name = string_or_empty(j["study"], "name");
    }
    if (records.study_name.empty()) {
        records.study_name = records.dataset.title.empty() ? records.dataset.identifier : records.dataset.title;
    }

    if (j.contains("subject_id_field")) records.subject_id_field = j["subject_id_field"].get<std::string>();
    if (j.contains("sample_id_field")) records.sample_id_field = j["sample_id_field"].get<std::string>();

    if (j.contains("variables")) {
        for (const auto& v : j["variables"]) {
            VariableRecord var;
            var.id = v.at("id").get<std::string>();
            var.name = v.at("name").get<std::string>();
            var.description = string_or_empty(v, "description");
            records.variables.push_back(var);
        }
    }

    if (j.contains("subjects")) {
        for (const auto& s : j["subjects"]) {
            records.subjects.push_back(record_from_json(s));
        }
    }

    if (j.contains("samples")) {
        for (const auto& s : j["samples"]) {
            records.samples.push_back(record_from_json(s));
        }
    }

    if (j.contains("consent_groups")) {
        for (const auto& g : j["consent_groups"]) {
            ConsentGroupRecord group;
            group.code = string_or_empty(g, "code");
            group.name = g.at("name").get<std::string>();
            group.abbreviation = string_or_empty(g, "abbreviation");
            group.description = string_or_empty(g, "description");
            group.duo = string_or_empty(g, "duo");
            group.count = g.value("count", -1);
            if (g.contains("members")) {
                group.members = g["members"].get<std::vector<std::string>>();
            }
            records.consent_groups.push_back(group);
        }
    }

    if (j.contains("files")) {
        for (const auto& f : j["files"]) {
            FileRecord file;
            file.name = f.at("name").get<std::string>();
            file.doi = string_or_empty(f, "doi");
            file.type = string_or_empty(f, "type");
            file.format = string_or_empty(f, "format");
            file.sample = string_or_empty(f, "sample");
            file.size = f.value("size", -1LL);
            records.files.push_back(file);
        }
    }

    return records;
}

StudyRecords StudyRecords::load_from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + path);
    }

    ordered_json j;
    file >> j;
    file.close();

    return from_json(j);
}

// ============================================================================
// ConversionStatistics
// ============================================================================

void ConversionStatistics::print_summary() const {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Conversion Summary\n";
    std::cout << std::string(60, '=') << "\n\n";

    std::cout << "Records:\n";
    std::cout << "  Subjects: " << subjects << "\n";
    std::cout << "  Placeholder subjects: " << placeholder_subjects << "\n";
    std::cout << "  Samples: " << samples << "\n";
    std::cout << "  Variables: " << variables << "\n";
    std::cout << "  Study groups: " << study_groups << "\n";
    std::cout << "  Files: " << files << "\n\n";

    std::cout << "Node store:\n";
    std::cout << "  Nodes created: " << store.nodes_created << "\n";
    std::cout << "  Nodes reused: " << store.nodes_reused << "\n";
    std::cout << "  Back-links added: " << store.back_links_added << "\n";
    std::cout << "  Back-links suppressed: " << store.back_links_suppressed << "\n\n";

    std::cout << "Document:\n";
    std::cout << "  Full emissions: " << build.full_emissions << "\n";
    std::cout << "  References: " << build.reference_emissions << "\n";
    std::cout << "  Literal values: " << build.literal_values << "\n";

    std::cout << "\n" << std::string(60, '=') << "\n\n";
}

json ConversionStatistics::to_json() const {
    json j;
    j["subjects"] = subjects;
    j["placeholder_subjects"] = placeholder_subjects;
    j["samples"] = samples;
    j["variables"] = variables;
    j["study_groups"] = study_groups;
    j["files"] = files;
    j["store"] = store.to_json();
    j["build"] = build.to_json();
    return j;
}

// ============================================================================
// StudyConverter
// ============================================================================

StudyConverter::StudyConverter(const ConversionConfig& config)
    : config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
}

ordered_json StudyConverter::convert(const StudyRecords& records) {
    stats_ = ConversionStatistics{};

    // One store per run; it goes away with this call
    NodeStore store(config_.allow_back_links);

    Node* dataset_identifier = make_identifier(store, records.dataset.identifier);
    std::vector<Value> dimensions = make_dimensions(store, records.variables);

    // Subjects and study groups
    std::map<std::string, Node*> subjects = make_subjects(store, records);

    std::vector<Value> groups;
    groups.push_back(make_all_subjects_group(store, subjects));
    for (const auto& cg : records.consent_groups) {
        groups.push_back(make_consent_group(store, cg, subjects));
    }
    stats_.study_groups = static_cast<int>(groups.size());

    Node* study = store.create(NodeKind::Study, {
        {"name", records.study_name},
        {"studyGroups", groups}
    });

    std::map<std::string, Node*> samples_by_name;
    std::vector<Value> samples = make_samples(store, records, subjects, samples_by_name);
    std::vector<Value> files = make_files(store, records.files, samples_by_name);

    PropertyList dataset_props;
    dataset_props.emplace_back("identifier", dataset_identifier);
    if (!records.dataset.title.empty()) {
        dataset_props.emplace_back("title", records.dataset.title);
    }
    dataset_props.emplace_back("dimensions", dimensions);
    // Subjects are emitted in full under the Study, so the Study precedes the samples
    dataset_props.emplace_back("producedBy", study);
    dataset_props.emplace_back("isAbout", samples);
    // Files refer to samples, so they follow isAbout
    if (!files.empty()) {
        dataset_props.emplace_back("hasPart", files);
    }
    Node* dataset = store.create(NodeKind::Dataset, std::move(dataset_props));

    Node* root = dataset;
    if (records.collection) {
        PropertyList collection_props;
        collection_props.emplace_back("identifier", make_identifier(store, records.collection->identifier));
        if (!records.collection->title.empty()) {
            collection_props.emplace_back("title", records.collection->title);
        }
        std::vector<Value> parts{dataset};
        for (const auto& other : records.other_parts) {
            PropertyList part_props;
            part_props.emplace_back("identifier", make_identifier(store, other.identifier));
            if (!other.title.empty()) {
                part_props.emplace_back("title", other.title);
            }
            parts.emplace_back(store.create(NodeKind::Dataset, std::move(part_props)));
        }
        collection_props.emplace_back("hasPart", parts);
        root = store.create(NodeKind::Dataset, std::move(collection_props));
    }

    GraphBuilder builder;
    builder.set_context(config_.jsonld_context);
    ordered_json doc = builder.build(*root);

    stats_.store = store.statistics();
    stats_.build = builder.statistics();

    if (config_.verbose) {
        stats_.print_summary();
    }

    return doc;
}

void StudyConverter::convert_to_file(const StudyRecords& records, const std::string& path) {
    ordered_json doc = convert(records);

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << doc.dump(config_.indent);
    file.close();

    log_info("Wrote DATS JSON-LD to " + path);
}

Node* StudyConverter::make_identifier(NodeStore& store, const std::string& accession) const {
    return store.create(NodeKind::Identifier, {
        {"identifier", accession},
        {"identifierSource", config_.identifier_source}
    });
}

std::vector<Value> StudyConverter::make_dimensions(NodeStore& store,
                                                   const std::vector<VariableRecord>& variables) {
    std::vector<Value> dimensions;
    std::set<std::string> accessions;

    for (const auto& var : variables) {
        if (!accessions.insert(var.id).second) {
            throw IdentityError("duplicate definition found for variable " + var.name +
                                " with accession=" + var.id);
        }

        Node* name = store.create(NodeKind::Annotation, {{"value", var.name}});
        PropertyList props;
        props.emplace_back("@id", var.id);
        props.emplace_back("identifier", make_identifier(store, var.id));
        props.emplace_back("name", name);
        if (!var.description.empty()) {
            props.emplace_back("description", var.description);
        }
        dimensions.emplace_back(store.create(NodeKind::Dimension, std::move(props)));
        stats_.variables++;
    }

    return dimensions;
}

std::vector<Value> StudyConverter::make_characteristics(NodeStore& store, const Record& record,
                                                        const std::vector<std::string>& skip_fields) const {
    std::vector<Value> characteristics;

    for (const auto& [field, value] : record) {
        if (value.is_null()) continue;
        if (std::find(skip_fields.begin(), skip_fields.end(), field) != skip_fields.end()) continue;
        if (value.is_string() && value.get<std::string>().empty()) continue;

        // Identical field/value pairs share one Dimension across the whole document
        Node* name = store.create(NodeKind::Annotation, {{"value", field}});
        Node* dim = store.create(NodeKind::Dimension, {
            {"name", name},
            {"values", std::vector<Value>{Value::from_json(value)}}
        });
        characteristics.emplace_back(dim);
    }

    return characteristics;
}

std::map<std::string, Node*> StudyConverter::make_subjects(NodeStore& store, const StudyRecords& records) {
    std::map<std::string, Node*> subjects;

    for (const auto& record : records.subjects) {
        auto name = field_text(record, records.subject_id_field);
        if (!name) {
            throw std::runtime_error("subject record without " + records.subject_id_field);
        }
        if (subjects.count(*name)) {
            throw std::runtime_error("duplicate subject name " + *name);
        }

        Node* subject = store.create(NodeKind::Material, {
            {"name", *name},
            {"description", "subject " + *name},
            {"characteristics", make_characteristics(store, record, {records.subject_id_field})}
        });
        subjects[*name] = subject;
        stats_.subjects++;
    }

    log_info("created " + std::to_string(subjects.size()) + " subject Material(s)");
    return subjects;
}

Node* StudyConverter::make_all_subjects_group(NodeStore& store, const std::map<std::string, Node*>& subjects) {
    // Subjects appear in full here; id references are used everywhere else
    std::vector<Value> members;
    std::vector<Node*> member_nodes;
    for (const auto& [name, subject] : subjects) {
        members.emplace_back(subject);
        member_nodes.push_back(subject);
    }

    log_info("creating 'all subjects' StudyGroup containing " + std::to_string(members.size()) +
             " subject(s)");
    Node* group = store.create(NodeKind::StudyGroup, {
        {"name", "all subjects"},
        {"members", Value::unordered(members)},
        {"size", members.size()}
    });

    link_members(store, member_nodes, group);
    return group;
}

Node* StudyConverter::make_consent_group(NodeStore& store, const ConsentGroupRecord& cg,
                                         std::map<std::string, Node*>& subjects) {
    std::vector<Value> members;
    std::vector<Node*> member_nodes;

    for (const auto& id : cg.members) {
        auto it = subjects.find(id);
        if (it == subjects.end()) {
            log_warning("subject " + id + " not found in public metadata, creating new subject Material");
            Node* placeholder = store.create(NodeKind::Material, {
                {"name", id},
                {"characteristics", std::vector<Value>{}},
                {"description", "subject " + id}
            });
            subjects[id] = placeholder;
            // Not emitted anywhere else, so it appears in full in this group
            members.emplace_back(placeholder);
            member_nodes.push_back(placeholder);
            stats_.placeholder_subjects++;
        } else {
            members.emplace_back(store.reference(it->second));
            member_nodes.push_back(it->second);
        }
    }

    if (cg.count >= 0 && static_cast<size_t>(cg.count) != members.size()) {
        throw std::runtime_error("subject count mismatch in consent group " + cg.code + ": declared " +
                                 std::to_string(cg.count) + ", found " + std::to_string(members.size()));
    }
    log_info("found " + std::to_string(members.size()) + " subject(s) in consent group " +
             cg.code + " - " + cg.name);

    PropertyList consent_props;
    consent_props.emplace_back("name", cg.name);
    if (!cg.abbreviation.empty()) {
        consent_props.emplace_back("abbreviation", cg.abbreviation);
    }
    consent_props.emplace_back("description", cg.description.empty() ? cg.name : cg.description);
    if (!cg.duo.empty()) {
        Node* duo = store.create(NodeKind::RelatedIdentifier, {{"identifier", cg.duo}});
        consent_props.emplace_back("relatedIdentifiers", std::vector<Value>{duo});
    }
    Node* consent_info = store.create(NodeKind::ConsentInfo, std::move(consent_props));

    Node* group = store.create(NodeKind::StudyGroup, {
        {"name", cg.name},
        {"members", Value::unordered(members)},
        {"size", members.size()},
        {"consentInformation", Value::unordered(std::vector<Value>{consent_info})}
    });

    link_members(store, member_nodes, group);
    return group;
}

std::vector<Value> StudyConverter::make_samples(NodeStore& store, const StudyRecords& records,
                                                const std::map<std::string, Node*>& subjects,
                                                std::map<std::string, Node*>& samples_by_name) {
    std::map<std::string, const Record*> by_name;
    for (const auto& record : records.samples) {
        auto name = field_text(record, records.sample_id_field);
        if (!name) {
            throw std::runtime_error("sample record without " + records.sample_id_field);
        }
        if (!by_name.emplace(*name, &record).second) {
            throw std::runtime_error("duplicate sample id " + *name);
        }
    }

    size_t limit = by_name.size();
    if (config_.max_output_samples > 0 && static_cast<size_t>(config_.max_output_samples) < limit) {
        limit = static_cast<size_t>(config_.max_output_samples);
        log_warning("limiting output to " + std::to_string(limit) +
                    " sample(s) due to value of max_output_samples");
    }

    std::vector<Value> samples;
    for (const auto& [name, record] : by_name) {
        if (samples.size() >= limit) break;

        PropertyList props;
        props.emplace_back("name", name);
        props.emplace_back("description", "sample " + name);
        props.emplace_back("characteristics",
                           make_characteristics(store, *record,
                                                {records.sample_id_field, records.subject_id_field}));

        auto subject_name = field_text(*record, records.subject_id_field);
        auto subject = subject_name ? subjects.find(*subject_name) : subjects.end();
        if (subject != subjects.end()) {
            props.emplace_back("derivesFrom", std::vector<Value>{subject->second});
        } else {
            log_warning("no subject found for sample " + name);
        }

        Node* sample = store.create(NodeKind::Material, std::move(props));
        samples_by_name[name] = sample;
        samples.emplace_back(sample);
        stats_.samples++;
    }

    return samples;
}

std::vector<Value> StudyConverter::make_files(NodeStore& store, const std::vector<FileRecord>& files,
                                              const std::map<std::string, Node*>& samples_by_name) {
    std::vector<Value> datasets;
    for (const auto& file : files) {
        PropertyList props;
        if (!file.doi.empty()) {
            props.emplace_back("identifier", store.create(NodeKind::Identifier, {
                {"identifier", file.doi},
                {"identifierSource", "digital object identifier"}
            }));
        }
        props.emplace_back("title", file.name);
        if (!file.type.empty()) {
            Node* type = store.create(NodeKind::DataType, {
                {"information", store.create(NodeKind::Annotation, {{"value", file.type}})}
            });
            props.emplace_back("types", std::vector<Value>{type});
        }
        if (!file.format.empty() || file.size >= 0) {
            PropertyList dist_props;
            if (!file.format.empty()) {
                dist_props.emplace_back("formats", std::vector<Value>{file.format});
            }
            if (file.size >= 0) {
                dist_props.emplace_back("size", Value::from_json(file.size));
                dist_props.emplace_back("unit", store.create(NodeKind::Annotation, {{"value", "bytes"}}));
            }
            props.emplace_back("distributions",
                               std::vector<Value>{store.create("DatasetDistribution", std::move(dist_props))});
        }
        if (!file.sample.empty()) {
            auto sample = samples_by_name.find(file.sample);
            if (sample != samples_by_name.end()) {
                props.emplace_back("isAbout", std::vector<Value>{sample->second});
            } else {
                log_warning("sample " + file.sample + " of file " + file.name + " is not in the output");
            }
        }

        datasets.emplace_back(store.create(NodeKind::Dataset, std::move(props)));
        stats_.files++;
    }

    if (!files.empty()) {
        log_info("created " + std::to_string(datasets.size()) + " file Dataset(s)");
    }
    return datasets;
}

void StudyConverter::link_members(NodeStore& store, const std::vector<Node*>& members, const Node* group) {
    if (!store.back_links_enabled()) {
        log_warning("not creating Subject level circular links because allow_back_links is off");
    }
    for (Node* member : members) {
        store.link_back(member, "characteristics", group, kMemberOfStudyGroup);
    }
}

void StudyConverter::log_info(const std::string& message) const {
    if (config_.verbose) {
        std::cout << message << "\n";
    }
}

void StudyConverter::log_warning(const std::string& message) const {
    if (config_.verbose) {
        std::cerr << "Warning: " << message << "\n";
    }
}

} // namespace dats
