#pragma once

#include "graph/node_store.hpp"
#include "graph/graph_builder.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace dats {

// ============================================================================
// Conversion Configuration
// ============================================================================

/**
 * @brief Configuration for one study conversion run
 */
struct ConversionConfig {
    bool allow_back_links = true;           ///< Add "member of study group" links from subjects to groups
    bool verbose = true;                    ///< Progress logging
    int max_output_samples = 0;             ///< Cap on sample Materials (0 = no limit)
    int indent = 2;                         ///< JSON output indentation
    std::string jsonld_context;             ///< "@context" for the root object (empty = none)
    std::string identifier_source = "dbGaP";  ///< identifierSource of generated Identifiers

    /**
     * @brief Load configuration from JSON file
     */
    static ConversionConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by DATS_* environment variables
     */
    static ConversionConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

// ============================================================================
// Pre-parsed Input Records
// ============================================================================

/// One parsed row of a subject or sample file: field name -> value, in source order
using Record = std::vector<std::pair<std::string, nlohmann::ordered_json>>;

struct DatasetRecord {
    std::string identifier;                 ///< Study accession, e.g. phs000424.v7.p2
    std::string title;
};

struct VariableRecord {
    std::string id;                         ///< Variable accession, e.g. phv00169061.v7.p2
    std::string name;
    std::string description;
};

/// One data file of the study (e.g. a WGS or RNA-Seq CRAM)
struct FileRecord {
    std::string name;
    std::string doi;                        ///< Optional
    std::string type;                       ///< Data type, e.g. "WGS"
    std::string format;                     ///< File format, e.g. "CRAM"
    std::string sample;                     ///< Sample id the file was derived from (optional)
    long long size = -1;                    ///< Size in bytes (-1 = unknown)
};

struct ConsentGroupRecord {
    std::string code;
    std::string name;
    std::string abbreviation;
    std::string description;
    std::string duo;                        ///< Data Use Ontology term IRI (optional)
    int count = -1;                         ///< Declared member count (-1 = not declared)
    std::vector<std::string> members;       ///< Subject ids
};

/**
 * @brief Everything the external parsers hand over for one study
 */
struct StudyRecords {
    std::optional<DatasetRecord> collection;  ///< Optional parent Dataset
    std::vector<DatasetRecord> other_parts;   ///< Further study Datasets of the collection
    DatasetRecord dataset;
    std::string study_name;
    std::string subject_id_field = "SUBJID";
    std::string sample_id_field = "SAMPID";
    std::vector<VariableRecord> variables;
    std::vector<Record> subjects;
    std::vector<Record> samples;
    std::vector<ConsentGroupRecord> consent_groups;
    std::vector<FileRecord> files;            ///< In output order

    static StudyRecords from_json(const nlohmann::ordered_json& j);
    static StudyRecords load_from_json(const std::string& path);
};

// ============================================================================
// Conversion Statistics
// ============================================================================

struct ConversionStatistics {
    int subjects = 0;
    int placeholder_subjects = 0;
    int samples = 0;
    int variables = 0;
    int study_groups = 0;
    int files = 0;

    StoreStatistics store;
    BuildStatistics build;

    void print_summary() const;
    nlohmann::json to_json() const;
};

// ============================================================================
// Study Converter
// ============================================================================

/**
 * @brief Turns pre-parsed study records into a single DATS JSON-LD document
 *
 * Owns the run: a NodeStore is created at the start of convert() and
 * discarded once the document has been serialized.
 *
 * Output shape:
 *   Dataset
 *     identifier   -> Identifier
 *     dimensions   -> Dimension per study variable
 *     producedBy   -> Study
 *                       studyGroups -> "all subjects" StudyGroup (subjects in full),
 *                                      one StudyGroup per consent group (references)
 *     isAbout      -> sample Materials, each derivesFrom its subject
 *     hasPart      -> one Dataset per data file, in record order
 *
 * With a collection the root is a Dataset whose hasPart lists this Dataset
 * followed by the collection's other parts.
 */
class StudyConverter {
public:
    explicit StudyConverter(const ConversionConfig& config = ConversionConfig());

    /**
     * @brief Build the document for one study
     * @throws IdentityError on duplicate variable accessions or conflicting nodes
     * @throws std::runtime_error on inconsistent records (duplicate subject or
     *         sample ids, consent group count mismatch)
     */
    nlohmann::ordered_json convert(const StudyRecords& records);

    /**
     * @brief convert() and write the result to @p path
     */
    void convert_to_file(const StudyRecords& records, const std::string& path);

    const ConversionStatistics& statistics() const { return stats_; }
    const ConversionConfig& config() const { return config_; }

private:
    Node* make_identifier(NodeStore& store, const std::string& accession) const;
    std::vector<Value> make_dimensions(NodeStore& store, const std::vector<VariableRecord>& variables);
    std::vector<Value> make_characteristics(NodeStore& store, const Record& record,
                                            const std::vector<std::string>& skip_fields) const;
    std::map<std::string, Node*> make_subjects(NodeStore& store, const StudyRecords& records);
    Node* make_all_subjects_group(NodeStore& store, const std::map<std::string, Node*>& subjects);
    Node* make_consent_group(NodeStore& store, const ConsentGroupRecord& group,
                             std::map<std::string, Node*>& subjects);
    std::vector<Value> make_samples(NodeStore& store, const StudyRecords& records,
                                    const std::map<std::string, Node*>& subjects,
                                    std::map<std::string, Node*>& samples_by_name);
    std::vector<Value> make_files(NodeStore& store, const std::vector<FileRecord>& files,
                                  const std::map<std::string, Node*>& samples_by_name);
    void link_members(NodeStore& store, const std::vector<Node*>& members, const Node* group);

    void log_info(const std::string& message) const;
    void log_warning(const std::string& message) const;

    ConversionConfig config_;
    ConversionStatistics stats_;
};

/**
 * @brief Find a field in a record
 * @return Pointer to the value, or nullptr
 */
const nlohmann::ordered_json* find_field(const Record& record, const std::string& field);

} // namespace dats
