#include <gtest/gtest.h>
#include "pipeline/study_converter.hpp"
#include "query/dataset_queries.hpp"
#include "graph/errors.hpp"
#include <cstdio>
#include <cstdlib>

using namespace dats;
using json = nlohmann::ordered_json;

class StudyConverterTest : public ::testing::Test {
protected:
    json input;
    ConversionConfig config;

    void SetUp() override {
        config.verbose = false;

        input = json::parse(R"({
            "collection": {"identifier": "TOPMed", "title": "Trans-Omics for Precision Medicine"},
            "dataset": {"identifier": "phs000424.v7.p2", "title": "GTEx"},
            "study": {"name": "Genotype-Tissue Expression Project"},
            "variables": [
                {"id": "phv00169061.v7.p2", "name": "SEX", "description": "Sex of the subject"},
                {"id": "phv00169062.v7.p2", "name": "AGE", "description": "Age range"}
            ],
            "subjects": [
                {"SUBJID": "GTEX-2", "SEX": 1, "AGE": "60-69"},
                {"SUBJID": "GTEX-1", "SEX": 2, "AGE": "60-69"}
            ],
            "samples": [
                {"SAMPID": "GTEX-2-0001", "SUBJID": "GTEX-2", "SMTS": "Blood"},
                {"SAMPID": "GTEX-1-0001", "SUBJID": "GTEX-1", "SMTS": "Blood"},
                {"SAMPID": "GTEX-X-0001", "SUBJID": "GTEX-X", "SMTS": "Lung"}
            ],
            "consent_groups": [
                {"code": "1", "name": "General Research Use", "abbreviation": "GRU",
                 "duo": "http://purl.obolibrary.org/obo/DUO_0000005",
                 "count": 2, "members": ["GTEX-1", "GTEX-9"]}
            ]
        })");
    }

    json convert() {
        StudyConverter converter(config);
        return converter.convert(StudyRecords::from_json(input));
    }
};

// ==========================================
// Document Shape Tests
// ==========================================

TEST_F(StudyConverterTest, RootIsCollection) {
    json doc = convert();

    EXPECT_EQ(doc["@type"], "Dataset");
    EXPECT_EQ(doc["identifier"]["identifier"], "TOPMed");
    ASSERT_EQ(doc["hasPart"].size(), 1);
    EXPECT_EQ(doc["hasPart"][0]["title"], "GTEx");
    EXPECT_EQ(doc["hasPart"][0]["identifier"]["identifierSource"], "dbGaP");
}

TEST_F(StudyConverterTest, VariablesHaveExplicitIdentity) {
    json doc = convert();
    const json& dims = doc["hasPart"][0]["dimensions"];

    ASSERT_EQ(dims.size(), 2);
    EXPECT_EQ(dims[0]["@id"], "phv00169061.v7.p2");
    EXPECT_EQ(dims[0]["name"]["value"], "SEX");
}

TEST_F(StudyConverterTest, DocumentIsIndexable) {
    TripleIndex index = TripleIndex::from_json(convert());

    EXPECT_EQ(index.subjects_of_type("Study").size(), 1);
    EXPECT_EQ(index.subjects_of_type("StudyGroup").size(), 2);
    EXPECT_EQ(index.subjects_of_type("ConsentInfo").size(), 1);
    EXPECT_EQ(index.subjects_of_type("RelatedIdentifier").size(), 1);
}

TEST_F(StudyConverterTest, ConversionIsReproducible) {
    EXPECT_EQ(convert().dump(), convert().dump());
}

TEST_F(StudyConverterTest, Statistics) {
    StudyConverter converter(config);
    converter.convert(StudyRecords::from_json(input));
    const ConversionStatistics& stats = converter.statistics();

    EXPECT_EQ(stats.subjects, 2);
    EXPECT_EQ(stats.placeholder_subjects, 1);
    EXPECT_EQ(stats.samples, 3);
    EXPECT_EQ(stats.variables, 2);
    EXPECT_EQ(stats.study_groups, 2);
    EXPECT_GT(stats.store.nodes_reused, 0);
    EXPECT_EQ(stats.store.back_links_added, 4);
    EXPECT_EQ(stats.to_json()["store"]["back_links_added"], 4);
}

TEST_F(StudyConverterTest, ConsentMemberOrderDoesNotChangeIdentity) {
    std::string forward = convert()["hasPart"][0]["producedBy"]["studyGroups"][1]["@id"];

    input["consent_groups"][0]["members"] = json::array({"GTEX-9", "GTEX-1"});
    json doc = convert();
    const json& group = doc["hasPart"][0]["producedBy"]["studyGroups"][1];

    EXPECT_EQ(group["@id"], forward);
    // Output keeps the record order
    EXPECT_EQ(group["members"][0]["name"], "GTEX-9");
}

TEST_F(StudyConverterTest, FileDatasetsKeepRecordOrder) {
    input["files"] = json::parse(R"([
        {"name": "GTEX-2-0001.cram", "doi": "10.1000/wgs-2", "type": "WGS", "format": "CRAM",
         "sample": "GTEX-2-0001", "size": 1024},
        {"name": "GTEX-1-0001.cram", "doi": "10.1000/wgs-1", "type": "WGS", "format": "CRAM",
         "sample": "GTEX-1-0001"},
        {"name": "GTEX-1-0001.rnaseq.cram", "type": "RNA-Seq", "sample": "GTEX-X-0001"}
    ])");

    StudyConverter converter(config);
    json doc = converter.convert(StudyRecords::from_json(input));
    const json& files = doc["hasPart"][0]["hasPart"];

    ASSERT_EQ(files.size(), 3);
    EXPECT_EQ(files[0]["title"], "GTEX-2-0001.cram");
    EXPECT_EQ(files[1]["title"], "GTEX-1-0001.cram");
    EXPECT_EQ(files[2]["title"], "GTEX-1-0001.rnaseq.cram");

    EXPECT_EQ(files[0]["identifier"]["identifier"], "10.1000/wgs-2");
    EXPECT_EQ(files[0]["types"][0]["information"]["value"], "WGS");
    EXPECT_EQ(files[0]["distributions"][0]["size"], 1024);
    EXPECT_FALSE(files[2].contains("identifier"));

    // The samples are emitted in full under isAbout before the files
    EXPECT_EQ(files[0]["isAbout"][0].size(), 2);
    EXPECT_EQ(converter.statistics().files, 3);

    TripleIndex index = TripleIndex::from_json(doc);
    EXPECT_EQ(index.subjects_of_type("DataType").size(), 2);
}

TEST_F(StudyConverterTest, CollectionWithSeveralDatasets) {
    input["collection"]["datasets"] = json::parse(R"([
        {"identifier": "phs000951.v4.p4", "title": "COPDGene"},
        {"identifier": "phs000179.v6.p2", "title": "COPDGene WGS"}
    ])");
    json doc = convert();

    ASSERT_EQ(doc["hasPart"].size(), 3);
    EXPECT_EQ(doc["hasPart"][0]["title"], "GTEx");
    EXPECT_EQ(doc["hasPart"][1]["title"], "COPDGene");
    EXPECT_EQ(doc["hasPart"][2]["title"], "COPDGene WGS");

    ResultSet parts = list_second_level_datasets(TripleIndex::from_json(doc));
    EXPECT_EQ(parts.size(), 3);

    input["collection"]["datasets"][0]["identifier"] = "phs000424.v7.p2";
    EXPECT_THROW(StudyRecords::from_json(input), std::runtime_error);
}

// ==========================================
// Query Tests
// ==========================================

TEST_F(StudyConverterTest, QueriesOverConvertedDocument) {
    TripleIndex index = TripleIndex::from_json(convert());

    ResultSet vars = list_dataset_variables(index, std::string("phs000424.v7.p2"));
    ASSERT_EQ(vars.size(), 2);
    EXPECT_EQ(vars.rows[0], (Row{Term::of("phs000424.v7.p2"), Term::of("phv00169061.v7.p2"),
                                 Term::of("SEX"), Term::of("Sex of the subject")}));

    ResultSet all = list_study_group_members(index, "phs000424.v7.p2", "all subjects");
    ASSERT_EQ(all.size(), 2);
    EXPECT_EQ(all.rows[0][2].to_string(), "GTEX-1");

    ResultSet gru = list_study_group_members(index, "phs000424.v7.p2", "General Research Use");
    ASSERT_EQ(gru.size(), 2);
    EXPECT_EQ(gru.rows[1][2].to_string(), "GTEX-9");

    ResultSet samples = list_dataset_samples(index);
    ASSERT_EQ(samples.size(), 2);
    EXPECT_EQ(samples.rows[0][1].to_string(), "GTEX-1-0001");

    ResultSet parts = list_second_level_datasets(index);
    ASSERT_EQ(parts.size(), 1);
    EXPECT_EQ(parts.rows[0][0].to_string(), "TOPMed");
}

// ==========================================
// Back-link Tests
// ==========================================

TEST_F(StudyConverterTest, BackLinksCreateCycles) {
    TripleIndex index = TripleIndex::from_json(convert());
    EXPECT_FALSE(index.is_acyclic());
}

TEST_F(StudyConverterTest, DisabledBackLinksGiveAcyclicDocument) {
    config.allow_back_links = false;

    StudyConverter converter(config);
    json doc = converter.convert(StudyRecords::from_json(input));

    EXPECT_TRUE(TripleIndex::from_json(doc).is_acyclic());
    EXPECT_EQ(converter.statistics().store.back_links_added, 0);
    EXPECT_EQ(converter.statistics().store.back_links_suppressed, 4);
}

// ==========================================
// Failure Tests
// ==========================================

TEST_F(StudyConverterTest, DuplicateVariableAccession) {
    input["variables"][1]["id"] = "phv00169061.v7.p2";
    EXPECT_THROW(convert(), IdentityError);
}

TEST_F(StudyConverterTest, DuplicateSubject) {
    input["subjects"][1]["SUBJID"] = "GTEX-2";
    EXPECT_THROW(convert(), std::runtime_error);
}

TEST_F(StudyConverterTest, ConsentCountMismatch) {
    input["consent_groups"][0]["count"] = 3;
    EXPECT_THROW(convert(), std::runtime_error);
}

TEST_F(StudyConverterTest, MissingDataset) {
    input.erase("dataset");
    EXPECT_THROW(StudyRecords::from_json(input), std::runtime_error);
}

TEST_F(StudyConverterTest, SampleCap) {
    config.max_output_samples = 1;
    json doc = convert();

    const json& samples = doc["hasPart"][0]["isAbout"];
    ASSERT_EQ(samples.size(), 1);
    EXPECT_EQ(samples[0]["name"], "GTEX-1-0001");
}

// ==========================================
// Configuration Tests
// ==========================================

TEST(ConversionConfigTest, Validate) {
    ConversionConfig config;
    std::string error;
    EXPECT_TRUE(config.validate(error));

    config.max_output_samples = -1;
    EXPECT_FALSE(config.validate(error));
    EXPECT_FALSE(error.empty());

    config.max_output_samples = 0;
    config.identifier_source = "";
    EXPECT_FALSE(config.validate(error));
    EXPECT_THROW(StudyConverter converter(config), std::invalid_argument);
}

TEST(ConversionConfigTest, FileRoundtrip) {
    ConversionConfig config;
    config.allow_back_links = false;
    config.max_output_samples = 10;
    config.jsonld_context = "https://w3id.org/dats/context/sdo/dataset_sdo_context.jsonld";

    std::string path = "/tmp/dats_conversion_config_test.json";
    config.to_json_file(path);
    ConversionConfig loaded = ConversionConfig::from_json_file(path);
    std::remove(path.c_str());

    EXPECT_FALSE(loaded.allow_back_links);
    EXPECT_EQ(loaded.max_output_samples, 10);
    EXPECT_EQ(loaded.jsonld_context, config.jsonld_context);
    EXPECT_EQ(loaded.identifier_source, "dbGaP");

    EXPECT_THROW(ConversionConfig::from_json_file("/nonexistent/config.json"), std::runtime_error);
}

TEST(ConversionConfigTest, Environment) {
    setenv("DATS_ALLOW_BACK_LINKS", "false", 1);
    setenv("DATS_MAX_OUTPUT_SAMPLES", "25", 1);
    ConversionConfig config = ConversionConfig::from_environment();
    EXPECT_FALSE(config.allow_back_links);
    EXPECT_EQ(config.max_output_samples, 25);

    setenv("DATS_ALLOW_BACK_LINKS", "TRUE", 1);
    EXPECT_TRUE(ConversionConfig::from_environment().allow_back_links);
    setenv("DATS_ALLOW_BACK_LINKS", "\xC3\xA9", 1);
    EXPECT_FALSE(ConversionConfig::from_environment().allow_back_links);

    setenv("DATS_MAX_OUTPUT_SAMPLES", "many", 1);
    EXPECT_THROW(ConversionConfig::from_environment(), std::invalid_argument);

    unsetenv("DATS_ALLOW_BACK_LINKS");
    unsetenv("DATS_MAX_OUTPUT_SAMPLES");
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
