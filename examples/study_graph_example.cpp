#include "graph/node_store.hpp"
#include "graph/graph_builder.hpp"
#include "index/triple_index.hpp"
#include "query/dataset_queries.hpp"
#include <iostream>
#include <sys/stat.h>
#include <sys/types.h>

using namespace dats;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

int main() {
    print_separator("DATS Graph Example - Study Metadata Construction");

    const std::string output_dir = "output_json";
    mkdir(output_dir.c_str(), 0755);

    NodeStore store;

    std::cout << "1. Creating identifiers and variables:\n";
    Node* study_id = store.create(NodeKind::Identifier, {
        {"identifier", "phs000424.v7.p2"},
        {"identifierSource", "dbGaP"}
    });
    Node* sex = store.create(NodeKind::Dimension, {
        {"@id", "phv00169061.v7.p2"},
        {"identifier", store.create(NodeKind::Identifier, {{"identifier", "phv00169061.v7.p2"},
                                                           {"identifierSource", "dbGaP"}})},
        {"name", store.create(NodeKind::Annotation, {{"value", "SEX"}})},
        {"description", "Sex of the subject"}
    });
    std::cout << "   Dataset identifier: " << study_id->id() << "\n";
    std::cout << "   Variable: " << sex->id() << " (explicit identity)\n\n";

    std::cout << "2. Creating subjects (identical characteristics are shared):\n";
    Node* female = store.create(NodeKind::Dimension, {
        {"name", store.create(NodeKind::Annotation, {{"value", "SEX"}})},
        {"values", std::vector<Value>{"female"}}
    });
    Node* subject1 = store.create(NodeKind::Material, {
        {"name", "GTEX-1"},
        {"characteristics", std::vector<Value>{female}}
    });
    Node* subject2 = store.create(NodeKind::Material, {
        {"name", "GTEX-2"},
        {"characteristics", std::vector<Value>{female}}
    });
    Node* again = store.create(NodeKind::Material, {
        {"characteristics", std::vector<Value>{female}},
        {"name", "GTEX-1"}
    });
    std::cout << "   GTEX-1: " << subject1->id() << "\n";
    std::cout << "   GTEX-2: " << subject2->id() << "\n";
    std::cout << "   GTEX-1 created again -> same node: " << (again == subject1 ? "yes" : "no") << "\n\n";

    std::cout << "3. Grouping subjects and linking back:\n";
    Node* group = store.create(NodeKind::StudyGroup, {
        {"name", "all subjects"},
        {"members", std::vector<Value>{subject1, subject2}},
        {"size", 2}
    });
    for (Node* subject : {subject1, subject2}) {
        store.link_back(subject, "characteristics", group, "member of study group");
    }
    std::cout << "   Back-links added: " << store.statistics().back_links_added << "\n\n";

    Node* study = store.create(NodeKind::Study, {
        {"name", "GTEx"},
        {"studyGroups", std::vector<Value>{group}}
    });
    Node* sample = store.create(NodeKind::Material, {
        {"name", "GTEX-1-0001"},
        {"derivesFrom", std::vector<Value>{subject1}}
    });
    Node* dataset = store.create(NodeKind::Dataset, {
        {"identifier", study_id},
        {"title", "Genotype-Tissue Expression Project"},
        {"dimensions", std::vector<Value>{sex}},
        {"producedBy", study},
        {"isAbout", std::vector<Value>{sample}}
    });

    print_separator("Serialization");

    GraphBuilder builder;
    std::string path = output_dir + "/gtex_example.jsonld";
    builder.export_to_json(*dataset, path);
    const BuildStatistics& build = builder.statistics();
    std::cout << "Wrote " << path << "\n";
    std::cout << "  Full emissions: " << build.full_emissions << "\n";
    std::cout << "  References: " << build.reference_emissions << "\n";

    print_separator("Queries");

    TripleIndex index = TripleIndex::load_from_json(path);
    index.print_summary();
    std::cout << "Reference graph acyclic: " << (index.is_acyclic() ? "yes" : "no") << "\n";

    print_results(list_dataset_variables(index), "Variables");
    print_results(list_study_group_members(index, "phs000424.v7.p2", "all subjects"), "Members of 'all subjects'");
    print_results(list_dataset_samples(index), "Samples");

    return 0;
}
