#include "query/dataset_queries.hpp"
#include "graph/node.hpp"

namespace dats {

namespace {

const std::string kDataset = node_kind_to_string(NodeKind::Dataset);
const std::string kIdentifier = node_kind_to_string(NodeKind::Identifier);
const std::string kDimension = node_kind_to_string(NodeKind::Dimension);
const std::string kAnnotation = node_kind_to_string(NodeKind::Annotation);
const std::string kStudy = node_kind_to_string(NodeKind::Study);
const std::string kStudyGroup = node_kind_to_string(NodeKind::StudyGroup);
const std::string kMaterial = node_kind_to_string(NodeKind::Material);

} // namespace

JoinChain dataset_variables_chain(const std::optional<std::string>& dataset_id) {
    // 0 ?dataset a Dataset
    // 1 ?dataset identifier ?dataset_id        2 ?dataset_id identifier ?study_acc
    // 3 ?dataset dimensions ?dim               4 ?dim identifier ?dim_id
    // 5 ?dim_id identifier ?var_acc            6 ?dim name ?propname
    // 7 ?propname value ?pname                 8 ?dim description ?descr
    JoinChain chain = JoinChain::start(kDataset, "dataset")
        .join_from(0, "identifier", kIdentifier, "dataset_identifier")
        .join_from(1, "identifier", "", "dbGaP Study")
        .join_from(0, "dimensions", kDimension, "variable")
        .join_from(3, "identifier", kIdentifier, "variable_identifier")
        .join_from(4, "identifier", "", "dbGaP variable")
        .join_from(3, "name", kAnnotation, "variable_name")
        .join_from(6, "value", "", "Name")
        .join_from(3, "description", "", "Description")
        .project({2, 5, 7, 8})
        .sort_by({0, 1});

    if (dataset_id) {
        chain.where(2, Term::of(*dataset_id));
    }
    return chain;
}

ResultSet list_dataset_variables(const TripleIndex& index, const std::optional<std::string>& dataset_id) {
    return JoinEngine(index).execute(dataset_variables_chain(dataset_id));
}

JoinChain second_level_datasets_chain() {
    return JoinChain::start(kDataset, "parent")
        .join_from(0, "identifier", kIdentifier)
        .join_from(1, "identifier", "", "Parent dataset")
        .join_from(0, "hasPart", kDataset, "dataset")
        .join_from(3, "identifier", kIdentifier)
        .join_from(4, "identifier", "", "Dataset")
        .join_from(3, "title", "", "Title")
        .project({2, 5, 6})
        .sort_by({0, 1});
}

ResultSet list_second_level_datasets(const TripleIndex& index) {
    return JoinEngine(index).execute(second_level_datasets_chain());
}

JoinChain study_group_members_chain(const std::string& dataset_id, const std::string& group_name) {
    return JoinChain::start(kDataset, "dataset")
        .join_from(0, "identifier", kIdentifier)
        .join_from(1, "identifier", "", "dbGaP Study")
        .join_from(0, "producedBy", kStudy, "study")
        .join_from(3, "studyGroups", kStudyGroup, "group")
        .join_from(4, "name", "", "Study group")
        .join_from(4, "members", kMaterial, "member")
        .join_from(6, "name", "", "Subject")
        .where(2, Term::of(dataset_id))
        .where(5, Term::of(group_name))
        .project({2, 5, 7})
        .sort_by({2});
}

ResultSet list_study_group_members(const TripleIndex& index,
                                   const std::string& dataset_id,
                                   const std::string& group_name) {
    return JoinEngine(index).execute(study_group_members_chain(dataset_id, group_name));
}

JoinChain dataset_samples_chain(const std::optional<std::string>& dataset_id) {
    JoinChain chain = JoinChain::start(kDataset, "dataset")
        .join_from(0, "identifier", kIdentifier)
        .join_from(1, "identifier", "", "dbGaP Study")
        .join_from(0, "isAbout", kMaterial, "sample")
        .join_from(3, "name", "", "Sample")
        .join_from(3, "derivesFrom", kMaterial, "subject")
        .join_from(5, "name", "", "Subject")
        .project({2, 4, 6})
        .sort_by({0, 1});

    if (dataset_id) {
        chain.where(2, Term::of(*dataset_id));
    }
    return chain;
}

ResultSet list_dataset_samples(const TripleIndex& index, const std::optional<std::string>& dataset_id) {
    return JoinEngine(index).execute(dataset_samples_chain(dataset_id));
}

void print_results(const ResultSet& result, const std::string& title, std::ostream& out) {
    out << "\n" << title << ":\n\n";
    result.print_tsv(out, true);
    out << "\n";
}

} // namespace dats
