#pragma once

#include "query/join_engine.hpp"
#include <iostream>
#include <optional>
#include <string>

namespace dats {

// ============================================================================
// Canned queries over a DATS document
// ============================================================================
//
// Each query is a Join Chain over the DATS vocabulary (Dataset, Identifier,
// Dimension, Annotation, Study, StudyGroup, Material). Dataset ids are the
// accession literals held by a Dataset's Identifier (e.g. "phs000424.v7.p2"),
// not document identities.

/**
 * @brief Variables (Dimensions) of every Dataset, or of one Dataset
 *
 * Columns: dbGaP Study, dbGaP variable, Name, Description.
 * Ordered by study accession, then variable accession.
 */
JoinChain dataset_variables_chain(const std::optional<std::string>& dataset_id = std::nullopt);
ResultSet list_dataset_variables(const TripleIndex& index,
                                 const std::optional<std::string>& dataset_id = std::nullopt);

/**
 * @brief Datasets that are a direct part of another Dataset
 *
 * Columns: Parent dataset, Dataset, Title.
 */
JoinChain second_level_datasets_chain();
ResultSet list_second_level_datasets(const TripleIndex& index);

/**
 * @brief Subjects that belong to a named study group of a Dataset's Study
 *
 * Columns: dbGaP Study, Study group, Subject.
 */
JoinChain study_group_members_chain(const std::string& dataset_id, const std::string& group_name);
ResultSet list_study_group_members(const TripleIndex& index,
                                   const std::string& dataset_id,
                                   const std::string& group_name);

/**
 * @brief Samples a Dataset is about, with the subject each derives from
 *
 * Columns: dbGaP Study, Sample, Subject.
 */
JoinChain dataset_samples_chain(const std::optional<std::string>& dataset_id = std::nullopt);
ResultSet list_dataset_samples(const TripleIndex& index,
                               const std::optional<std::string>& dataset_id = std::nullopt);

/**
 * @brief Print a titled, tab-delimited table
 */
void print_results(const ResultSet& result, const std::string& title, std::ostream& out = std::cout);

} // namespace dats
