#pragma once

#include "index/triple_index.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace dats {

using Row = std::vector<Term>;

/**
 * @brief One relationship hop of a Join Chain
 *
 * Looks up (row[from], predicate) in the index and binds each object that
 * satisfies the type filter to a new column. An empty type accepts any
 * object, literal or node.
 */
struct JoinStep {
    static constexpr size_t kLastColumn = static_cast<size_t>(-1);

    size_t from = kLastColumn;
    std::string predicate;
    std::string type;
    std::string label;
};

/**
 * @brief Stateless description of a multi-hop structural query
 *
 * Column 0 holds the start nodes (declared type == start_type); each step
 * appends one column. Filters pin a column to a value, projection picks the
 * output columns, and order_by indexes into the projected columns.
 *
 * Example: all members of study group G
 * @code
 *   auto chain = JoinChain::start("Subject")
 *                    .join("memberOf", "StudyGroup")
 *                    .where(1, Term::node("G"));
 * @endcode
 */
struct JoinChain {
    std::string start_type;
    std::string start_label;
    std::optional<std::string> start_id;
    std::vector<JoinStep> steps;
    std::vector<std::pair<size_t, Term>> filters;
    std::vector<size_t> select;        // empty = every column
    std::vector<size_t> order_by;      // empty = every projected column

    static JoinChain start(const std::string& type, const std::string& label = "");

    JoinChain& starting_at(const std::string& id);
    JoinChain& join(const std::string& predicate, const std::string& type = "",
                    const std::string& label = "");
    JoinChain& join_from(size_t column, const std::string& predicate,
                         const std::string& type = "", const std::string& label = "");
    JoinChain& where(size_t column, const Term& value);
    JoinChain& project(std::vector<size_t> columns);
    JoinChain& sort_by(std::vector<size_t> columns);

    /**
     * @brief Number of columns bound once every step has run
     */
    size_t width() const { return steps.size() + 1; }
};

/**
 * @brief Deduplicated, deterministically ordered output of a Join Chain
 */
struct ResultSet {
    std::vector<std::string> columns;
    std::vector<Row> rows;
    size_t partial_matches_explored = 0;

    bool empty() const { return rows.empty(); }
    size_t size() const { return rows.size(); }

    /**
     * @brief Write one tab-delimited line per row (header first when requested)
     */
    void print_tsv(std::ostream& out, bool header = true) const;

    nlohmann::ordered_json to_json() const;
};

/**
 * @brief Small interpreter that executes Join Chains against a TripleIndex
 *
 * Execution:
 * 1. seed with every subject whose type is start_type (optionally one identity);
 * 2. for each step, extend every partial match through (row[from], predicate),
 *    keeping objects that pass the type filter; matches without successors
 *    are dropped, which is an empty result and not an error;
 * 3. project, deduplicate on the projected tuple, and sort by order_by with
 *    the remaining columns as tie-breakers.
 *
 * References and inline objects are indistinguishable here: both are edges
 * to the same identity in the index.
 */
class JoinEngine {
public:
    explicit JoinEngine(const TripleIndex& index) : index_(index) {}

    /**
     * @throws std::invalid_argument if a step, filter, projection or sort key
     *         names a column that does not exist
     */
    ResultSet execute(const JoinChain& chain) const;

private:
    void validate(const JoinChain& chain) const;
    std::vector<Row> seed(const JoinChain& chain) const;
    std::vector<Row> extend(const std::vector<Row>& partial, const JoinStep& step) const;
    bool matches_type(const Term& object, const std::string& type) const;
    static void apply_filters(std::vector<Row>& rows, const JoinChain& chain, size_t column);

    const TripleIndex& index_;
};

} // namespace dats
