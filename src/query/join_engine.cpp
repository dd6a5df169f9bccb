#include "query/join_engine.hpp"
#include <algorithm>
#include <stdexcept>

namespace dats {

// ==========================================
// JoinChain Builders
// ==========================================

JoinChain JoinChain::start(const std::string& type, const std::string& label) {
    JoinChain chain;
    chain.start_type = type;
    chain.start_label = label.empty() ? type : label;
    return chain;
}

JoinChain& JoinChain::starting_at(const std::string& id) {
    start_id = id;
    return *this;
}

JoinChain& JoinChain::join(const std::string& predicate, const std::string& type,
                           const std::string& label) {
    return join_from(steps.size(), predicate, type, label);
}

JoinChain& JoinChain::join_from(size_t column, const std::string& predicate,
                                const std::string& type, const std::string& label) {
    JoinStep step;
    step.from = column;
    step.predicate = predicate;
    step.type = type;
    step.label = label.empty() ? predicate : label;
    steps.push_back(std::move(step));
    return *this;
}

JoinChain& JoinChain::where(size_t column, const Term& value) {
    filters.emplace_back(column, value);
    return *this;
}

JoinChain& JoinChain::project(std::vector<size_t> columns) {
    select = std::move(columns);
    return *this;
}

JoinChain& JoinChain::sort_by(std::vector<size_t> columns) {
    order_by = std::move(columns);
    return *this;
}

// ==========================================
// ResultSet Implementation
// ==========================================

void ResultSet::print_tsv(std::ostream& out, bool header) const {
    if (header) {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << "\t";
            out << columns[i];
        }
        out << "\n";
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << "\t";
            out << row[i].to_string();
        }
        out << "\n";
    }
}

nlohmann::ordered_json ResultSet::to_json() const {
    nlohmann::ordered_json j;
    j["columns"] = columns;
    j["rows"] = nlohmann::ordered_json::array();
    for (const auto& row : rows) {
        nlohmann::ordered_json r = nlohmann::ordered_json::array();
        for (const auto& term : row) {
            if (term.is_node()) {
                nlohmann::ordered_json ref;
                ref["@id"] = term.id;
                r.push_back(ref);
            } else {
                r.push_back(term.literal);
            }
        }
        j["rows"].push_back(r);
    }
    j["partial_matches_explored"] = partial_matches_explored;
    return j;
}

// ==========================================
// JoinEngine Implementation
// ==========================================

ResultSet JoinEngine::execute(const JoinChain& chain) const {
    validate(chain);

    ResultSet result;
    std::vector<std::string> labels;
    labels.push_back(chain.start_label.empty() ? chain.start_type : chain.start_label);
    for (const auto& step : chain.steps) {
        labels.push_back(step.label.empty() ? step.predicate : step.label);
    }

    std::vector<Row> partial = seed(chain);
    apply_filters(partial, chain, 0);
    result.partial_matches_explored += partial.size();

    for (size_t i = 0; i < chain.steps.size() && !partial.empty(); ++i) {
        partial = extend(partial, chain.steps[i]);
        apply_filters(partial, chain, i + 1);
        result.partial_matches_explored += partial.size();
    }

    // Projection
    std::vector<size_t> select = chain.select;
    if (select.empty()) {
        for (size_t c = 0; c < chain.width(); ++c) select.push_back(c);
    }
    for (size_t c : select) {
        result.columns.push_back(labels[c]);
    }

    std::vector<Row> rows;
    rows.reserve(partial.size());
    for (const auto& row : partial) {
        Row projected;
        projected.reserve(select.size());
        for (size_t c : select) {
            projected.push_back(row[c]);
        }
        rows.push_back(std::move(projected));
    }

    // Sort on the requested keys, then on the whole tuple for a total order
    std::vector<size_t> keys = chain.order_by;
    std::sort(rows.begin(), rows.end(), [&keys](const Row& a, const Row& b) {
        for (size_t k : keys) {
            if (a[k] < b[k]) return true;
            if (b[k] < a[k]) return false;
        }
        return a < b;
    });

    // Set semantics on the output tuple
    rows.erase(std::unique(rows.begin(), rows.end()), rows.end());

    result.rows = std::move(rows);
    return result;
}

void JoinEngine::validate(const JoinChain& chain) const {
    if (chain.start_type.empty()) {
        throw std::invalid_argument("join chain has no start type");
    }
    for (size_t i = 0; i < chain.steps.size(); ++i) {
        const auto& step = chain.steps[i];
        // Step i produces column i + 1 and may read any column bound before it
        if (step.from != JoinStep::kLastColumn && step.from > i) {
            throw std::invalid_argument("join step " + std::to_string(i + 1) +
                                        " reads unbound column " + std::to_string(step.from));
        }
        if (step.predicate.empty()) {
            throw std::invalid_argument("join step " + std::to_string(i + 1) + " has no predicate");
        }
    }
    for (const auto& [column, value] : chain.filters) {
        if (column >= chain.width()) {
            throw std::invalid_argument("filter on unknown column " + std::to_string(column));
        }
    }
    for (size_t c : chain.select) {
        if (c >= chain.width()) {
            throw std::invalid_argument("projection of unknown column " + std::to_string(c));
        }
    }
    size_t projected = chain.select.empty() ? chain.width() : chain.select.size();
    for (size_t c : chain.order_by) {
        if (c >= projected) {
            throw std::invalid_argument("sort key " + std::to_string(c) + " is not a projected column");
        }
    }
}

std::vector<Row> JoinEngine::seed(const JoinChain& chain) const {
    std::vector<Row> rows;

    if (chain.start_id) {
        if (index_.has_type(*chain.start_id, chain.start_type)) {
            rows.push_back(Row{Term::node(*chain.start_id)});
        }
        return rows;
    }

    for (const auto& id : index_.subjects_of_type(chain.start_type)) {
        rows.push_back(Row{Term::node(id)});
    }
    return rows;
}

std::vector<Row> JoinEngine::extend(const std::vector<Row>& partial, const JoinStep& step) const {
    std::vector<Row> extended;

    for (const auto& row : partial) {
        size_t from = step.from == JoinStep::kLastColumn ? row.size() - 1 : step.from;
        const Term& subject = row[from];
        if (!subject.is_node()) continue;

        for (const auto& triple : index_.lookup(subject.id, step.predicate)) {
            if (!matches_type(triple.object, step.type)) continue;
            Row next = row;
            next.push_back(triple.object);
            extended.push_back(std::move(next));
        }
    }

    return extended;
}

bool JoinEngine::matches_type(const Term& object, const std::string& type) const {
    if (type.empty()) return true;
    return object.is_node() && index_.has_type(object.id, type);
}

void JoinEngine::apply_filters(std::vector<Row>& rows, const JoinChain& chain, size_t column) {
    for (const auto& [filter_column, value] : chain.filters) {
        if (filter_column != column) continue;
        const Term& expected = value;
        rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const Row& row) {
            return row[column] != expected;
        }), rows.end());
    }
}

} // namespace dats
