#pragma once

#include "graph/errors.hpp"
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <map>
#include <set>
#include <vector>
#include <string>
#include <fstream>
#include <algorithm>
#include <iostream>
#include <utility>

namespace dats {

// Object of a triple: a node identity or a literal
struct Term {
    enum class Kind { Node, Literal };

    Kind kind = Kind::Literal;
    std::string id;                    // Kind::Node
    nlohmann::ordered_json literal;    // Kind::Literal

    static Term node(const std::string& id) {
        Term t;
        t.kind = Kind::Node;
        t.id = id;
        return t;
    }

    static Term of(const nlohmann::ordered_json& value) {
        Term t;
        t.literal = value;
        return t;
    }

    bool is_node() const { return kind == Kind::Node; }

    // Identity for nodes, unquoted text for string literals, JSON text otherwise
    std::string to_string() const {
        if (is_node()) return id;
        if (literal.is_string()) return literal.get<std::string>();
        return literal.dump();
    }

    bool operator==(const Term& other) const {
        if (kind != other.kind) return false;
        return is_node() ? id == other.id : literal == other.literal;
    }

    bool operator!=(const Term& other) const { return !(*this == other); }

    // Total order: node identities before literals
    bool operator<(const Term& other) const {
        if (kind != other.kind) return kind == Kind::Node;
        return is_node() ? id < other.id : literal < other.literal;
    }
};

struct Triple {
    std::string subject;
    std::string predicate;
    Term object;
};

inline const char* const kTypePredicate = "@type";

// Immutable subject / (subject, predicate) index over a serialized graph.
// Reference objects ({"@id", "@type"} only) become edges to the referenced
// identity, exactly like inline objects do.
class TripleIndex {
public:
    // Load a document: an object, an array of objects, or an object with "@graph"
    static TripleIndex from_json(const nlohmann::ordered_json& document) {
        TripleIndex idx;
        idx.collect_ids(document);
        idx.load_document(document);
        idx.resolve_references();
        return idx;
    }

    static TripleIndex load_from_json(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open DATS file: " + path);
        }

        nlohmann::ordered_json j;
        file >> j;
        return from_json(j);
    }

    // All outgoing triples of a subject, in document order
    const std::vector<Triple>& outgoing(const std::string& subject) const {
        auto it = by_subject_.find(subject);
        return it != by_subject_.end() ? it->second : empty_;
    }

    // Outgoing triples of a subject for one predicate, in document order
    const std::vector<Triple>& lookup(const std::string& subject, const std::string& predicate) const {
        auto it = by_subject_predicate_.find({subject, predicate});
        return it != by_subject_predicate_.end() ? it->second : empty_;
    }

    const std::string* type_of(const std::string& subject) const {
        auto it = types_.find(subject);
        return it != types_.end() ? &it->second : nullptr;
    }

    bool has_type(const std::string& subject, const std::string& type) const {
        const std::string* t = type_of(subject);
        return t != nullptr && *t == type;
    }

    // Subjects declaring a type, sorted by identity
    std::vector<std::string> subjects_of_type(const std::string& type) const {
        auto it = subjects_by_type_.find(type);
        if (it == subjects_by_type_.end()) return {};
        return std::vector<std::string>(it->second.begin(), it->second.end());
    }

    bool has_subject(const std::string& subject) const { return types_.count(subject) > 0; }

    size_t num_subjects() const { return types_.size(); }
    size_t num_triples() const { return num_triples_; }
    size_t num_references() const { return num_references_; }

    // True when no node can reach itself through node-valued edges
    bool is_acyclic() const {
        enum class Mark { Unvisited, Active, Done };
        std::unordered_map<std::string, Mark> marks;

        for (const auto& [start, type] : types_) {
            if (marks[start] != Mark::Unvisited) continue;

            // Iterative DFS: (node, next outgoing triple position)
            std::vector<std::pair<std::string, size_t>> stack;
            stack.emplace_back(start, 0);
            marks[start] = Mark::Active;

            while (!stack.empty()) {
                auto& [node, pos] = stack.back();
                const auto& edges = outgoing(node);
                if (pos >= edges.size()) {
                    marks[node] = Mark::Done;
                    stack.pop_back();
                    continue;
                }
                const Triple& t = edges[pos++];
                if (!t.object.is_node()) continue;

                Mark& m = marks[t.object.id];
                if (m == Mark::Active) return false;
                if (m == Mark::Unvisited) {
                    m = Mark::Active;
                    stack.emplace_back(t.object.id, 0);
                }
            }
        }
        return true;
    }

    void print_summary(std::ostream& out = std::cout) const {
        out << "TripleIndex Summary:\n";
        out << "  Subjects: " << num_subjects() << "\n";
        out << "  Triples: " << num_triples() << "\n";
        out << "  References: " << num_references() << "\n";
        out << "  Types:\n";
        for (const auto& [type, subjects] : subjects_by_type_) {
            out << "    " << type << ": " << subjects.size() << "\n";
        }
    }

private:
    void load_document(const nlohmann::ordered_json& document) {
        if (document.is_array()) {
            for (const auto& item : document) {
                if (!item.is_object()) {
                    throw MalformedDocumentError("top-level array element is not an object");
                }
                visit_object(item, true);
            }
        } else if (document.is_object() && document.contains("@graph")) {
            load_document(document["@graph"]);
        } else if (document.is_object()) {
            visit_object(document, true);
        } else {
            throw MalformedDocumentError("document root must be an object or an array of objects");
        }
    }

    static bool is_reference(const nlohmann::ordered_json& obj) {
        if (!obj.contains("@id")) return false;
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (it.key() != "@id" && it.key() != "@type") return false;
        }
        return true;
    }

    // Every explicit "@id" string, so generated blank labels never collide with one
    void collect_ids(const nlohmann::ordered_json& value) {
        if (value.is_array()) {
            for (const auto& item : value) collect_ids(item);
        } else if (value.is_object()) {
            auto id = value.find("@id");
            if (id != value.end() && id->is_string()) {
                document_ids_.insert(id->get<std::string>());
            }
            for (auto it = value.begin(); it != value.end(); ++it) {
                collect_ids(it.value());
            }
        }
    }

    std::string next_blank_label() {
        std::string label;
        do {
            label = "_:b" + std::to_string(blank_counter_++);
        } while (document_ids_.count(label) > 0);
        return label;
    }

    // Returns the identity of the visited object. Top-level objects (root,
    // array and @graph elements) are always full emissions.
    std::string visit_object(const nlohmann::ordered_json& obj, bool top_level = false) {
        if (!top_level && is_reference(obj)) {
            std::string id = read_id(obj);
            std::string type;
            if (obj.contains("@type")) type = read_type(obj, id);
            pending_references_.emplace_back(id, type);
            num_references_++;
            return id;
        }

        std::string id = obj.contains("@id") ? read_id(obj) : next_blank_label();
        if (!obj.contains("@type")) {
            throw MalformedDocumentError("object " + id + " has no @type");
        }
        std::string type = read_type(obj, id);

        if (!types_.emplace(id, type).second) {
            throw MalformedDocumentError("identity " + id + " is emitted in full more than once");
        }
        subjects_by_type_[type].insert(id);
        add_triple(id, kTypePredicate, Term::of(type));

        for (auto it = obj.begin(); it != obj.end(); ++it) {
            const std::string& key = it.key();
            if (!key.empty() && key[0] == '@') continue;
            add_value(id, key, it.value());
        }

        return id;
    }

    void add_value(const std::string& subject, const std::string& predicate,
                   const nlohmann::ordered_json& value) {
        if (value.is_null()) return;
        if (value.is_object()) {
            std::string object_id = visit_object(value);
            add_triple(subject, predicate, Term::node(object_id));
        } else if (value.is_array()) {
            for (const auto& item : value) {
                add_value(subject, predicate, item);
            }
        } else {
            add_triple(subject, predicate, Term::of(value));
        }
    }

    void add_triple(const std::string& subject, const std::string& predicate, Term object) {
        Triple t{subject, predicate, std::move(object)};
        by_subject_predicate_[{subject, predicate}].push_back(t);
        by_subject_[subject].push_back(std::move(t));
        num_triples_++;
    }

    static std::string read_id(const nlohmann::ordered_json& obj) {
        const auto& id = obj["@id"];
        if (!id.is_string() || id.get<std::string>().empty()) {
            throw MalformedDocumentError("@id must be a non-empty string: " + id.dump());
        }
        return id.get<std::string>();
    }

    static std::string read_type(const nlohmann::ordered_json& obj, const std::string& id) {
        const auto& type = obj["@type"];
        if (!type.is_string() || type.get<std::string>().empty()) {
            throw MalformedDocumentError("@type of " + id + " must be a non-empty string");
        }
        return type.get<std::string>();
    }

    // Every reference must resolve to exactly one full emission of a matching type
    void resolve_references() {
        for (const auto& [id, type] : pending_references_) {
            const std::string* full_type = type_of(id);
            if (!full_type) {
                throw MalformedDocumentError("dangling reference to " + id);
            }
            if (!type.empty() && type != *full_type) {
                throw MalformedDocumentError("reference to " + id + " declares type " + type +
                                             " but the node is a " + *full_type);
            }
        }
        pending_references_.clear();
    }

    std::unordered_map<std::string, std::vector<Triple>> by_subject_;
    std::map<std::pair<std::string, std::string>, std::vector<Triple>> by_subject_predicate_;
    std::map<std::string, std::string> types_;
    std::map<std::string, std::set<std::string>> subjects_by_type_;
    std::vector<std::pair<std::string, std::string>> pending_references_;
    size_t num_triples_ = 0;
    size_t num_references_ = 0;
    size_t blank_counter_ = 0;
    std::set<std::string> document_ids_;
    std::vector<Triple> empty_;
};

} // namespace dats
