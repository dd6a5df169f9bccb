#include "graph/node_store.hpp"
#include "graph/errors.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace dats {

namespace {

const char* const kExplicitIdKey = "@id";

// Splits an explicit "@id" out of the property list.
std::string extract_explicit_id(const std::string& type, PropertyList& properties) {
    std::string explicit_id;
    bool found = false;

    auto it = properties.begin();
    while (it != properties.end()) {
        if (it->first != kExplicitIdKey) {
            ++it;
            continue;
        }
        const Value& v = it->second;
        if (!v.is_literal() || !v.literal.is_string() || v.literal.get<std::string>().empty()) {
            throw IdentityError("explicit identifier of " + type + " node must be a non-empty string");
        }
        std::string id = v.literal.get<std::string>();
        if (found && id != explicit_id) {
            throw IdentityError("node of type " + type + " declares two identifiers: " +
                                explicit_id + " and " + id);
        }
        explicit_id = id;
        found = true;
        it = properties.erase(it);
    }

    return explicit_id;
}

bool holds_null_node(const Value& value) {
    if (value.is_node()) return value.node == nullptr;
    if (value.is_list()) {
        for (const auto& item : value.items) {
            if (holds_null_node(item)) return true;
        }
    }
    return false;
}

} // namespace

// ==========================================
// StoreStatistics Implementation
// ==========================================

nlohmann::json StoreStatistics::to_json() const {
    nlohmann::json j;
    j["nodes_created"] = nodes_created;
    j["nodes_reused"] = nodes_reused;
    j["back_links_added"] = back_links_added;
    j["back_links_suppressed"] = back_links_suppressed;
    return j;
}

// ==========================================
// Node Construction
// ==========================================

Node* NodeStore::create(const std::string& type, PropertyList properties) {
    if (type.empty()) {
        throw IdentityError("cannot create a node without a type tag");
    }

    std::string explicit_id = extract_explicit_id(type, properties);

    if (properties.empty()) {
        if (explicit_id.empty()) {
            throw IdentityError("cannot derive an identity for " + type + " node with no properties");
        }
        throw IdentityError("node " + explicit_id + " has no content besides its identifier");
    }

    std::unordered_set<std::string> names;
    for (const auto& [name, value] : properties) {
        if (name.empty() || name[0] == '@') {
            throw IdentityError("reserved or empty property name '" + name + "' on " + type + " node");
        }
        if (!names.insert(name).second) {
            throw IdentityError("duplicate property '" + name + "' on " + type + " node");
        }
        if (holds_null_node(value)) {
            throw IdentityError("property '" + name + "' of " + type + " node holds a null node");
        }
    }

    std::string canonical = canonical_content(type, properties);
    bool is_explicit = !explicit_id.empty();
    std::string id = is_explicit ? explicit_id : derive_identity(type, canonical);

    auto it = by_id_.find(id);
    if (it != by_id_.end()) {
        Node* existing = it->second;
        if (existing->fingerprint() != canonical) {
            if (is_explicit || existing->has_explicit_id()) {
                throw IdentityError("conflicting content for identifier " + id);
            }
            throw IdentityError("fingerprint collision on derived identifier " + id);
        }
        // First writer wins: the new property list is discarded
        stats_.nodes_reused++;
        return existing;
    }

    std::unique_ptr<Node> node(new Node(type, id, is_explicit, std::move(properties), std::move(canonical)));
    Node* raw = node.get();
    nodes_.push_back(std::move(node));
    by_id_[id] = raw;
    stats_.nodes_created++;

    return raw;
}

Reference NodeStore::reference(const Node* node) const {
    if (!node) {
        throw IdentityError("cannot reference a null node");
    }
    return node->reference();
}

bool NodeStore::link_back(Node* node, const std::string& slot, const Node* target,
                          const std::string& qualifier) {
    if (!allow_back_links_) {
        stats_.back_links_suppressed++;
        return false;
    }
    if (!node || !target) {
        throw IdentityError("back-link endpoints must not be null");
    }

    if (qualifier.empty()) {
        node->append(slot, reference(target));
    } else {
        Node* dimension = create(NodeKind::Dimension, {
            {"name", qualifier},
            {"values", std::vector<Value>{reference(target)}}
        });
        node->append(slot, dimension);
    }

    stats_.back_links_added++;
    return true;
}

// ==========================================
// Lookup
// ==========================================

Node* NodeStore::find(const std::string& id) const {
    auto it = by_id_.find(id);
    return it != by_id_.end() ? it->second : nullptr;
}

// ==========================================
// Identity Computation
// ==========================================

std::string NodeStore::canonical_value(const Value& value) {
    switch (value.kind) {
        case Value::Kind::Literal:
            return value.literal.dump();
        case Value::Kind::Node:
            // A nested node and a reference to it are the same edge
            return "<" + nlohmann::json(value.node->id()).dump() + ">";
        case Value::Kind::Reference:
            return "<" + nlohmann::json(value.reference.id).dump() + ">";
        case Value::Kind::List: {
            std::vector<std::string> parts;
            parts.reserve(value.items.size());
            for (const auto& item : value.items) {
                parts.push_back(canonical_value(item));
            }
            if (!value.ordered) {
                std::sort(parts.begin(), parts.end());
            }
            std::string out = value.ordered ? "[" : "{";
            for (size_t i = 0; i < parts.size(); ++i) {
                if (i > 0) out += ",";
                out += parts[i];
            }
            out += value.ordered ? "]" : "}";
            return out;
        }
    }
    return "";
}

std::string NodeStore::canonical_content(const std::string& type, const PropertyList& properties) {
    std::vector<std::pair<std::string, std::string>> entries;
    entries.reserve(properties.size());
    for (const auto& [name, value] : properties) {
        if (name == kExplicitIdKey) continue;
        entries.emplace_back(nlohmann::json(name).dump(), canonical_value(value));
    }
    std::sort(entries.begin(), entries.end());

    std::string out = nlohmann::json(type).dump() + "{";
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) out += ";";
        out += entries[i].first + "=" + entries[i].second;
    }
    out += "}";
    return out;
}

std::string NodeStore::derive_identity(const std::string& type, const std::string& canonical) {
    std::stringstream ss;
    ss << "_:" << type << "-" << std::hex << std::setw(16) << std::setfill('0') << fnv1a_64(canonical);
    return ss.str();
}

uint64_t NodeStore::fnv1a_64(const std::string& data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace dats
