#ifndef DATS_NODE_STORE_HPP
#define DATS_NODE_STORE_HPP

#include "graph/node.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace dats {

/**
 * @brief Counters kept by a NodeStore over one conversion run
 */
struct StoreStatistics {
    size_t nodes_created = 0;
    size_t nodes_reused = 0;          // create() calls answered with an existing node
    size_t back_links_added = 0;
    size_t back_links_suppressed = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Owner of every canonical Node built during one conversion run
 *
 * The store maps structural identity to the single canonical Node for that
 * identity. It is created by the orchestrating caller at the start of a
 * conversion, passed by reference into every construction call, and
 * discarded after serialization.
 *
 * Identity rules:
 * - an explicit "@id" string property always wins over a derived fingerprint;
 * - otherwise the identity is derived from the type and the canonical
 *   content (properties sorted by name, unordered lists sorted, nested
 *   nodes and references represented by their identity);
 * - a second create() with the same identity returns the first node and
 *   discards the new properties, provided the canonical content agrees;
 *   divergent content under one identity is an IdentityError.
 */
class NodeStore {
public:
    explicit NodeStore(bool allow_back_links = true)
        : allow_back_links_(allow_back_links) {}

    NodeStore(const NodeStore&) = delete;
    NodeStore& operator=(const NodeStore&) = delete;

    // ==========================================
    // Node Construction
    // ==========================================

    /**
     * @brief Construct or retrieve the canonical node for (type, properties)
     * @param type Type tag (must not be empty)
     * @param properties Ordered properties; an "@id" string property makes
     *        the identity explicit and is not kept as an ordinary property
     * @return The canonical node, owned by this store
     * @throws IdentityError on conflicting content or an underivable identity
     */
    Node* create(const std::string& type, PropertyList properties);

    Node* create(NodeKind kind, PropertyList properties) {
        return create(node_kind_to_string(kind), std::move(properties));
    }

    /**
     * @brief Reference value for a node's identity
     */
    Reference reference(const Node* node) const;

    /**
     * @brief Add a back-link from @p node to @p target
     *
     * With an empty @p qualifier the target's Reference is appended to the
     * list property @p slot. Otherwise a Dimension
     * {name: qualifier, values: [Reference(target)]} is created through this
     * store and appended instead.
     *
     * @return true if a link was added, false when back-links are disabled
     */
    bool link_back(Node* node, const std::string& slot, const Node* target,
                   const std::string& qualifier = "");

    // ==========================================
    // Lookup
    // ==========================================

    Node* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    size_t size() const { return nodes_.size(); }
    bool back_links_enabled() const { return allow_back_links_; }
    const StoreStatistics& statistics() const { return stats_; }

    // ==========================================
    // Identity Computation
    // ==========================================

    /**
     * @brief Canonical, order-normalised text of a node's content
     *
     * Pure function of type and properties; "@id" properties are ignored.
     */
    static std::string canonical_content(const std::string& type, const PropertyList& properties);

    /**
     * @brief Canonical text of a single value
     */
    static std::string canonical_value(const Value& value);

    /**
     * @brief Derived identity for canonical content: "_:<Type>-<16 hex digits>"
     */
    static std::string derive_identity(const std::string& type, const std::string& canonical);

    /**
     * @brief 64-bit FNV-1a hash
     */
    static uint64_t fnv1a_64(const std::string& data);

private:
    std::vector<std::unique_ptr<Node>> nodes_;
    std::unordered_map<std::string, Node*> by_id_;
    bool allow_back_links_ = true;
    StoreStatistics stats_;
};

} // namespace dats

#endif // DATS_NODE_STORE_HPP
