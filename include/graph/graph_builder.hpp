#ifndef DATS_GRAPH_BUILDER_HPP
#define DATS_GRAPH_BUILDER_HPP

#include "graph/node.hpp"
#include <set>
#include <string>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace dats {

/**
 * @brief Emission counts for one build() pass
 */
struct BuildStatistics {
    size_t full_emissions = 0;
    size_t reference_emissions = 0;
    size_t literal_values = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Serializes a tree of store-owned nodes into a nested JSON-LD document
 *
 * Walks the root depth-first. The first occurrence of each identity is
 * emitted in full ("@id", "@type", then the properties in order); every
 * later occurrence, and every explicit Reference value, is emitted as
 * {"@id", "@type"}. Cycles through nested nodes terminate because a node is
 * marked as seen before its properties are visited.
 */
class GraphBuilder {
public:
    GraphBuilder() = default;

    /**
     * @brief Serialize the graph rooted at @p root
     * @throws IdentityError if a node has no identity
     * @throws MalformedDocumentError if a Reference value points at a node
     *         that is never emitted in full
     */
    nlohmann::ordered_json build(const Node& root);

    /**
     * @brief Build and write the document to @p filename
     */
    void export_to_json(const Node& root, const std::string& filename, int indent = 2);

    /**
     * @brief JSON-LD context emitted as "@context" on the root object (empty = none)
     */
    void set_context(const std::string& context) { context_ = context; }

    const BuildStatistics& statistics() const { return stats_; }

    /**
     * @brief Whether an identity has been emitted in full by the last build()
     */
    bool emitted(const std::string& id) const { return seen_.count(id) > 0; }

private:
    nlohmann::ordered_json emit_node(const Node& node);
    nlohmann::ordered_json emit_value(const Value& value);
    nlohmann::ordered_json emit_reference(const Reference& ref);

    std::unordered_set<std::string> seen_;
    std::set<std::string> referenced_;
    std::string context_;
    BuildStatistics stats_;
};

} // namespace dats

#endif // DATS_GRAPH_BUILDER_HPP
