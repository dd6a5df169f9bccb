#ifndef DATS_NODE_HPP
#define DATS_NODE_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace dats {

class Node;
class NodeStore;

/**
 * @brief Node types of the DATS vocabulary known to the converter and queries
 *
 * The set of type tags is open: any other tag maps to NodeKind::Other and is
 * carried verbatim by the node.
 */
enum class NodeKind {
    Dataset,
    Study,
    StudyGroup,
    Material,
    Dimension,
    Identifier,
    Annotation,
    ConsentInfo,
    RelatedIdentifier,
    DataType,
    Other
};

inline std::string node_kind_to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::Dataset: return "Dataset";
        case NodeKind::Study: return "Study";
        case NodeKind::StudyGroup: return "StudyGroup";
        case NodeKind::Material: return "Material";
        case NodeKind::Dimension: return "Dimension";
        case NodeKind::Identifier: return "Identifier";
        case NodeKind::Annotation: return "Annotation";
        case NodeKind::ConsentInfo: return "ConsentInfo";
        case NodeKind::RelatedIdentifier: return "RelatedIdentifier";
        case NodeKind::DataType: return "DataType";
        default: return "Other";
    }
}

inline NodeKind string_to_node_kind(const std::string& s) {
    if (s == "Dataset") return NodeKind::Dataset;
    if (s == "Study") return NodeKind::Study;
    if (s == "StudyGroup") return NodeKind::StudyGroup;
    if (s == "Material") return NodeKind::Material;
    if (s == "Dimension") return NodeKind::Dimension;
    if (s == "Identifier") return NodeKind::Identifier;
    if (s == "Annotation") return NodeKind::Annotation;
    if (s == "ConsentInfo") return NodeKind::ConsentInfo;
    if (s == "RelatedIdentifier") return NodeKind::RelatedIdentifier;
    if (s == "DataType") return NodeKind::DataType;
    return NodeKind::Other;
}

/**
 * @brief Stand-in for a node's identity
 *
 * Carries only what is needed to resolve the original node at load time.
 */
struct Reference {
    std::string id;
    std::string type;

    nlohmann::ordered_json to_json() const;

    bool operator==(const Reference& other) const {
        return id == other.id && type == other.type;
    }
};

/**
 * @brief A property value: JSON scalar, nested node, reference or list
 *
 * Nested nodes are owned by the NodeStore; a Value only points at them.
 * Lists are ordered unless built with Value::unordered(), in which case the
 * item order does not contribute to the owning node's identity.
 */
struct Value {
    enum class Kind { Literal, Node, Reference, List };

    Kind kind = Kind::Literal;
    nlohmann::ordered_json literal;        // Kind::Literal
    dats::Node* node = nullptr;            // Kind::Node
    dats::Reference reference;             // Kind::Reference
    std::vector<Value> items;              // Kind::List
    bool ordered = true;                   // Kind::List

    Value() = default;
    Value(const char* s) : literal(s) {}
    Value(const std::string& s) : literal(s) {}
    Value(int n) : literal(n) {}
    Value(std::size_t n) : literal(n) {}
    Value(double d) : literal(d) {}
    Value(bool b) : literal(b) {}
    Value(dats::Node* n) : kind(Kind::Node), node(n) {}
    Value(const dats::Reference& r) : kind(Kind::Reference), reference(r) {}
    Value(std::vector<Value> list) : kind(Kind::List), items(std::move(list)) {}

    static Value from_json(const nlohmann::ordered_json& scalar);
    static Value unordered(std::vector<Value> list);

    bool is_literal() const { return kind == Kind::Literal; }
    bool is_node() const { return kind == Kind::Node; }
    bool is_reference() const { return kind == Kind::Reference; }
    bool is_list() const { return kind == Kind::List; }

    /**
     * @brief String content of a string literal
     * @throws std::invalid_argument if the value is not a string literal
     */
    std::string as_string() const;
};

using Property = std::pair<std::string, Value>;
using PropertyList = std::vector<Property>;

/**
 * @brief A typed record with an ordered property list and a structural identity
 *
 * Nodes are only created through NodeStore::create, which assigns the
 * identity. The identity never changes afterwards, even when properties are
 * added with set() or append() while a graph is being assembled.
 */
class Node {
public:
    const std::string& type() const { return type_; }
    const std::string& id() const { return id_; }
    NodeKind kind() const { return string_to_node_kind(type_); }
    bool has_explicit_id() const { return explicit_id_; }

    const PropertyList& properties() const { return properties_; }

    /**
     * @brief Canonical content the identity was computed from
     */
    const std::string& fingerprint() const { return fingerprint_; }

    /**
     * @brief Find a property by name
     * @return Pointer to the first value with that name, or nullptr
     */
    const Value* find(const std::string& name) const;
    Value* find(const std::string& name);

    bool has(const std::string& name) const { return find(name) != nullptr; }

    /**
     * @brief Get a property by name
     * @throws MissingPropertyError if the node has no such property
     */
    const Value& get(const std::string& name) const;
    Value& get(const std::string& name);

    /**
     * @brief Replace the first property named @p name, or append it
     */
    void set(const std::string& name, Value value);

    /**
     * @brief Append an item to the list property @p name, creating the list if needed
     * @throws std::invalid_argument if the property exists and is not a list
     */
    void append(const std::string& name, Value item);

    Reference reference() const { return Reference{id_, type_}; }

private:
    friend class NodeStore;

    Node(std::string type, std::string id, bool explicit_id,
         PropertyList properties, std::string fingerprint)
        : type_(std::move(type)),
          id_(std::move(id)),
          explicit_id_(explicit_id),
          properties_(std::move(properties)),
          fingerprint_(std::move(fingerprint)) {}

    std::string type_;
    std::string id_;
    bool explicit_id_ = false;
    PropertyList properties_;
    std::string fingerprint_;
};

} // namespace dats

#endif // DATS_NODE_HPP
