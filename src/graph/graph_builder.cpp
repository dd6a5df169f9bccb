#include "graph/graph_builder.hpp"
#include "graph/errors.hpp"
#include <fstream>

namespace dats {

using json = nlohmann::ordered_json;

nlohmann::json BuildStatistics::to_json() const {
    nlohmann::json j;
    j["full_emissions"] = full_emissions;
    j["reference_emissions"] = reference_emissions;
    j["literal_values"] = literal_values;
    return j;
}

json GraphBuilder::build(const Node& root) {
    seen_.clear();
    referenced_.clear();
    stats_ = BuildStatistics{};

    json doc = emit_node(root);

    if (!context_.empty()) {
        json with_context;
        with_context["@context"] = context_;
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            with_context[it.key()] = it.value();
        }
        doc = std::move(with_context);
    }

    // Every reference must resolve to a full emission somewhere in this document
    for (const auto& id : referenced_) {
        if (seen_.count(id) == 0) {
            throw MalformedDocumentError("dangling reference to " + id +
                                         ": node is never emitted in full");
        }
    }

    return doc;
}

void GraphBuilder::export_to_json(const Node& root, const std::string& filename, int indent) {
    json doc = build(root);

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << doc.dump(indent);
    file.close();
}

json GraphBuilder::emit_node(const Node& node) {
    if (node.id().empty()) {
        throw IdentityError("cannot serialize a " + node.type() + " node without an identity");
    }

    if (seen_.count(node.id()) > 0) {
        return emit_reference(node.reference());
    }
    seen_.insert(node.id());
    stats_.full_emissions++;

    json j;
    j["@id"] = node.id();
    j["@type"] = node.type();
    for (const auto& [name, value] : node.properties()) {
        j[name] = emit_value(value);
    }
    return j;
}

json GraphBuilder::emit_value(const Value& value) {
    switch (value.kind) {
        case Value::Kind::Literal:
            stats_.literal_values++;
            return value.literal;
        case Value::Kind::Node:
            return emit_node(*value.node);
        case Value::Kind::Reference:
            return emit_reference(value.reference);
        case Value::Kind::List: {
            json arr = json::array();
            for (const auto& item : value.items) {
                arr.push_back(emit_value(item));
            }
            return arr;
        }
    }
    return json();
}

json GraphBuilder::emit_reference(const Reference& ref) {
    referenced_.insert(ref.id);
    stats_.reference_emissions++;
    return ref.to_json();
}

} // namespace dats
