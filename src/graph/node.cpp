#include "graph/node.hpp"
#include "graph/errors.hpp"
#include <stdexcept>

namespace dats {

// ==========================================
// Reference Implementation
// ==========================================

nlohmann::ordered_json Reference::to_json() const {
    nlohmann::ordered_json j;
    j["@id"] = id;
    j["@type"] = type;
    return j;
}

// ==========================================
// Value Implementation
// ==========================================

Value Value::from_json(const nlohmann::ordered_json& scalar) {
    if (scalar.is_object() || scalar.is_array()) {
        throw std::invalid_argument("literal value must be a JSON scalar: " + scalar.dump());
    }
    Value v;
    v.literal = scalar;
    return v;
}

Value Value::unordered(std::vector<Value> list) {
    Value v(std::move(list));
    v.ordered = false;
    return v;
}

std::string Value::as_string() const {
    if (kind != Kind::Literal || !literal.is_string()) {
        throw std::invalid_argument("value is not a string literal");
    }
    return literal.get<std::string>();
}

// ==========================================
// Node Implementation
// ==========================================

const Value* Node::find(const std::string& name) const {
    for (const auto& [key, value] : properties_) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

Value* Node::find(const std::string& name) {
    for (auto& [key, value] : properties_) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

const Value& Node::get(const std::string& name) const {
    const Value* value = find(name);
    if (!value) {
        throw MissingPropertyError(id_, name);
    }
    return *value;
}

Value& Node::get(const std::string& name) {
    Value* value = find(name);
    if (!value) {
        throw MissingPropertyError(id_, name);
    }
    return *value;
}

void Node::set(const std::string& name, Value value) {
    Value* existing = find(name);
    if (existing) {
        *existing = std::move(value);
    } else {
        properties_.emplace_back(name, std::move(value));
    }
}

void Node::append(const std::string& name, Value item) {
    Value* existing = find(name);
    if (!existing) {
        properties_.emplace_back(name, Value(std::vector<Value>{std::move(item)}));
        return;
    }
    if (!existing->is_list()) {
        throw std::invalid_argument("property '" + name + "' of node " + id_ + " is not a list");
    }
    existing->items.push_back(std::move(item));
}

} // namespace dats
