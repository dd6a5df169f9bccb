#ifndef DATS_ERRORS_HPP
#define DATS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace dats {

/**
 * @brief Base class for structural errors in the node store, builder and index
 *
 * Structural errors are never recovered locally: they abort the conversion
 * or load that raised them.
 */
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Two contents claim one identity, or no identity can be derived
 */
class IdentityError : public GraphError {
public:
    explicit IdentityError(const std::string& message)
        : GraphError(message) {}
};

/**
 * @brief Access by name to a property the node does not carry
 */
class MissingPropertyError : public GraphError {
public:
    MissingPropertyError(const std::string& node_id, const std::string& property)
        : GraphError("missing property '" + property + "' on node " + node_id),
          property_(property) {}

    const std::string& property() const { return property_; }

private:
    std::string property_;
};

/**
 * @brief A serialized document that cannot be indexed consistently
 */
class MalformedDocumentError : public GraphError {
public:
    explicit MalformedDocumentError(const std::string& message)
        : GraphError(message) {}
};

} // namespace dats

#endif // DATS_ERRORS_HPP
