#pragma once

#include "schema/ColumnSchema.hpp"
#include "schema/ForeignKey.hpp"
#include <variant>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace conngraph {
namespace graph {

/**
 * Well-known property keys read by the engine
 */
namespace keys {
    constexpr const char* OutputSchema = "OutputSchema";
    constexpr const char* ExpectedSchema = "ExpectedSchema";
    constexpr const char* Columns = "Columns";
    constexpr const char* ForeignKeys = "ForeignKeys";
    constexpr const char* EntityName = "EntityName";
    constexpr const char* Kind = "Kind";
    constexpr const char* JoinKeyLeft = "JoinKeyLeft";
    constexpr const char* JoinKeyRight = "JoinKeyRight";
    constexpr const char* GroupBy = "GroupBy";
    constexpr const char* Aggregations = "Aggregations";
    constexpr const char* DerivedColumns = "DerivedColumns";
} // namespace keys

enum class PropertyType {
    Null,
    Int,
    Double,
    String,
    Bool,
    Schema,
    ForeignKeys
};

std::string propertyTypeToString(PropertyType type);

/**
 * Property value storage.
 * Structured metadata (schemas, foreign keys) is held typed; serialized
 * text is only accepted at read time for payloads coming from the host.
 */
using PropertyValue = std::variant<
    std::monostate,               // Null
    int64_t,                      // Int
    double,                       // Double
    std::string,                  // String
    bool,                         // Bool
    schema::ColumnSchema,         // Schema
    schema::ForeignKeyList        // ForeignKeys
>;

PropertyType typeOf(const PropertyValue& value);

/**
 * A named, typed node property
 */
struct Property {
    std::string name;
    PropertyType type = PropertyType::Null;
    PropertyValue defaultValue;
    PropertyValue currentValue;
    std::vector<std::string> choices;   // legal values when non-empty
    std::string description;

    /**
     * Current value, or the default when no current value is set
     */
    const PropertyValue& effectiveValue() const;
};

/**
 * String-keyed bag of node properties
 */
class PropertyBag {
public:
    PropertyBag() = default;

    /**
     * Declare (or redeclare) a property
     */
    void declare(Property property);

    /**
     * Set the current value of a property, declaring it if needed.
     * Throws std::invalid_argument if the property declares choices and
     * the value is not one of them.
     */
    void set(const std::string& name, PropertyValue value);
    void set(const std::string& name, const char* value);

    /**
     * Reset the current value to null (the default applies again)
     */
    void clear(const std::string& name);

    void remove(const std::string& name);

    bool has(const std::string& name) const;
    const Property* get(const std::string& name) const;
    std::vector<std::string> names() const;

    // === Typed accessors ===

    /**
     * Effective value as text. Scalars are converted, empty when absent
     * or when the value is structured.
     */
    std::optional<std::string> getString(const std::string& name) const;

    std::optional<bool> getBool(const std::string& name) const;

    /**
     * Schema stored typed or as serialized JSON text.
     * Malformed or blank text yields nullopt (logged).
     */
    std::optional<schema::ColumnSchema> getSchema(const std::string& name) const;

    /**
     * Foreign keys stored typed or as serialized JSON text.
     * Malformed text yields an empty list (logged).
     */
    schema::ForeignKeyList getForeignKeys(const std::string& name) const;

private:
    std::map<std::string, Property> m_properties;
};

} // namespace graph
} // namespace conngraph
