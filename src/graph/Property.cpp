#include "graph/Property.hpp"
#include "util/Logger.hpp"
#include "util/StringUtil.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace conngraph {
namespace graph {

std::string propertyTypeToString(PropertyType type) {
    switch (type) {
        case PropertyType::Null:        return "null";
        case PropertyType::Int:         return "int";
        case PropertyType::Double:      return "double";
        case PropertyType::String:      return "string";
        case PropertyType::Bool:        return "bool";
        case PropertyType::Schema:      return "schema";
        case PropertyType::ForeignKeys: return "foreign_keys";
    }
    return "unknown";
}

PropertyType typeOf(const PropertyValue& value) {
    switch (value.index()) {
        case 0: return PropertyType::Null;
        case 1: return PropertyType::Int;
        case 2: return PropertyType::Double;
        case 3: return PropertyType::String;
        case 4: return PropertyType::Bool;
        case 5: return PropertyType::Schema;
        case 6: return PropertyType::ForeignKeys;
    }
    return PropertyType::Null;
}

const PropertyValue& Property::effectiveValue() const {
    if (std::holds_alternative<std::monostate>(currentValue)) {
        return defaultValue;
    }
    return currentValue;
}

// =============================================================================
// PropertyBag
// =============================================================================

void PropertyBag::declare(Property property) {
    std::string name = property.name;
    if (property.type == PropertyType::Null) {
        property.type = typeOf(property.defaultValue);
    }
    m_properties[name] = std::move(property);
}

void PropertyBag::set(const std::string& name, PropertyValue value) {
    auto it = m_properties.find(name);
    if (it == m_properties.end()) {
        Property property;
        property.name = name;
        property.type = typeOf(value);
        property.currentValue = std::move(value);
        m_properties[name] = std::move(property);
        return;
    }

    Property& property = it->second;
    if (!property.choices.empty() && std::holds_alternative<std::string>(value)) {
        const auto& text = std::get<std::string>(value);
        bool legal = std::any_of(property.choices.begin(), property.choices.end(),
            [&text](const std::string& choice) { return util::iequals(choice, text); });
        if (!legal) {
            throw std::invalid_argument("Value '" + text + "' is not a legal choice for property " + name);
        }
    }
    if (property.type == PropertyType::Null) {
        property.type = typeOf(value);
    }
    property.currentValue = std::move(value);
}

void PropertyBag::set(const std::string& name, const char* value) {
    set(name, PropertyValue(std::string(value)));
}

void PropertyBag::clear(const std::string& name) {
    auto it = m_properties.find(name);
    if (it != m_properties.end()) {
        it->second.currentValue = std::monostate{};
    }
}

void PropertyBag::remove(const std::string& name) {
    m_properties.erase(name);
}

bool PropertyBag::has(const std::string& name) const {
    return m_properties.count(name) > 0;
}

const Property* PropertyBag::get(const std::string& name) const {
    auto it = m_properties.find(name);
    return it != m_properties.end() ? &it->second : nullptr;
}

std::vector<std::string> PropertyBag::names() const {
    std::vector<std::string> result;
    result.reserve(m_properties.size());
    for (const auto& [name, property] : m_properties) {
        result.push_back(name);
    }
    return result;
}

// =============================================================================
// Typed accessors
// =============================================================================

std::optional<std::string> PropertyBag::getString(const std::string& name) const {
    const auto* property = get(name);
    if (!property) return std::nullopt;

    const auto& value = property->effectiveValue();
    switch (typeOf(value)) {
        case PropertyType::String:
            return std::get<std::string>(value);
        case PropertyType::Int:
            return std::to_string(std::get<int64_t>(value));
        case PropertyType::Double: {
            std::ostringstream oss;
            oss << std::get<double>(value);
            return oss.str();
        }
        case PropertyType::Bool:
            return std::string(std::get<bool>(value) ? "true" : "false");
        default:
            return std::nullopt;
    }
}

std::optional<bool> PropertyBag::getBool(const std::string& name) const {
    const auto* property = get(name);
    if (!property) return std::nullopt;

    const auto& value = property->effectiveValue();
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value);
    }
    if (std::holds_alternative<std::string>(value)) {
        const auto& text = std::get<std::string>(value);
        if (util::iequals(text, "true")) return true;
        if (util::iequals(text, "false")) return false;
    }
    return std::nullopt;
}

std::optional<schema::ColumnSchema> PropertyBag::getSchema(const std::string& name) const {
    const auto* property = get(name);
    if (!property) return std::nullopt;

    const auto& value = property->effectiveValue();
    if (std::holds_alternative<schema::ColumnSchema>(value)) {
        return std::get<schema::ColumnSchema>(value);
    }
    if (std::holds_alternative<std::string>(value)) {
        const auto& text = std::get<std::string>(value);
        if (util::trim(text).empty()) return std::nullopt;
        try {
            return schema::ColumnSchema::fromString(text);
        } catch (const std::runtime_error& e) {
            CG_LOG_WARN("Ignoring malformed schema in property " + name + ": " + e.what());
        } catch (const nlohmann::json::exception& e) {
            CG_LOG_WARN("Ignoring malformed schema in property " + name + ": " + e.what());
        }
    } else if (!std::holds_alternative<std::monostate>(value)) {
        CG_LOG_WARN("Property " + name + " holds a value of type " + propertyTypeToString(typeOf(value)) +
                    ", not a schema");
    }
    return std::nullopt;
}

schema::ForeignKeyList PropertyBag::getForeignKeys(const std::string& name) const {
    const auto* property = get(name);
    if (!property) return {};

    const auto& value = property->effectiveValue();
    if (std::holds_alternative<schema::ForeignKeyList>(value)) {
        return std::get<schema::ForeignKeyList>(value);
    }
    if (std::holds_alternative<std::string>(value)) {
        const auto& text = std::get<std::string>(value);
        if (util::trim(text).empty()) return {};
        try {
            return schema::foreignKeysFromString(text);
        } catch (const std::runtime_error& e) {
            CG_LOG_WARN("Ignoring malformed foreign keys in property " + name + ": " + e.what());
        } catch (const nlohmann::json::exception& e) {
            CG_LOG_WARN("Ignoring malformed foreign keys in property " + name + ": " + e.what());
        }
    } else if (!std::holds_alternative<std::monostate>(value)) {
        CG_LOG_WARN("Property " + name + " holds a value of type " + propertyTypeToString(typeOf(value)) +
                    ", not a foreign key list");
    }
    return {};
}

} // namespace graph
} // namespace conngraph
