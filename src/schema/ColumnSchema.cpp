#include "schema/ColumnSchema.hpp"
#include "schema/JsonFields.hpp"
#include "util/StringUtil.hpp"
#include <stdexcept>

namespace conngraph {
namespace schema {

bool ColumnDefinition::operator==(const ColumnDefinition& other) const {
    return id == other.id &&
           name == other.name &&
           dataType == other.dataType &&
           isPrimaryKey == other.isPrimaryKey &&
           isForeignKey == other.isForeignKey &&
           isNullable == other.isNullable &&
           defaultValue == other.defaultValue &&
           description == other.description;
}

// =============================================================================
// ColumnSchema
// =============================================================================

ColumnSchema::ColumnSchema(std::initializer_list<ColumnDefinition> columns) {
    for (const auto& column : columns) {
        add(column);
    }
}

RowId ColumnSchema::nextRowId() {
    RowId id;
    do {
        id = "col_" + std::to_string(m_nextId++);
    } while (findById(id) != nullptr);
    return id;
}

ColumnDefinition& ColumnSchema::add(ColumnDefinition column) {
    if (column.id.empty()) {
        column.id = nextRowId();
    } else if (findById(column.id) != nullptr) {
        throw std::invalid_argument("Duplicate column row id: " + column.id);
    }
    m_columns.push_back(std::move(column));
    return m_columns.back();
}

const ColumnDefinition* ColumnSchema::findByName(const std::string& name) const {
    for (const auto& column : m_columns) {
        if (util::iequals(column.name, name)) {
            return &column;
        }
    }
    return nullptr;
}

const ColumnDefinition* ColumnSchema::findById(const RowId& id) const {
    for (const auto& column : m_columns) {
        if (column.id == id) {
            return &column;
        }
    }
    return nullptr;
}

// =============================================================================
// Serialization
// =============================================================================

json ColumnSchema::columnToJson(const ColumnDefinition& column) {
    json j;
    j["id"] = column.id;
    j["name"] = column.name;
    j["dataType"] = column.dataType;
    j["isPrimaryKey"] = column.isPrimaryKey;
    j["isForeignKey"] = column.isForeignKey;
    j["isNullable"] = column.isNullable;
    if (!column.defaultValue.empty()) {
        j["defaultValue"] = column.defaultValue;
    }
    if (!column.description.empty()) {
        j["description"] = column.description;
    }
    return j;
}

ColumnDefinition ColumnSchema::jsonToColumn(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Invalid column: expected an object");
    }
    const json* name = findField(j, "name", "Name");
    if (!name || !name->is_string()) {
        throw std::runtime_error("Invalid column: missing 'name'");
    }

    ColumnDefinition column;
    column.id = stringField(j, "id", "Id", "");
    column.name = name->get<std::string>();
    column.dataType = stringField(j, "dataType", "DataType", "string");
    column.isPrimaryKey = boolField(j, "isPrimaryKey", "IsPrimaryKey", false);
    column.isForeignKey = boolField(j, "isForeignKey", "IsForeignKey", false);
    column.isNullable = boolField(j, "isNullable", "IsNullable", true);
    column.defaultValue = stringField(j, "defaultValue", "DefaultValue", "");
    column.description = stringField(j, "description", "Description", "");
    return column;
}

json ColumnSchema::toJson() const {
    json result = json::array();
    for (const auto& column : m_columns) {
        result.push_back(columnToJson(column));
    }
    return result;
}

std::string ColumnSchema::toString(int indent) const {
    return toJson().dump(indent);
}

ColumnSchema ColumnSchema::fromJson(const json& j) {
    if (!j.is_array()) {
        throw std::runtime_error("Invalid schema: expected a JSON array of columns");
    }
    ColumnSchema result;
    for (const auto& columnJson : j) {
        try {
            result.add(jsonToColumn(columnJson));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("Invalid schema: ") + e.what());
        }
    }
    return result;
}

ColumnSchema ColumnSchema::fromString(const std::string& str) {
    json j;
    try {
        j = json::parse(str);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid schema text: ") + e.what());
    }
    return fromJson(j);
}

// =============================================================================
// Compatibility
// =============================================================================

bool schemasCompatible(const ColumnSchema& expected, const ColumnSchema& actual) {
    for (const auto& e : expected.columns()) {
        const auto* a = actual.findByName(e.name);
        if (!a) return false;
        if (!e.dataType.empty() && !a->dataType.empty() &&
            !util::iequals(e.dataType, a->dataType)) {
            return false;
        }
    }
    return true;
}

bool SchemaDiff::hasDifferences() const {
    return !missingColumns.empty() || !typeDifferences.empty() ||
           !nullabilityDifferences.empty() || !defaultDifferences.empty();
}

SchemaDiff computeSchemaDiff(const ColumnSchema& expected, const ColumnSchema& actual) {
    SchemaDiff diff;

    for (const auto& e : expected.columns()) {
        if (util::trim(e.name).empty()) continue;

        const auto* a = actual.findByName(e.name);
        if (!a) {
            diff.missingColumns.push_back(e.name);
            continue;
        }

        if (!util::trim(e.dataType).empty() && !util::trim(a->dataType).empty() &&
            !util::iequals(e.dataType, a->dataType)) {
            diff.typeDifferences.push_back({e.name, e.dataType, a->dataType});
        }

        if (e.isNullable != a->isNullable) {
            diff.nullabilityDifferences.push_back({e.name, e.isNullable, a->isNullable});
        }

        if (e.defaultValue != a->defaultValue) {
            diff.defaultDifferences.push_back({e.name, e.defaultValue, a->defaultValue});
        }
    }

    return diff;
}

} // namespace schema
} // namespace conngraph
