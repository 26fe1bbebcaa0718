#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace conngraph {
namespace schema {

using json = nlohmann::json;

/**
 * Identifier of a column row inside an entity's column list.
 * Ports of tabular nodes carry the same id to address a single column.
 */
using RowId = std::string;

/**
 * Single column/attribute of an ERD entity or of an ETL schema
 */
struct ColumnDefinition {
    RowId id;
    std::string name;
    std::string dataType = "string";   // free-form: int, string, datetime...
    bool isPrimaryKey = false;
    bool isForeignKey = false;
    bool isNullable = true;
    std::string defaultValue;
    std::string description;

    ColumnDefinition() = default;
    ColumnDefinition(std::string n, std::string type)
        : name(std::move(n)), dataType(std::move(type)) {}

    bool operator==(const ColumnDefinition& other) const;
    bool operator!=(const ColumnDefinition& other) const { return !(*this == other); }
};

/**
 * Ordered list of named, typed columns describing data flowing along an edge
 * or the columns of an entity.
 *
 * JSON format:
 * [
 *   {"name": "Id", "dataType": "int", "isPrimaryKey": true,
 *    "isForeignKey": false, "isNullable": false}
 * ]
 * Optional fields: "id", "defaultValue", "description".
 */
class ColumnSchema {
public:
    ColumnSchema() = default;
    ColumnSchema(std::initializer_list<ColumnDefinition> columns);

    // === Columns ===

    /**
     * Append a column. Assigns a row id when the column has none.
     * Throws std::invalid_argument if the id is already used in this schema.
     */
    ColumnDefinition& add(ColumnDefinition column);

    /**
     * Case-insensitive lookup by name, nullptr if absent
     */
    const ColumnDefinition* findByName(const std::string& name) const;

    /**
     * Lookup by row id, nullptr if absent
     */
    const ColumnDefinition* findById(const RowId& id) const;

    const std::vector<ColumnDefinition>& columns() const { return m_columns; }
    size_t size() const { return m_columns.size(); }
    bool empty() const { return m_columns.empty(); }

    bool operator==(const ColumnSchema& other) const { return m_columns == other.m_columns; }
    bool operator!=(const ColumnSchema& other) const { return !(*this == other); }

    // === Serialization ===

    json toJson() const;
    std::string toString(int indent = -1) const;

    /**
     * Parse a schema payload.
     * Throws std::runtime_error on a non-array payload or a nameless column.
     */
    static ColumnSchema fromJson(const json& j);
    static ColumnSchema fromString(const std::string& str);

    static json columnToJson(const ColumnDefinition& column);
    static ColumnDefinition jsonToColumn(const json& j);

private:
    RowId nextRowId();

    std::vector<ColumnDefinition> m_columns;
    uint64_t m_nextId = 1;
};

/**
 * True iff every expected column exists in actual (case-insensitive name)
 * and, when both declare a data type, the types match case-insensitively.
 */
bool schemasCompatible(const ColumnSchema& expected, const ColumnSchema& actual);

/**
 * Structured diff between an expected and an actual schema
 */
struct SchemaDiff {
    struct TypeDifference {
        std::string name;
        std::string expectedType;
        std::string actualType;
    };

    struct NullabilityDifference {
        std::string name;
        bool expectedNullable;
        bool actualNullable;
    };

    struct DefaultDifference {
        std::string name;
        std::string expectedDefault;
        std::string actualDefault;
    };

    std::vector<std::string> missingColumns;
    std::vector<TypeDifference> typeDifferences;
    std::vector<NullabilityDifference> nullabilityDifferences;
    std::vector<DefaultDifference> defaultDifferences;

    bool hasDifferences() const;
};

SchemaDiff computeSchemaDiff(const ColumnSchema& expected, const ColumnSchema& actual);

} // namespace schema
} // namespace conngraph
