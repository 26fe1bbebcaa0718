#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace conngraph {
namespace schema {

using json = nlohmann::json;

/**
 * Foreign key constraint from one ERD entity to another.
 * columns[i] references referencedColumns[i] (order matters for composites).
 */
struct ForeignKeyDefinition {
    std::string name;
    std::vector<std::string> columns;
    std::string referencedEntity;
    std::vector<std::string> referencedColumns;
    std::string onDelete;   // NO ACTION, CASCADE, SET NULL... free-form
    std::string onUpdate;

    bool operator==(const ForeignKeyDefinition& other) const;
    bool operator!=(const ForeignKeyDefinition& other) const { return !(*this == other); }

    /**
     * True if this key maps localColumn to referencedColumn of entity at the
     * same position. Names compare case-insensitively.
     */
    bool maps(const std::string& localColumn,
              const std::string& entity,
              const std::string& referencedColumn) const;
};

using ForeignKeyList = std::vector<ForeignKeyDefinition>;

/**
 * JSON format:
 * {"name": "fk1", "columns": ["CustomerId"], "referencedEntity": "Customer",
 *  "referencedColumns": ["Id"], "onDelete": "CASCADE", "onUpdate": ""}
 */
json foreignKeyToJson(const ForeignKeyDefinition& fk);
ForeignKeyDefinition jsonToForeignKey(const json& j);

json foreignKeysToJson(const ForeignKeyList& fks);

/**
 * Throws std::runtime_error on malformed payloads
 */
ForeignKeyList foreignKeysFromJson(const json& j);
ForeignKeyList foreignKeysFromString(const std::string& str);

} // namespace schema
} // namespace conngraph
