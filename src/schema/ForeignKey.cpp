#include "schema/ForeignKey.hpp"
#include "schema/JsonFields.hpp"
#include "util/StringUtil.hpp"
#include <stdexcept>

namespace conngraph {
namespace schema {

namespace {

std::vector<std::string> stringList(const json& j, const char* camel, const char* pascal) {
    std::vector<std::string> result;
    const json* list = findField(j, camel, pascal);
    if (!list || list->is_null()) return result;
    if (!list->is_array()) {
        throw std::runtime_error(std::string("Invalid foreign key: '") + camel + "' must be an array");
    }
    for (const auto& v : *list) {
        result.push_back(v.get<std::string>());
    }
    return result;
}

} // namespace

bool ForeignKeyDefinition::operator==(const ForeignKeyDefinition& other) const {
    return name == other.name &&
           columns == other.columns &&
           referencedEntity == other.referencedEntity &&
           referencedColumns == other.referencedColumns &&
           onDelete == other.onDelete &&
           onUpdate == other.onUpdate;
}

bool ForeignKeyDefinition::maps(const std::string& localColumn,
                                const std::string& entity,
                                const std::string& referencedColumn) const {
    if (!util::iequals(referencedEntity, entity)) return false;

    for (size_t i = 0; i < columns.size() && i < referencedColumns.size(); ++i) {
        if (util::iequals(columns[i], localColumn) &&
            util::iequals(referencedColumns[i], referencedColumn)) {
            return true;
        }
    }
    return false;
}

json foreignKeyToJson(const ForeignKeyDefinition& fk) {
    json j;
    j["name"] = fk.name;
    j["columns"] = fk.columns;
    j["referencedEntity"] = fk.referencedEntity;
    j["referencedColumns"] = fk.referencedColumns;
    j["onDelete"] = fk.onDelete;
    j["onUpdate"] = fk.onUpdate;
    return j;
}

ForeignKeyDefinition jsonToForeignKey(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Invalid foreign key: expected an object");
    }
    ForeignKeyDefinition fk;
    fk.name = stringField(j, "name", "Name", "");
    fk.columns = stringList(j, "columns", "Columns");
    fk.referencedEntity = stringField(j, "referencedEntity", "ReferencedEntity", "");
    fk.referencedColumns = stringList(j, "referencedColumns", "ReferencedColumns");
    fk.onDelete = stringField(j, "onDelete", "OnDelete", "");
    fk.onUpdate = stringField(j, "onUpdate", "OnUpdate", "");
    return fk;
}

json foreignKeysToJson(const ForeignKeyList& fks) {
    json result = json::array();
    for (const auto& fk : fks) {
        result.push_back(foreignKeyToJson(fk));
    }
    return result;
}

ForeignKeyList foreignKeysFromJson(const json& j) {
    if (!j.is_array()) {
        throw std::runtime_error("Invalid foreign keys: expected a JSON array");
    }
    ForeignKeyList result;
    for (const auto& fkJson : j) {
        result.push_back(jsonToForeignKey(fkJson));
    }
    return result;
}

ForeignKeyList foreignKeysFromString(const std::string& str) {
    json j;
    try {
        j = json::parse(str);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid foreign keys text: ") + e.what());
    }
    return foreignKeysFromJson(j);
}

} // namespace schema
} // namespace conngraph
