#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "edn/value.hpp"

namespace datomic::schema
{

  constexpr std::string_view cardinalityOne = ":db.cardinality/one";
  constexpr std::string_view cardinalityMany = ":db.cardinality/many";

  constexpr std::string_view uniqueIdentity = ":db.unique/identity";
  constexpr std::string_view uniqueValue = ":db.unique/value";

  constexpr std::string_view typeString = ":db.type/string";
  constexpr std::string_view typeBoolean = ":db.type/boolean";
  constexpr std::string_view typeLong = ":db.type/long";
  constexpr std::string_view typeBigint = ":db.type/bigint";
  constexpr std::string_view typeFloat = ":db.type/float";
  constexpr std::string_view typeDouble = ":db.type/double";
  constexpr std::string_view typeBigdec = ":db.type/bigdec";
  constexpr std::string_view typeInstant = ":db.type/instant";
  constexpr std::string_view typeUuid = ":db.type/uuid";
  constexpr std::string_view typeUri = ":db.type/uri";
  constexpr std::string_view typeKeyword = ":db.type/keyword";
  constexpr std::string_view typeRef = ":db.type/ref";
  constexpr std::string_view typeBytes = ":db.type/bytes";

  // One schema attribute. Optional settings are only emitted when they
  // differ from the database defaults.
  struct Attribute
  {
    std::string ident;
    std::string valueType;
    std::optional<std::string> doc;
    std::string cardinality = std::string(cardinalityOne);
    std::optional<std::string> unique;
    bool index = false;
    bool fulltext = false;
    bool noHistory = false;
  };

  // Throws std::invalid_argument when ident, valueType, cardinality or
  // unique is not a keyword.
  edn::Map attributeValue(const Attribute &attribute);

  // EDN text of attributeValue(), ready to be sent as transaction data.
  std::string attribute(const Attribute &attribute);

  // EDN vector of attribute maps.
  std::string schema(const std::vector<Attribute> &attributes);
}
