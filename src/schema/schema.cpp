#include <stdexcept>

#include <fmt/format.h>

#include "../edn/edn.hpp"
#include "schema.hpp"

namespace datomic::schema
{

  static void requireKeyword(const char *field, const std::string &value)
  {
    if (value.size() < 2 || value[0] != ':')
      throw std::invalid_argument(fmt::format("Attribute {} must be a keyword, got '{}'", field, value));
  }

  edn::Map attributeValue(const Attribute &attribute)
  {
    requireKeyword("ident", attribute.ident);
    requireKeyword("valueType", attribute.valueType);
    requireKeyword("cardinality", attribute.cardinality);

    edn::Map result;
    result.insert(":db/ident", attribute.ident);
    result.insert(":db/valueType", attribute.valueType);
    result.insert(":db/cardinality", attribute.cardinality);
    if (attribute.doc)
      result.insert(":db/doc", *attribute.doc);
    if (attribute.unique)
    {
      requireKeyword("unique", *attribute.unique);
      result.insert(":db/unique", *attribute.unique);
    }
    if (attribute.index)
      result.insert(":db/index", true);
    if (attribute.fulltext)
      result.insert(":db/fulltext", true);
    if (attribute.noHistory)
      result.insert(":db/noHistory", true);
    return result;
  }

  // Like edn::write of the attribute map, except that the doc is always a
  // string literal; a doc starting with ':' would otherwise become a keyword.
  std::string attribute(const Attribute &attribute)
  {
    std::string vals;
    for (const edn::MapEntry &entry : attributeValue(attribute))
    {
      if (!vals.empty())
        vals += " ";
      vals += edn::write(entry.key) + " ";
      if (entry.key.as<std::string>() == ":db/doc")
        vals += edn::writeQuoted(entry.value.as<std::string>());
      else
        vals += edn::write(entry.value);
    }
    return "{" + vals + "}";
  }

  std::string schema(const std::vector<Attribute> &attributes)
  {
    std::string vals;
    for (const Attribute &definition : attributes)
    {
      if (!vals.empty())
        vals += " ";
      vals += attribute(definition);
    }
    return "[" + vals + "]";
  }
}
