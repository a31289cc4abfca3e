#include <stdexcept>

#include <boost/uuid/string_generator.hpp>
#include <fmt/format.h>

#include "datetime.hpp"
#include "exceptions.hpp"
#include "tags.hpp"

namespace datomic::edn
{

  std::optional<Value> handleInst(const Value &value, std::size_t position)
  {
    if (value.is<std::string>())
      return parseDatetime(value.as<std::string>(), position);
    return value;
  }

  std::optional<Value> handleUuid(const Value &value, std::size_t position)
  {
    if (!value.is<std::string>())
      return value;

    const std::string &text = value.as<std::string>();
    try
    {
      return boost::uuids::string_generator()(text);
    }
    catch (const std::runtime_error &)
    {
      throw EdnParseException(fmt::format("Invalid UUID: {} at position {}", text, position), position);
    }
  }

  std::optional<Value> handleDbFn(const Value &value, std::size_t)
  {
    return value;
  }

  std::optional<Value> handleDiscard(const Value &, std::size_t)
  {
    return std::nullopt;
  }

  TagRegistry TagRegistry::withDefaults()
  {
    TagRegistry registry;
    registry.registerHandler("inst", handleInst);
    registry.registerHandler("uuid", handleUuid);
    registry.registerHandler("db/fn", handleDbFn);
    registry.registerHandler("_", handleDiscard);
    return registry;
  }

  const TagRegistry &TagRegistry::defaultRegistry()
  {
    static const TagRegistry registry = withDefaults();
    return registry;
  }

  void TagRegistry::registerHandler(const std::string &tag, TagHandler handler)
  {
    handlers[tag] = std::move(handler);
  }

  void TagRegistry::unregisterHandler(const std::string &tag)
  {
    handlers.erase(tag);
  }

  const TagHandler *TagRegistry::getHandler(const std::string &tag) const
  {
    auto it = handlers.find(tag);
    if (it == handlers.end())
      return nullptr;
    return &it->second;
  }

  bool TagRegistry::isKnown(const std::string &tag) const
  {
    return handlers.count(tag) != 0;
  }

  std::set<std::string> TagRegistry::knownTags() const
  {
    std::set<std::string> tags;
    for (const auto &entry : handlers)
      tags.insert(entry.first);
    return tags;
  }
}
