#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>

#include "value.hpp"

namespace datomic::edn
{

  // Receives the decoded payload of "#tag payload" and the offset of the
  // '#'. Returning nullopt drops the tagged form from its enclosing
  // collection.
  using TagHandler = std::function<std::optional<Value>(const Value &value, std::size_t position)>;

  class TagRegistry
  {
  public:
    // An empty registry; every tag is unknown.
    TagRegistry() = default;

    // A registry holding the inst, uuid, db/fn and _ handlers.
    static TagRegistry withDefaults();

    // Shared, immutable instance of withDefaults(). Used by the reader when
    // no registry is given.
    static const TagRegistry &defaultRegistry();

    void registerHandler(const std::string &tag, TagHandler handler);
    void unregisterHandler(const std::string &tag);

    // nullptr when tag is not registered
    const TagHandler *getHandler(const std::string &tag) const;
    bool isKnown(const std::string &tag) const;
    std::set<std::string> knownTags() const;

  private:
    std::map<std::string, TagHandler> handlers;
  };

  std::optional<Value> handleInst(const Value &value, std::size_t position);
  std::optional<Value> handleUuid(const Value &value, std::size_t position);
  std::optional<Value> handleDbFn(const Value &value, std::size_t position);
  std::optional<Value> handleDiscard(const Value &value, std::size_t position);
}
