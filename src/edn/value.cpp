#include <algorithm>
#include <stdexcept>
#include <type_traits>

#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>

#include "value.hpp"

namespace datomic::edn
{

  const std::array<NamedCharacter, 4> namedCharacters = {{
      {"newline", "\n"},
      {"space", " "},
      {"tab", "\t"},
      {"return", "\r"},
  }};

  std::string typeToString(ValueType type)
  {
    std::string output;
    switch (type)
    {
    case EdnNil:
      output = "EdnNil";
      break;
    case EdnBool:
      output = "EdnBool";
      break;
    case EdnInt:
      output = "EdnInt";
      break;
    case EdnFloat:
      output = "EdnFloat";
      break;
    case EdnString:
      output = "EdnString";
      break;
    case EdnInstant:
      output = "EdnInstant";
      break;
    case EdnUuid:
      output = "EdnUuid";
      break;
    case EdnSequence:
      output = "EdnSequence";
      break;
    case EdnSet:
      output = "EdnSet";
      break;
    case EdnMap:
      output = "EdnMap";
      break;
    }
    return output;
  }

  bool Instant::operator==(const Instant &other) const
  {
    return time == other.time && isAware() == other.isAware();
  }

  Set::Set() = default;

  Set::Set(std::initializer_list<Value> values)
  {
    for (const Value &value : values)
      insert(value);
  }

  bool Set::insert(Value value)
  {
    std::size_t hash = hash_value(value);
    auto [first, last] = index.equal_range(hash);
    for (auto it = first; it != last; ++it)
    {
      if (items[it->second] == value)
        return false;
    }
    index.emplace(hash, items.size());
    items.push_back(std::move(value));
    return true;
  }

  bool Set::contains(const Value &value) const
  {
    auto [first, last] = index.equal_range(hash_value(value));
    return std::any_of(first, last, [&](const auto &slot)
                       { return items[slot.second] == value; });
  }

  std::size_t Set::size() const { return items.size(); }
  bool Set::empty() const { return items.empty(); }
  Set::const_iterator Set::begin() const { return items.begin(); }
  Set::const_iterator Set::end() const { return items.end(); }

  bool Set::operator==(const Set &other) const
  {
    if (size() != other.size())
      return false;
    return std::all_of(items.begin(), items.end(), [&other](const Value &value)
                       { return other.contains(value); });
  }

  Map::Map() = default;

  Map::Map(std::initializer_list<MapEntry> values)
  {
    for (const MapEntry &entry : values)
      insert(entry.key, entry.value);
  }

  void Map::insert(Value key, Value value)
  {
    std::size_t hash = hash_value(key);
    auto [first, last] = index.equal_range(hash);
    for (auto it = first; it != last; ++it)
    {
      MapEntry &entry = entries[it->second];
      if (entry.key == key)
      {
        entry.value = std::move(value);
        return;
      }
    }
    index.emplace(hash, entries.size());
    entries.push_back(MapEntry{std::move(key), std::move(value)});
  }

  const Value *Map::find(const Value &key) const
  {
    auto [first, last] = index.equal_range(hash_value(key));
    for (auto it = first; it != last; ++it)
    {
      const MapEntry &entry = entries[it->second];
      if (entry.key == key)
        return &entry.value;
    }
    return nullptr;
  }

  const Value &Map::at(const Value &key) const
  {
    const Value *value = find(key);
    if (!value)
    {
      if (key.is<std::string>())
        throw std::out_of_range(fmt::format("Map has no key {}", key.as<std::string>()));
      throw std::out_of_range(fmt::format("Map has no key of type {}", typeToString(key.type())));
    }
    return *value;
  }

  bool Map::contains(const Value &key) const { return find(key) != nullptr; }

  std::size_t Map::size() const { return entries.size(); }
  bool Map::empty() const { return entries.empty(); }
  Map::const_iterator Map::begin() const { return entries.begin(); }
  Map::const_iterator Map::end() const { return entries.end(); }

  bool Map::operator==(const Map &other) const
  {
    if (size() != other.size())
      return false;
    for (const MapEntry &entry : entries)
    {
      const Value *value = other.find(entry.key);
      if (!value || !(*value == entry.value))
        return false;
    }
    return true;
  }

  std::size_t hash_value(const Value &value)
  {
    std::size_t seed = value.variant().index();
    std::visit(
        [&seed](const auto &alternative)
        {
          using T = std::decay_t<decltype(alternative)>;
          if constexpr (std::is_same_v<T, Nil>)
          {
          }
          else if constexpr (std::is_same_v<T, double>)
          {
            // 0.0 and -0.0 compare equal
            boost::hash_combine(seed, alternative == 0 ? 0.0 : alternative);
          }
          else if constexpr (std::is_same_v<T, Instant>)
          {
            boost::hash_combine(seed, alternative.time.time_since_epoch().count());
            boost::hash_combine(seed, alternative.isAware());
          }
          else if constexpr (std::is_same_v<T, Sequence>)
          {
            for (const Value &item : alternative)
              boost::hash_combine(seed, hash_value(item));
          }
          else if constexpr (std::is_same_v<T, Set>)
          {
            std::size_t members = 0;
            for (const Value &item : alternative)
              members += hash_value(item);
            boost::hash_combine(seed, members);
          }
          else if constexpr (std::is_same_v<T, Map>)
          {
            std::size_t pairs = 0;
            for (const MapEntry &entry : alternative)
            {
              std::size_t pair = hash_value(entry.key);
              boost::hash_combine(pair, hash_value(entry.value));
              pairs += pair;
            }
            boost::hash_combine(seed, pairs);
          }
          else
          {
            boost::hash_combine(seed, alternative);
          }
        },
        value.variant());
    return seed;
  }
}
