#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/unordered_map.hpp>
#include <boost/uuid/uuid.hpp>

namespace datomic::edn
{

  // Order matches the alternatives of Value::Variant.
  enum ValueType
  {
    EdnNil,
    EdnBool,
    EdnInt,
    EdnFloat,
    EdnString,
    EdnInstant,
    EdnUuid,
    EdnSequence,
    EdnSet,
    EdnMap
  };

  std::string typeToString(ValueType type);

  class Value;
  struct MapEntry;

  struct Nil
  {
    bool operator==(const Nil &) const = default;
  };

  using TimePoint = std::chrono::sys_time<std::chrono::microseconds>;

  // A point in time stored as UTC. The offset is the zone the value was
  // written in; a naive instant has none and is treated as UTC wall time.
  struct Instant
  {
    TimePoint time;
    std::optional<std::chrono::minutes> offset;

    static Instant utc(TimePoint time) { return Instant{time, std::chrono::minutes{0}}; }
    static Instant naive(TimePoint time) { return Instant{time, std::nullopt}; }

    bool isAware() const { return offset.has_value(); }
    bool operator==(const Instant &other) const;
  };

  using Uuid = boost::uuids::uuid;

  // Vectors and lists both read into a Sequence.
  using Sequence = std::vector<Value>;

  // Members are unique by equality and kept in encounter order; equality
  // between sets ignores order.
  class Set
  {
  public:
    using const_iterator = std::vector<Value>::const_iterator;

    Set();
    Set(std::initializer_list<Value> items);

    // false if an equal member was already present
    bool insert(Value value);
    bool contains(const Value &value) const;

    std::size_t size() const;
    bool empty() const;
    const_iterator begin() const;
    const_iterator end() const;

    bool operator==(const Set &other) const;

  private:
    std::vector<Value> items;
    // hash of a member to its position in items
    boost::unordered_multimap<std::size_t, std::size_t> index;
  };

  // Keys are unique by equality; inserting an existing key replaces its value.
  class Map
  {
  public:
    using const_iterator = std::vector<MapEntry>::const_iterator;

    Map();
    Map(std::initializer_list<MapEntry> entries);

    void insert(Value key, Value value);
    const Value *find(const Value &key) const;
    // throws std::out_of_range when the key is missing
    const Value &at(const Value &key) const;
    bool contains(const Value &key) const;

    std::size_t size() const;
    bool empty() const;
    const_iterator begin() const;
    const_iterator end() const;

    bool operator==(const Map &other) const;

  private:
    std::vector<MapEntry> entries;
    // hash of a key to its position in entries
    boost::unordered_multimap<std::size_t, std::size_t> index;
  };

  class Value
  {
  public:
    using Variant = std::variant<Nil, bool, std::int64_t, double, std::string, Instant, Uuid, Sequence, Set, Map>;

    Value() : data(Nil{}) {}
    Value(Nil) : data(Nil{}) {}
    Value(bool b) : data(b) {}
    Value(int i) : data(std::int64_t{i}) {}
    Value(std::int64_t i) : data(i) {}
    Value(double d) : data(d) {}
    Value(const char *s) : data(std::string(s)) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(Instant instant) : data(instant) {}
    Value(Uuid uuid) : data(uuid) {}
    Value(Sequence sequence) : data(std::move(sequence)) {}
    Value(Set set) : data(std::move(set)) {}
    Value(Map map) : data(std::move(map)) {}

    ValueType type() const { return static_cast<ValueType>(data.index()); }
    bool isNil() const { return std::holds_alternative<Nil>(data); }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(data); }

    // throws std::bad_variant_access on a type mismatch
    template <typename T>
    const T &as() const { return std::get<T>(data); }

    const Variant &variant() const { return data; }

    bool operator==(const Value &other) const { return data == other.data; }

  private:
    Variant data;
  };

  // Equal values hash equally; sets and maps hash independently of order.
  // Found by boost::hash through argument-dependent lookup.
  std::size_t hash_value(const Value &value);

  struct MapEntry
  {
    Value key;
    Value value;

    bool operator==(const MapEntry &other) const = default;
  };

  // Character literals read as one-character strings; these are the names
  // accepted after a backslash.
  struct NamedCharacter
  {
    const char *name;
    const char *value;
  };

  extern const std::array<NamedCharacter, 4> namedCharacters;
}
