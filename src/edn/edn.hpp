#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "exceptions.hpp"
#include "tags.hpp"
#include "value.hpp"

namespace datomic::edn
{

  constexpr int defaultMaxDepth = 100;

  struct ReadOptions
  {
    // Collections nested deeper than this raise EdnDepthException.
    int maxDepth = defaultMaxDepth;
    // nullptr selects TagRegistry::defaultRegistry().
    const TagRegistry *tagRegistry = nullptr;
  };

  struct WriteOptions
  {
    // Accepted but unused; write() always produces compact output.
    int indent = 0;
  };

  // Reads EDN forms one at a time from source. The source must outlive the
  // reader. Throws EdnEncodingException from the constructor when source is
  // not valid UTF-8.
  class Reader
  {
  public:
    explicit Reader(std::string_view source, ReadOptions options = {});

    // Reads the next top-level form. Returns nil both for a literal nil and
    // when only whitespace remains; use atEnd() to tell them apart.
    Value readValue();

    // Skips whitespace and comments, then reports whether input remains.
    bool atEnd();
    std::size_t position() const { return pos; }

  private:
    bool more() const { return pos < source.size(); }
    char peek() const { return source[pos]; }

    void skipWhitespaceAndComments();
    // Also consumes "#_ form" discards, which are not forms of their own.
    void skipIgnored();
    void readDiscard(std::size_t start);
    std::optional<Value> readAhead();
    std::string readString(std::size_t start);
    std::string readToken();
    Value readNumber();
    std::string readChar(std::size_t start);
    Sequence readCollection(char endChar, std::size_t start);
    Map readMap(std::size_t start);
    std::optional<Value> readDispatch(std::size_t start);
    std::optional<Value> readTagged(const std::string &tag, std::size_t tagPos);

    std::string_view source;
    std::size_t pos = 0;
    int maxDepth;
    int currentDepth = 0;
    const TagRegistry &registry;
  };

  // Parses the first EDN form in edn.
  Value read(std::string_view edn, const ReadOptions &options = {});
  Value readBytes(std::span<const std::uint8_t> bytes, const ReadOptions &options = {});

  std::string write(const Value &value, const WriteOptions &options = {});

  // A string literal, quoted even when text starts with ':'.
  std::string writeQuoted(std::string_view text);

  // Multi-line rendering with one collection element per line. indent is
  // the column the value starts at.
  std::string pprint(const Value &value, int indent = 0, bool multiline = true);
}
