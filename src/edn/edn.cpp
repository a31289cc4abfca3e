#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>

#include <fmt/format.h>

#include "edn.hpp"
#include "utf8.hpp"

namespace datomic::edn
{
  using std::string;
  using std::string_view;

  namespace
  {
    // Characters that end a symbol, keyword or tag token.
    constexpr string_view tokenDelimiters = " \t\n\r,()[]{}\"\\;";

    // Characters that can never start a bare symbol.
    constexpr string_view reservedChars = "()[]{}\"\\;,@";

    bool isDelimiter(char c)
    {
      return tokenDelimiters.find(c) != string_view::npos;
    }

    bool isDigit(char c)
    {
      return c >= '0' && c <= '9';
    }

    // Keeps the reader's depth counter balanced on every exit path.
    class DepthGuard
    {
    public:
      DepthGuard(int &depth, int maxDepth, std::size_t position) : depth(depth)
      {
        if (depth + 1 > maxDepth)
          throw EdnDepthException(maxDepth, position);
        ++depth;
      }

      ~DepthGuard() { --depth; }

      DepthGuard(const DepthGuard &) = delete;
      DepthGuard &operator=(const DepthGuard &) = delete;

    private:
      int &depth;
    };
  }

  Reader::Reader(string_view source, ReadOptions options)
      : source(source),
        maxDepth(options.maxDepth),
        registry(options.tagRegistry ? *options.tagRegistry : TagRegistry::defaultRegistry())
  {
    if (auto invalid = findInvalidUtf8(source))
      throw EdnEncodingException(fmt::format("Invalid UTF-8 encoding at byte {}", *invalid), *invalid);
  }

  Value Reader::readValue()
  {
    std::optional<Value> value = readAhead();
    if (!value)
      return Value();
    return std::move(*value);
  }

  bool Reader::atEnd()
  {
    skipIgnored();
    return !more();
  }

  void Reader::skipWhitespaceAndComments()
  {
    while (more())
    {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',')
      {
        ++pos;
      }
      else if (c == ';')
      {
        while (more() && peek() != '\n')
          ++pos;
      }
      else
      {
        break;
      }
    }
  }

  void Reader::skipIgnored()
  {
    while (true)
    {
      skipWhitespaceAndComments();
      if (pos + 1 >= source.size() || source[pos] != '#' || source[pos + 1] != '_')
        break;
      std::size_t start = pos;
      pos += 2;
      readDiscard(start);
    }
  }

  void Reader::readDiscard(std::size_t start)
  {
    DepthGuard guard(currentDepth, maxDepth, start);
    skipWhitespaceAndComments();
    if (!more())
      throw EdnParseException(fmt::format("Unexpected end of input after #_ at position {}", start), start);
    // whatever the form reads as, including a skipped tag, is thrown away
    readAhead();
  }

  string Reader::readString(std::size_t start)
  {
    string content;
    while (true)
    {
      if (!more())
        throw EdnParseException(fmt::format("Unterminated string at position {}", start), start);

      char c = source[pos++];
      if (c == '"')
        break;

      if (c != '\\')
      {
        content += c;
        continue;
      }

      if (!more())
        throw EdnParseException(fmt::format("Unterminated string at position {}", start), start);

      char escaped = source[pos++];
      switch (escaped)
      {
      case 'n':
        content += '\n';
        break;
      case 't':
        content += '\t';
        break;
      case 'r':
        content += '\r';
        break;
      default:
        // covers \" and \\ as well as unknown escapes
        content += escaped;
        break;
      }
    }
    return content;
  }

  string Reader::readToken()
  {
    std::size_t start = pos;
    while (more() && !isDelimiter(peek()))
      ++pos;
    return string(source.substr(start, pos - start));
  }

  Value Reader::readNumber()
  {
    std::size_t start = pos;
    bool hasDecimal = source[pos] == '.';
    ++pos;

    while (more())
    {
      char c = peek();
      if (c == '.')
      {
        if (hasDecimal)
          throw EdnParseException(fmt::format("Invalid number: multiple decimal points at position {}", start), start);
        hasDecimal = true;
      }
      else if (!isDigit(c) && c != '-' && c != '+' && c != 'e' && c != 'E')
      {
        break;
      }
      ++pos;
    }

    string_view text = source.substr(start, pos - start);
    string_view digits = text;
    if (digits.front() == '+')
      digits.remove_prefix(1);
    const char *first = digits.data();
    const char *last = digits.data() + digits.size();

    if (text.find_first_of(".eE") != string_view::npos)
    {
      double number = 0;
      auto [end, ec] = std::from_chars(first, last, number);
      if (ec != std::errc() || end != last)
        throw EdnParseException(fmt::format("Invalid number: {} at position {}", text, start), start);
      return Value(number);
    }

    std::int64_t number = 0;
    auto [end, ec] = std::from_chars(first, last, number);
    if (ec == std::errc::result_out_of_range)
      throw EdnParseException(fmt::format("Integer out of range: {} at position {}", text, start), start);
    if (ec != std::errc() || end != last)
      throw EdnParseException(fmt::format("Invalid number: {} at position {}", text, start), start);
    return Value(number);
  }

  string Reader::readChar(std::size_t start)
  {
    if (!more())
      throw EdnParseException(fmt::format("Unexpected end of input reading character at position {}", start), start);

    string_view remaining = source.substr(pos);
    for (const NamedCharacter &named : namedCharacters)
    {
      string_view name(named.name);
      if (!remaining.starts_with(name))
        continue;
      // \spaceship is \s followed by the symbol paceship, not a space
      if (name.size() == remaining.size() || isDelimiter(remaining[name.size()]))
      {
        pos += name.size();
        return named.value;
      }
    }

    std::size_t length = std::min(utf8SequenceLength(static_cast<unsigned char>(peek())), remaining.size());
    pos += length;
    return string(remaining.substr(0, length));
  }

  Sequence Reader::readCollection(char endChar, std::size_t start)
  {
    DepthGuard guard(currentDepth, maxDepth, start);
    Sequence items;
    while (true)
    {
      skipIgnored();
      if (!more())
        throw EdnParseException(fmt::format("Unterminated collection, expected {} at position {}", endChar, start), start);
      if (peek() == endChar)
      {
        ++pos;
        break;
      }

      std::optional<Value> value = readAhead();
      if (value)
        items.push_back(std::move(*value));
    }
    return items;
  }

  Map Reader::readMap(std::size_t start)
  {
    DepthGuard guard(currentDepth, maxDepth, start);
    Map result;
    while (true)
    {
      skipIgnored();
      if (!more())
        throw EdnParseException(fmt::format("Unterminated map at position {}", start), start);
      if (peek() == '}')
      {
        ++pos;
        break;
      }

      std::optional<Value> key = readAhead();
      skipIgnored();
      if (!more())
        throw EdnParseException(fmt::format("Unterminated map at position {}", start), start);
      if (peek() == '}')
        throw EdnParseException(fmt::format("Map literal must contain an even number of forms at position {}", start), start);

      std::optional<Value> value = readAhead();
      if (key && value)
        result.insert(std::move(*key), std::move(*value));
    }
    return result;
  }

  std::optional<Value> Reader::readDispatch(std::size_t start)
  {
    if (!more())
      throw EdnParseException(fmt::format("Unexpected end of input after # at position {}", start), start);

    char c = peek();
    if (c == '{')
    {
      ++pos;
      Set set;
      for (Value &item : readCollection('}', start))
        set.insert(std::move(item));
      return Value(std::move(set));
    }

    if (c == '#')
    {
      ++pos;
      string symbol = readToken();
      if (symbol == "Inf")
        return Value(std::numeric_limits<double>::infinity());
      if (symbol == "-Inf")
        return Value(-std::numeric_limits<double>::infinity());
      if (symbol == "NaN")
        return Value(std::numeric_limits<double>::quiet_NaN());
      throw EdnParseException(fmt::format("Unknown symbolic value: ##{} at position {}", symbol, start), start);
    }

    string tag = readToken();
    if (tag.empty())
      throw EdnParseException(fmt::format("Missing tag name at position {}", start), start);
    // chained tags nest like collections
    DepthGuard guard(currentDepth, maxDepth, start);
    return readTagged(tag, start);
  }

  std::optional<Value> Reader::readTagged(const string &tag, std::size_t tagPos)
  {
    skipIgnored();
    if (!more())
      throw EdnParseException(fmt::format("Missing value for tag #{} at position {}", tag, tagPos), tagPos);

    std::optional<Value> value = readAhead();
    if (!value)
      return std::nullopt;

    const TagHandler *handler = registry.getHandler(tag);
    if (!handler)
      return std::nullopt;
    return (*handler)(*value, tagPos);
  }

  std::optional<Value> Reader::readAhead()
  {
    skipIgnored();
    if (!more())
      return Value();

    std::size_t start = pos;
    char c = peek();
    switch (c)
    {
    case '"':
      ++pos;
      return Value(readString(start));
    case '[':
      ++pos;
      return Value(readCollection(']', start));
    case '(':
      ++pos;
      return Value(readCollection(')', start));
    case '{':
      ++pos;
      return Value(readMap(start));
    case '#':
      ++pos;
      return readDispatch(start);
    case '\\':
      ++pos;
      return Value(readChar(start));
    case ':':
      return Value(readToken());
    default:
      break;
    }

    bool signedNumber = (c == '-' || c == '+') && pos + 1 < source.size() &&
                        (isDigit(source[pos + 1]) || source[pos + 1] == '.');
    if (isDigit(c) || signedNumber || c == '.')
      return readNumber();

    if (c == 't' || c == 'f' || c == 'n')
    {
      string word = readToken();
      if (word == "true")
        return Value(true);
      if (word == "false")
        return Value(false);
      if (word == "nil")
        return Value();
      return Value(std::move(word));
    }

    if (reservedChars.find(c) == string_view::npos)
      return Value(readToken());

    throw EdnParseException(fmt::format("Unexpected character: {} at position {}", c, start), start);
  }

  Value read(string_view edn, const ReadOptions &options)
  {
    Reader reader(edn, options);
    return reader.readValue();
  }

  Value readBytes(std::span<const std::uint8_t> bytes, const ReadOptions &options)
  {
    string text(bytes.begin(), bytes.end());
    return read(text, options);
  }
}
