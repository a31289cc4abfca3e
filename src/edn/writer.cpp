#include <cmath>
#include <string>

#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

#include "datetime.hpp"
#include "edn.hpp"
#include "utf8.hpp"

namespace datomic::edn
{
  using std::string;

  namespace
  {
    string escapeString(std::string_view before)
    {
      string after;
      after.reserve(before.length() + 4);

      for (string::size_type i = 0; i < before.length(); ++i)
      {
        switch (before[i])
        {
        case '"':
        case '\\':
          after += '\\';
          after += before[i];
          break;
        case '\n':
          after += "\\n";
          break;
        case '\r':
          after += "\\r";
          break;
        case '\t':
          after += "\\t";
          break;
        default:
          after += before[i];
          break;
        }
      }
      return after;
    }

    string writeString(const string &s)
    {
      // already-encoded keyword
      if (!s.empty() && s[0] == ':')
        return s;
      return writeQuoted(s);
    }

    string writeFloat(double d)
    {
      if (std::isnan(d))
        return "##NaN";
      if (std::isinf(d))
        return d > 0 ? "##Inf" : "##-Inf";

      // shortest text that reads back to the same double, kept a float
      string output = fmt::format("{}", d);
      if (output.find_first_of(".eE") == string::npos)
        output += ".0";
      return output;
    }

    string writeAtom(const Value &value)
    {
      string output;
      switch (value.type())
      {
      case EdnNil:
        output = "nil";
        break;
      case EdnBool:
        output = value.as<bool>() ? "true" : "false";
        break;
      case EdnInt:
        output = fmt::format("{}", value.as<std::int64_t>());
        break;
      case EdnFloat:
        output = writeFloat(value.as<double>());
        break;
      case EdnString:
        output = writeString(value.as<string>());
        break;
      case EdnInstant:
        output = "#inst \"" + formatDatetime(value.as<Instant>()) + "\"";
        break;
      case EdnUuid:
        output = "#uuid \"" + boost::uuids::to_string(value.as<Uuid>()) + "\"";
        break;
      case EdnSequence:
      case EdnSet:
      case EdnMap:
        throw EdnWriteException(fmt::format("{} is not an atom", typeToString(value.type())));
      }
      return output;
    }

    bool isCollection(const Value &value)
    {
      return value.is<Sequence>() || value.is<Set>() || value.is<Map>();
    }

    string opener(const Value &value)
    {
      if (value.is<Set>())
        return "#{";
      if (value.is<Map>())
        return "{";
      return "[";
    }

    string closer(const Value &value)
    {
      return value.is<Sequence>() ? "]" : "}";
    }

    // Shared by write() and pprint(). With multiline set, every element
    // after the first starts a new line indented to the first element.
    string render(const Value &value, int indent, bool multiline)
    {
      if (!isCollection(value))
        return writeAtom(value);

      string open = opener(value);
      int childIndent = indent + static_cast<int>(open.length());
      string separator = multiline ? "\n" + string(childIndent, ' ') : " ";

      string vals;
      auto append = [&](const string &element)
      {
        if (!vals.empty())
          vals += separator;
        vals += element;
      };

      if (value.is<Map>())
      {
        for (const MapEntry &entry : value.as<Map>())
        {
          string key = render(entry.key, childIndent, multiline);
          int valueIndent = key.find('\n') == string::npos ? childIndent + static_cast<int>(key.length()) + 1
                                                           : childIndent + 1;
          append(key + " " + render(entry.value, valueIndent, multiline));
        }
      }
      else if (value.is<Set>())
      {
        for (const Value &item : value.as<Set>())
          append(render(item, childIndent, multiline));
      }
      else
      {
        for (const Value &item : value.as<Sequence>())
          append(render(item, childIndent, multiline));
      }

      return open + vals + closer(value);
    }
  }

  string writeQuoted(std::string_view text)
  {
    if (auto invalid = findInvalidUtf8(text))
      throw EdnWriteException(fmt::format("Cannot serialize string with invalid UTF-8 at byte {}", *invalid));
    return "\"" + escapeString(text) + "\"";
  }

  string write(const Value &value, const WriteOptions &)
  {
    return render(value, 0, false);
  }

  string pprint(const Value &value, int indent, bool multiline)
  {
    return render(value, indent, multiline);
  }
}
