#include <array>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

#include <fmt/format.h>

#include "datetime.hpp"
#include "exceptions.hpp"

namespace datomic::edn
{
  using std::string;
  using std::string_view;
  using namespace std::chrono;

  namespace
  {
    struct DatetimeFields
    {
      int year = 0;
      int month = 0;
      int day = 0;
      int hour = 0;
      int minute = 0;
      int second = 0;
      int microsecond = 0;
      std::optional<minutes> offset;
    };

    // Fallback layouts for producers that do not emit extended ISO-8601.
    // Fractional seconds and the offset are read after the pattern.
    const std::array<const char *, 3> fallbackPatterns = {
        "%Y-%m-%d %H:%M:%S",
        "%Y%m%dT%H%M%S",
        "%Y-%m-%dT%H:%M:%S",
    };

    bool isDigit(char c)
    {
      return c >= '0' && c <= '9';
    }

    bool readDigits(string_view text, std::size_t &pos, std::size_t count, int &out)
    {
      if (pos + count > text.size())
        return false;
      int value = 0;
      for (std::size_t i = 0; i < count; ++i)
      {
        char c = text[pos + i];
        if (!isDigit(c))
          return false;
        value = value * 10 + (c - '0');
      }
      pos += count;
      out = value;
      return true;
    }

    bool consume(string_view text, std::size_t &pos, char expected)
    {
      if (pos < text.size() && text[pos] == expected)
      {
        ++pos;
        return true;
      }
      return false;
    }

    // [.fraction][+HH:MM|-HH:MM|+HHMM|-HHMM] up to the end of text.
    bool readFractionAndOffset(string_view text, std::size_t pos, DatetimeFields &fields)
    {
      if (consume(text, pos, '.') || consume(text, pos, ','))
      {
        std::size_t digits = 0;
        int micros = 0;
        while (pos < text.size() && isDigit(text[pos]))
        {
          // digits past microseconds are truncated
          if (digits < 6)
            micros = micros * 10 + (text[pos] - '0');
          ++digits;
          ++pos;
        }
        if (digits == 0 || digits > 9)
          return false;
        for (std::size_t i = digits; i < 6; ++i)
          micros *= 10;
        fields.microsecond = micros;
      }

      if (pos == text.size())
        return true;

      int sign = 0;
      if (text[pos] == '+')
        sign = 1;
      else if (text[pos] == '-')
        sign = -1;
      else
        return false;
      ++pos;

      int hours = 0;
      int mins = 0;
      if (!readDigits(text, pos, 2, hours))
        return false;
      consume(text, pos, ':');
      if (!readDigits(text, pos, 2, mins))
        return false;
      if (pos != text.size() || hours > 23 || mins > 59)
        return false;

      fields.offset = minutes{sign * (hours * 60 + mins)};
      return true;
    }

    std::optional<Instant> makeInstant(const DatetimeFields &fields)
    {
      year_month_day date{year{fields.year}, month{static_cast<unsigned>(fields.month)},
                          day{static_cast<unsigned>(fields.day)}};
      if (fields.year < 1 || !date.ok())
        return std::nullopt;
      if (fields.hour > 23 || fields.minute > 59 || fields.second > 59)
        return std::nullopt;

      TimePoint local = sys_days{date} + hours{fields.hour} + minutes{fields.minute} +
                        seconds{fields.second} + microseconds{fields.microsecond};
      minutes offset = fields.offset.value_or(minutes{0});
      return Instant{local - offset, offset};
    }

    // YYYY-MM-DD[THH:MM[:SS[.fraction]][offset]]
    std::optional<Instant> parseIso(string_view text)
    {
      DatetimeFields fields;
      std::size_t pos = 0;
      if (!readDigits(text, pos, 4, fields.year) || !consume(text, pos, '-') ||
          !readDigits(text, pos, 2, fields.month) || !consume(text, pos, '-') ||
          !readDigits(text, pos, 2, fields.day))
        return std::nullopt;

      if (pos == text.size())
        return makeInstant(fields);

      if (!consume(text, pos, 'T') || !readDigits(text, pos, 2, fields.hour) ||
          !consume(text, pos, ':') || !readDigits(text, pos, 2, fields.minute))
        return std::nullopt;
      if (consume(text, pos, ':') && !readDigits(text, pos, 2, fields.second))
        return std::nullopt;

      if (!readFractionAndOffset(text, pos, fields))
        return std::nullopt;
      return makeInstant(fields);
    }

    std::optional<Instant> parseWithPattern(const string &text, const char *pattern)
    {
      std::istringstream in(text);
      in.imbue(std::locale::classic());
      std::tm tm{};
      in >> std::get_time(&tm, pattern);
      if (in.fail())
        return std::nullopt;

      std::size_t consumed = text.size();
      if (!in.eof())
        consumed = static_cast<std::size_t>(in.tellg());

      DatetimeFields fields;
      fields.year = tm.tm_year + 1900;
      fields.month = tm.tm_mon + 1;
      fields.day = tm.tm_mday;
      fields.hour = tm.tm_hour;
      fields.minute = tm.tm_min;
      fields.second = tm.tm_sec;
      if (!readFractionAndOffset(text, consumed, fields))
        return std::nullopt;
      return makeInstant(fields);
    }
  }

  Instant parseDatetime(string_view text, std::optional<std::size_t> position)
  {
    string normalized(text);
    if (!normalized.empty() && normalized.back() == 'Z')
      normalized.replace(normalized.size() - 1, 1, "+00:00");
    if (normalized.size() >= 6 && normalized.compare(normalized.size() - 6, 6, "-00:00") == 0)
      normalized.replace(normalized.size() - 6, 6, "+00:00");

    if (auto instant = parseIso(normalized))
      return *instant;

    for (const char *pattern : fallbackPatterns)
    {
      if (auto instant = parseWithPattern(normalized, pattern))
        return *instant;
    }

    throw EdnParseException(fmt::format("Invalid datetime format: {}{}", text, positionSuffix(position)), position);
  }

  string formatDatetime(const Instant &instant)
  {
    TimePoint local = instant.time + instant.offset.value_or(minutes{0});
    sys_days date = floor<days>(local);
    year_month_day ymd{date};
    hh_mm_ss<microseconds> time{local - date};

    int yearValue = static_cast<int>(ymd.year());
    if (yearValue < 1 || yearValue > 9999)
      throw EdnWriteException(fmt::format("Cannot serialize instant with year {}", yearValue));

    string output = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", yearValue,
                                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                                time.hours().count(), time.minutes().count(), time.seconds().count());
    if (time.subseconds().count() != 0)
      output += fmt::format(".{:06}", time.subseconds().count());

    if (!instant.offset)
      return output + "Z";

    long offsetMinutes = instant.offset->count();
    char sign = offsetMinutes < 0 ? '-' : '+';
    offsetMinutes = std::labs(offsetMinutes);
    return output + fmt::format("{}{:02}:{:02}", sign, offsetMinutes / 60, offsetMinutes % 60);
  }
}
