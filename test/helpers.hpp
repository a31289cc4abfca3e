#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "edn/edn.hpp"
#include "formatters/edn.hpp"

namespace datomic::edn
{
  inline TimePoint timePoint(int y, unsigned mo, unsigned d, int h = 0, int mi = 0, int s = 0, int us = 0)
  {
    using namespace std::chrono;
    return sys_days{year{y} / month{mo} / day{d}} + hours{h} + minutes{mi} + seconds{s} + microseconds{us};
  }

  inline Instant utcInstant(int y, unsigned mo, unsigned d, int h = 0, int mi = 0, int s = 0, int us = 0)
  {
    return Instant::utc(timePoint(y, mo, d, h, mi, s, us));
  }

  // what() of the exception raised by read(), or an added failure.
  template <typename Exception>
  std::string readError(std::string_view edn, const ReadOptions &options = {})
  {
    try
    {
      Value value = read(edn, options);
      ADD_FAILURE() << "reading " << edn << " produced " << value;
    }
    catch (const Exception &e)
    {
      return e.what();
    }
    return "";
  }

  inline bool contains(const std::string &text, std::string_view part)
  {
    return text.find(part) != std::string::npos;
  }
}
