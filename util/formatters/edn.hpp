#pragma once

#include <ostream>

#include <fmt/ostream.h>

#include "edn/value.hpp"

namespace datomic::edn
{
  std::ostream &operator<<(std::ostream &stream, const Value &value);
  std::ostream &operator<<(std::ostream &stream, const Instant &instant);
}

template <>
struct fmt::formatter<datomic::edn::Value> : fmt::ostream_formatter
{
};

template <>
struct fmt::formatter<datomic::edn::Instant> : fmt::ostream_formatter
{
};
