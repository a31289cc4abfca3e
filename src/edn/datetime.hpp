#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "value.hpp"

namespace datomic::edn
{
  // Parses the ISO-8601 text of an #inst. A trailing Z and -00:00 both mean
  // UTC; text without an offset is taken as UTC, so the result is always
  // zone-aware. Throws EdnParseException naming the text and position.
  Instant parseDatetime(std::string_view text, std::optional<std::size_t> position = std::nullopt);

  // Aware instants render in their own offset ("...+05:30"), naive ones as
  // UTC with a Z. Fractional seconds appear only when non-zero. Throws
  // EdnWriteException for years outside 1-9999.
  std::string formatDatetime(const Instant &instant);
}
