#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace datomic::edn
{
  // Number of bytes in the sequence introduced by lead; 1 for ASCII and for
  // bytes that cannot start a sequence.
  std::size_t utf8SequenceLength(unsigned char lead);

  // Offset of the first byte that is not part of a well-formed UTF-8
  // sequence, or nullopt when the whole text is valid.
  std::optional<std::size_t> findInvalidUtf8(std::string_view text);
}
