#include "utf8.hpp"

namespace datomic::edn
{

  std::size_t utf8SequenceLength(unsigned char lead)
  {
    if (lead >= 0xF0 && lead <= 0xF4)
      return 4;
    if (lead >= 0xE0)
      return lead <= 0xEF ? 3 : 1;
    if (lead >= 0xC2)
      return 2;
    return 1;
  }

  static bool isContinuation(unsigned char c)
  {
    return (c & 0xC0) == 0x80;
  }

  std::optional<std::size_t> findInvalidUtf8(std::string_view text)
  {
    std::size_t i = 0;
    while (i < text.size())
    {
      unsigned char lead = static_cast<unsigned char>(text[i]);
      if (lead < 0x80)
      {
        ++i;
        continue;
      }

      // 0x80-0xC1 are continuations or overlong two byte leads, 0xF5+ is out of range
      if (lead < 0xC2 || lead > 0xF4)
        return i;

      std::size_t length = utf8SequenceLength(lead);
      if (i + length > text.size())
        return i;

      unsigned char second = static_cast<unsigned char>(text[i + 1]);
      if (!isContinuation(second))
        return i;
      // overlong encodings, UTF-16 surrogates and code points above U+10FFFF
      if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
          (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F))
        return i;

      for (std::size_t k = 2; k < length; ++k)
      {
        if (!isContinuation(static_cast<unsigned char>(text[i + k])))
          return i;
      }
      i += length;
    }
    return std::nullopt;
  }
}
