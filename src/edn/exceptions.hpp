#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace datomic::edn
{

  // Base of every error raised by the reader and writer. The position is a
  // byte offset into the source when one is known.
  class EdnException : public std::runtime_error
  {
  public:
    explicit EdnException(const std::string &msg, std::optional<std::size_t> position = std::nullopt)
        : std::runtime_error(msg), sourcePosition(position) {}

    std::optional<std::size_t> position() const noexcept { return sourcePosition; }

  private:
    std::optional<std::size_t> sourcePosition;
  };

  class EdnParseException : public EdnException
  {
  public:
    using EdnException::EdnException;
  };

  class EdnDepthException : public EdnException
  {
  public:
    EdnDepthException(int maxDepth, std::size_t position);

    int maxDepth() const noexcept { return limit; }

  private:
    int limit;
  };

  class EdnEncodingException : public EdnException
  {
  public:
    using EdnException::EdnException;
  };

  class EdnWriteException : public EdnException
  {
  public:
    using EdnException::EdnException;
  };

  // " at position N" or an empty string.
  std::string positionSuffix(std::optional<std::size_t> position);
}
