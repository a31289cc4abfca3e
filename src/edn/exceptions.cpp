#include <fmt/format.h>

#include "exceptions.hpp"

namespace datomic::edn
{

  EdnDepthException::EdnDepthException(int maxDepth, std::size_t position)
      : EdnException(fmt::format("Maximum nesting depth ({}) exceeded at position {}", maxDepth, position), position),
        limit(maxDepth)
  {
  }

  std::string positionSuffix(std::optional<std::size_t> position)
  {
    if (!position)
      return "";
    return fmt::format(" at position {}", *position);
  }
}
