#include <fmt/format.h>

#include "edn/datetime.hpp"
#include "edn/edn.hpp"
#include "edn.hpp"

namespace datomic::edn
{

  std::ostream &operator<<(std::ostream &stream, const Value &value)
  {
    std::string text;
    try
    {
      text = write(value);
    }
    catch (const EdnWriteException &e)
    {
      text = fmt::format("<unwritable {}: {}>", typeToString(value.type()), e.what());
    }
    stream << "[type: " << typeToString(value.type()) << " value: " << text << "]";
    return stream;
  }

  std::ostream &operator<<(std::ostream &stream, const Instant &instant)
  {
    try
    {
      stream << "<Instant: " << formatDatetime(instant) << ">";
    }
    catch (const EdnWriteException &e)
    {
      stream << "<Instant: " << e.what() << ">";
    }
    return stream;
  }
}
