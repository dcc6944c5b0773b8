#include "verifs/Access.hpp"

namespace verifs
{

namespace
{
  const char * const Symbols[] = { "---", "--x", "-w-", "-wx", "r--", "r-x", "rw-", "rwx" };
}

const char * Symbol(Access access)
{
  return Symbols[unsigned(access) & 7];
}

boost::optional<Access> AccessFromSymbol(std::string const & symbol)
{
  for (unsigned value = 0; value < 8; ++value)
    if (symbol == Symbols[value])
      return Access(value);
  return boost::none;
}

}
