#ifndef _VERIFS_API_ACCESS_H
#define _VERIFS_API_ACCESS_H

#include <boost/optional.hpp>
#include <string>
#include "verifs/Defs.hpp"

namespace verifs
{

// POSIX style access bits of a file mode group
enum class Access
{
  None = 0,         // ---
  Execute = 1,      // --x
  Write = 2,        // -w-
  WriteExecute = 3, // -wx
  Read = 4,         // r--
  ReadExecute = 5,  // r-x
  ReadWrite = 6,    // rw-
  All = 7           // rwx
};

inline Access operator&(Access lhs, Access rhs)
{
  return Access(unsigned(lhs) & unsigned(rhs));
}

inline Access operator|(Access lhs, Access rhs)
{
  return Access(unsigned(lhs) | unsigned(rhs));
}

inline Access operator~(Access value)
{
  return Access(7 - unsigned(value));
}

// True if 'value' grants everything 'required' does
inline bool Implies(Access value, Access required)
{
  return (value & required) == required;
}

VERIFS_API_DECL const char * Symbol(Access);
VERIFS_API_DECL boost::optional<Access> AccessFromSymbol(std::string const & symbol);

}

#endif
