#ifndef _VERIFS_API_MODE_PARSER_H
#define _VERIFS_API_MODE_PARSER_H

#include <cstdint>
#include <string>
#include "verifs/Defs.hpp"

namespace verifs
{

// Parses chmod style mode changes: octal ("755", "1777", "+644") or
// symbolic ("u+x", "go-w", "a=rX,o+t")
class VERIFS_API_DECL ModeParser
{
public:
  explicit ModeParser(std::string const & mode); // throws std::invalid_argument

  bool symbolic() const { return m_symbolic; }

  // Permissions of a file with 'existing' mode after applying the change
  uint16_t applyNewPermission(uint16_t existing, bool isDirectory) const;
  uint16_t combineModes(uint16_t existing, bool exeOk) const;

private:
  struct Segment
  {
    char type;     // '+', '-' or '='
    unsigned mode; // rwx bits, 8 for 'X'
  };

  Segment m_user, m_group, m_others, m_sticky;
  bool m_symbolic;

  bool parseOctal(std::string const &);
  bool parseSymbolic(std::string const &);
  static unsigned combineSegment(Segment const &, unsigned existing, bool exeOk);
};

}

#endif
