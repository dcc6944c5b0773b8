#include "verifs/ModeParser.hpp"
#include <cctype>
#include <stdexcept>

namespace verifs
{

namespace
{
  inline bool IsSpace(char c)
  {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  }

  inline bool IsOctalDigit(char c)
  {
    return c >= '0' && c <= '7';
  }

  const unsigned CapitalX = 8;
}

ModeParser::ModeParser(std::string const & mode)
  : m_user{ '+', 0 }
  , m_group{ '+', 0 }
  , m_others{ '+', 0 }
  , m_sticky{ '+', 0 }
  , m_symbolic(false)
{
  if (parseOctal(mode))
    return;
  if (!parseSymbolic(mode))
    throw std::invalid_argument("Invalid permission mode: " + mode);
  m_symbolic = true;
}

// [+][01]?[0-7]{3} surrounded by optional whitespace
bool ModeParser::parseOctal(std::string const & mode)
{
  size_t begin = 0, end = mode.size();
  while (begin < end && IsSpace(mode[begin]))
    ++begin;
  while (end > begin && IsSpace(mode[end - 1]))
    --end;
  if (begin < end && mode[begin] == '+')
    ++begin;

  size_t const digits = end - begin;
  if (digits != 3 && digits != 4)
    return false;
  for (size_t i = begin; i < end; ++i)
    if (!IsOctalDigit(mode[i]))
      return false;

  if (digits == 4)
  {
    if (mode[begin] != '0' && mode[begin] != '1')
      return false;
    m_sticky = Segment{ '=', unsigned(mode[begin] - '0') };
    ++begin;
  }
  m_user = Segment{ '=', unsigned(mode[begin] - '0') };
  m_group = Segment{ '=', unsigned(mode[begin + 1] - '0') };
  m_others = Segment{ '=', unsigned(mode[begin + 2] - '0') };
  return true;
}

// Sequence of [ugoa]*[+=-]+[rwxXt]+ separated by commas or whitespace
bool ModeParser::parseSymbolic(std::string const & mode)
{
  bool applied = false;
  size_t i = 0;
  while (i < mode.size() && IsSpace(mode[i]))
    ++i;

  while (i < mode.size())
  {
    bool user = false, group = false, others = false, stickyBit = false;
    for (; i < mode.size(); ++i)
    {
      char const c = mode[i];
      if (c == 'u')
        user = true;
      else if (c == 'g')
        group = true;
      else if (c == 'o')
        others = true;
      else if (c != 'a')
        break;
    }
    if (!(user || group || others)) // same as 'a'
      user = group = others = true;

    char type = 0;
    for (; i < mode.size() && (mode[i] == '+' || mode[i] == '-' || mode[i] == '='); ++i)
      type = mode[i];
    if (type == 0)
      return false;

    unsigned bits = 0;
    size_t const permissionsStart = i;
    for (; i < mode.size(); ++i)
    {
      char const c = mode[i];
      if (c == 'r')
        bits |= 4;
      else if (c == 'w')
        bits |= 2;
      else if (c == 'x')
        bits |= 1;
      else if (c == 'X')
        bits |= CapitalX;
      else if (c == 't')
        stickyBit = true;
      else
        break;
    }
    if (i == permissionsStart)
      return false;

    if (user)
      m_user = Segment{ type, bits };
    if (group)
      m_group = Segment{ type, bits };
    if (others)
    {
      m_others = Segment{ type, bits };
      m_sticky = Segment{ type, stickyBit ? 1u : 0u };
    }
    applied = true;

    while (i < mode.size() && (mode[i] == ',' || IsSpace(mode[i])))
      ++i;
  }
  return applied;
}

unsigned ModeParser::combineSegment(Segment const & segment, unsigned existing, bool exeOk)
{
  unsigned mode = segment.mode;
  bool capitalX = false;
  if ((mode & CapitalX) != 0)
  {
    capitalX = true;
    mode = (mode & ~CapitalX) | 1;
  }

  switch (segment.type)
  {
  case '+':
    mode |= existing;
    break;
  case '-':
    mode = ~mode & existing;
    break;
  default: // '='
    break;
  }

  // 'X' sets execute bit only if it's already set or execution is allowed
  if (capitalX && !exeOk && (mode & 1) != 0 && (existing & 1) == 0)
    mode &= ~1u;

  return mode & 7;
}

uint16_t ModeParser::combineModes(uint16_t existing, bool exeOk) const
{
  return uint16_t(
    combineSegment(m_sticky, (existing >> 9) & 1, false) << 9 |
    combineSegment(m_user, (existing >> 6) & 7, exeOk) << 6 |
    combineSegment(m_group, (existing >> 3) & 7, exeOk) << 3 |
    combineSegment(m_others, existing & 7, exeOk));
}

uint16_t ModeParser::applyNewPermission(uint16_t existing, bool isDirectory) const
{
  bool const exeOk = isDirectory || (existing & 0111) != 0;
  return combineModes(existing, exeOk);
}

}
