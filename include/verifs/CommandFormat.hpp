#ifndef _VERIFS_API_COMMAND_FORMAT_H
#define _VERIFS_API_COMMAND_FORMAT_H

#include <initializer_list>
#include <map>
#include <string>
#include <vector>
#include "verifs/Defs.hpp"

namespace verifs
{

// Parses parameters and "-option" flags of a command
class VERIFS_API_DECL CommandFormat
{
public:
  CommandFormat(std::string const & name, size_t minParams, size_t maxParams,
    std::initializer_list<std::string> options = {});

  // Returns parameters found in args[pos..]. Throws std::invalid_argument
  // on unknown option or parameters count out of [minParams, maxParams].
  std::vector<std::string> parse(std::vector<std::string> const & args, size_t pos);

  bool getOpt(std::string const & option) const;
  std::string const & name() const { return m_name; }

private:
  std::string const m_name;
  size_t const m_minParams, m_maxParams;
  std::map<std::string, bool> m_options;
};

}

#endif
