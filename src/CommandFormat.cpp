#include "verifs/CommandFormat.hpp"
#include <stdexcept>

namespace verifs
{

CommandFormat::CommandFormat(std::string const & name, size_t minParams, size_t maxParams,
    std::initializer_list<std::string> options)
  : m_name(name)
  , m_minParams(minParams)
  , m_maxParams(maxParams)
{
  for (auto const & option: options)
    m_options[option] = false;
}

std::vector<std::string> CommandFormat::parse(std::vector<std::string> const & args, size_t pos)
{
  std::vector<std::string> parameters;
  for (; pos < args.size(); ++pos)
  {
    std::string const & arg = args[pos];
    if (arg.size() > 1 && arg[0] == '-')
    {
      auto it = m_options.find(arg.substr(1));
      if (it == m_options.end())
        throw std::invalid_argument("Illegal option " + arg);
      it->second = true;
    }
    else
      parameters.push_back(arg);
  }

  if (parameters.size() < m_minParams || parameters.size() > m_maxParams)
    throw std::invalid_argument("Illegal number of arguments for " + m_name);
  return parameters;
}

bool CommandFormat::getOpt(std::string const & option) const
{
  auto it = m_options.find(option);
  if (it == m_options.end())
    throw std::invalid_argument("Unknown option " + option + " for " + m_name);
  return it->second;
}

}
