#pragma once

#include <boost/log/trivial.hpp>

#define VERIFS_LOG(severity) BOOST_LOG_TRIVIAL(severity) << "verifs: "
