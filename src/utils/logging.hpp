#pragma once

#include <string>

#include <boost/log/trivial.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

#define LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define LOG_INFO BOOST_LOG_TRIVIAL(info)
#define LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define LOG_TRACE BOOST_LOG_TRIVIAL(trace)

// Set the global severity filter. Accepts 'error', 'warning' (or 'warn'),
// 'info', 'debug', 'trace' and 'off'. Returns false for unknown names.
bool init_logging(const std::string &level);
