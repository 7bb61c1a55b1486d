#include "logging.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
using namespace std;

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/support/date_time.hpp>

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

void init_logging(string loglevel, string logfile) {
  logging::add_common_attributes();

  if (logfile != "") {
    logging::add_file_log(
      keywords::file_name = logfile,
      keywords::auto_flush = true,
      keywords::format = (
        expr::stream
          << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
          << " [" << logging::trivial::severity << "] "
          << expr::smessage
      )
    );
  }
  logging::add_console_log(
    std::cout,
    keywords::filter = logging::trivial::severity < logging::trivial::warning
  );
  logging::add_console_log(
    std::cerr,
    keywords::filter = logging::trivial::severity >= logging::trivial::warning
  );

  if (loglevel == "debug") {
    logging::core::get()->set_filter(
      logging::trivial::severity >= logging::trivial::debug
    );
  } else {
    logging::core::get()->set_filter(
      logging::trivial::severity >= logging::trivial::info
    );
  }
}

void log_debug(const string& s) {
  BOOST_LOG_TRIVIAL(debug) << "debug: " << s;
}

void log_info(const string& s) {
  BOOST_LOG_TRIVIAL(info) << s;
}

void log_warning(const string& s) {
  BOOST_LOG_TRIVIAL(warning) << "warning: " << s;
}

void log_error(const string& s, const int& die) {
  BOOST_LOG_TRIVIAL(error) << "error: " << s;
  if (die) {
    logging::core::get()->flush();
    exit(die);
  }
}

string format_count(long long n) {
  string digits = to_string(n < 0 ? -n : n);
  string formatted = "";
  int written = 0;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    if (written > 0 && written % 3 == 0) {
      formatted.insert(formatted.begin(), ',');
    }
    formatted.insert(formatted.begin(), *it);
    ++written;
  }
  return n < 0 ? "-" + formatted : formatted;
}
