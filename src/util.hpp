#ifndef ASEMETA_UTIL_H
#define ASEMETA_UTIL_H

#include <string>
#include <vector>

#include "enums.hpp"

namespace util {
  std::vector<std::string> str_split(const std::string& str, const std::string& delimiters);
  bool file_exists(std::string filename);
  bool is_missing(const std::string& field);

  // formats doubles the way they appear in output tables, NaN as NA
  std::string format_double(double d);

  std::string correction_method_to_string(const correction_method_e& method);

  std::vector<std::string> read_file_list(const std::string& list_file);
}

#endif
