#include "misc.hh"

#include <iomanip>
#include <sstream>

namespace misc {

std::string intToStrZeroFill(size_t num, size_t length) {
  std::ostringstream oss;
  oss << std::setw(length) << std::setfill('0') << num;
  return oss.str();
}

} /* namespace misc */
