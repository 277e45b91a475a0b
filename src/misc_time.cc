#include "misc_time.hh"

#include <sstream>

namespace misc {

time_t compile_time(char const *time) {
  struct tm t = tm();
  if (strptime(time, "%b %d %Y %H:%M:%S", &t) == NULL) return 0;
  t.tm_isdst = -1;
  return mktime(&t);
}

ProcessStopWatch::ProcessStopWatch() {
  reset();
}

void ProcessStopWatch::reset() {
  user_start_ = user_end_ = user_clock::now();
  wall_start_ = wall_end_ = wall_clock::now();
}

void ProcessStopWatch::store() {
  user_end_ = user_clock::now();
  wall_end_ = wall_clock::now();
}

boost::chrono::milliseconds ProcessStopWatch::user_millis() const {
  return boost::chrono::duration_cast<boost::chrono::milliseconds>(
      user_end_ - user_start_);
}

boost::chrono::milliseconds ProcessStopWatch::wall_millis() const {
  return boost::chrono::duration_cast<boost::chrono::milliseconds>(
      wall_end_ - wall_start_);
}

std::string ProcessStopWatch::report() const {
  std::ostringstream oss;
  oss << wall_millis().count() << "ms (user " << user_millis().count()
      << "ms)";
  return oss.str();
}

}
