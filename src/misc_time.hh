#ifndef MISC_TIME_H_
#define MISC_TIME_H_

#include <ctime>
#include <string>
#include <boost/chrono.hpp>

namespace misc {

// build time of the calling translation unit
time_t compile_time(char const *time = __DATE__ " " __TIME__);

/** Measures wall and user cpu time from construction or reset() until
 * the last store(). */
class ProcessStopWatch {
 public:
  ProcessStopWatch();
  void reset();
  void store();
  boost::chrono::milliseconds user_millis() const;
  boost::chrono::milliseconds wall_millis() const;
  // "<wall>ms (user <user>ms)"
  std::string report() const;

 private:
  typedef boost::chrono::process_user_cpu_clock user_clock;
  typedef boost::chrono::steady_clock wall_clock;

  user_clock::time_point user_start_;
  user_clock::time_point user_end_;
  wall_clock::time_point wall_start_;
  wall_clock::time_point wall_end_;
};

}

#endif /* MISC_TIME_H_ */
