#ifndef MISC_H_
#define MISC_H_

#include "misc_io.hh"
#include "misc_time.hh"

#include <gflags/gflags.h>
#include <glog/logging.h>
#include "config.h"
#include "global.hh"

#include <cmath>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <time.h>

#define MISC_VARINFO(X) VLOG(1) << #X << " has " << sizeof(X) << " bytes";

#define INIT_MAIN(DESCRIPTION) { \
  google::SetUsageMessage(DESCRIPTION); \
  google::ParseCommandLineFlags(&argc, &argv, true); \
  google::InitGoogleLogging(argv[0]); \
  time_t time_run = time(NULL); \
  time_t time_compile = misc::compile_time(); \
  double age = difftime(time_run, time_compile); \
  \
  std::string time_compile_str = asctime(localtime(&time_compile)); \
  time_compile_str.resize(time_compile_str.size() - 1); \
  \
  LOG(INFO) << "revision '" << GIT_REVISION << "' compiled at " << time_compile_str << " (age " << age << "s)"; \
  \
  MISC_VARINFO(symbol_t); \
  MISC_VARINFO(state_id_t); \
  MISC_VARINFO(score_t); \
}

namespace misc {

std::string intToStrZeroFill(size_t num, size_t length);

// helpers for containers
template <template<class,class,class...> class C, typename K, typename V, typename... Args> V GetDefault(const C<K,V,Args...>& m, K const& key, const V & defval) {
  typename C<K,V,Args...>::const_iterator it = m.find( key );
  if (it == m.end()) return defval;
  return it->second;
}

template<typename T> inline std::string ContainerToString(T container) {
  std::ostringstream oss;
  bool first = true;

  oss << "{";
  for (const auto v : container) {
    if (first) {
      first = false;
    } else {
      oss << ", ";
    }
    oss << std::to_string(v);
  }
  oss << "}";
  return oss.str();
}

// this supports both values to be -inf
inline score_t add_log_scores_0(score_t a, score_t b) {
  if ((NEG_INF == a) && (NEG_INF == b)) {
    return NEG_INF;
  }
  if (a > b) {
    return a+log1p(exp(b-a));
  } else {
    return b+log1p(exp(a-b));
  }
}

} /* namespace misc */
#endif /* MISC_H_ */
