#ifndef TEST_UTIL_H_
#define TEST_UTIL_H_

#include <glog/logging.h>

#include <string>
#include <vector>

/** Collects log messages of at least a given severity while alive. */
class LogCapture : public google::LogSink {
 public:
  explicit LogCapture(google::LogSeverity min_severity = GLOG_WARNING)
      : min_severity_(min_severity) {
    google::AddLogSink(this);
  }
  virtual ~LogCapture() {
    google::RemoveLogSink(this);
  }
  virtual void send(google::LogSeverity severity, const char* full_filename,
                    const char* base_filename, int line,
                    const struct ::tm* tm_time, const char* message,
                    size_t message_len) {
    (void)full_filename;
    (void)base_filename;
    (void)line;
    (void)tm_time;
    if (severity >= min_severity_) {
      messages_.push_back(std::string(message, message_len));
      severities_.push_back(severity);
    }
  }
  size_t count(google::LogSeverity severity) const {
    size_t n = 0;
    for (google::LogSeverity s : severities_) {
      if (s == severity) ++n;
    }
    return n;
  }
  bool contains(const std::string& text) const {
    for (const std::string& message : messages_) {
      if (message.find(text) != std::string::npos) return true;
    }
    return false;
  }
  const std::vector<std::string>& messages() const {
    return messages_;
  }

 private:
  google::LogSeverity min_severity_;
  std::vector<std::string> messages_;
  std::vector<google::LogSeverity> severities_;
};

#endif /* TEST_UTIL_H_ */
