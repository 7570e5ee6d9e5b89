#ifndef LOGGING_H
#define LOGGING_H
#include "base/LogStream.hpp"
#include "base/TimeStamp.hpp"

namespace timealg {
namespace base {

class Logger {
 public:
  enum LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL,
    NUM_LOG_LEVELS,
  };

  // Basename of __FILE__, resolved at compile time for literals.
  class SourceFile {
   public:
    template <int N>
    inline SourceFile(const char (&arr)[N]) : data_(arr), size_(N - 1) {
      const char *slash = strrchr(data_, '/');
      if (slash) {
        data_ = slash + 1;
        size_ -= static_cast<int>(data_ - arr);
      }
    }

    explicit SourceFile(const char *filename) : data_(filename) {
      const char *slash = strrchr(filename, '/');
      if (slash) {
        data_ = slash + 1;
      }
      size_ = static_cast<int>(strlen(data_));
    }

    const char *data_;
    int size_;
  };

  Logger(SourceFile file, int line);
  Logger(SourceFile file, int line, LogLevel level);
  Logger(SourceFile file, int line, LogLevel level, const char *func);
  ~Logger();

  LogStream &stream() { return impl_.stream_; }

  static LogLevel logLevel();
  static void setLogLevel(LogLevel level);

  typedef void (*OutputFunc)(const char *msg, int len);
  typedef void (*FlushFunc)();

  static void setOutput(OutputFunc);
  static void setFlush(FlushFunc);

 private:
  class Impl {
   public:
    typedef Logger::LogLevel LogLevel;
    Impl(LogLevel level, const SourceFile &file, int line);
    void formatTime();
    void finish();

    TimeStamp time_;
    LogStream stream_;
    LogLevel level_;
    int line_;
    SourceFile basename_;
  };

  Impl impl_;
};

extern Logger::LogLevel g_logLevel;

inline Logger::LogLevel Logger::logLevel() { return g_logLevel; }

//
// CAUTION: do not write:
//
// if (good)
//   LOG_INFO << "Good news";
// else
//   LOG_WARN << "Bad news";
//
// this expends to
//
// if (good)
//   if (logging_INFO)
//     logInfoStream << "Good news";
//   else
//     logWarnStream << "Bad news";
//
#define LOG_TRACE                                                             \
  if (::timealg::base::Logger::logLevel() <= ::timealg::base::Logger::TRACE)  \
  ::timealg::base::Logger(__FILE__, __LINE__, ::timealg::base::Logger::TRACE, \
                          __func__)                                           \
      .stream()
#define LOG_DEBUG                                                             \
  if (::timealg::base::Logger::logLevel() <= ::timealg::base::Logger::DEBUG)  \
  ::timealg::base::Logger(__FILE__, __LINE__, ::timealg::base::Logger::DEBUG, \
                          __func__)                                           \
      .stream()
#define LOG_INFO                                                            \
  if (::timealg::base::Logger::logLevel() <= ::timealg::base::Logger::INFO) \
  ::timealg::base::Logger(__FILE__, __LINE__).stream()
#define LOG_WARN                                                     \
  ::timealg::base::Logger(__FILE__, __LINE__,                        \
                          ::timealg::base::Logger::WARN)             \
      .stream()
#define LOG_ERROR                                                    \
  ::timealg::base::Logger(__FILE__, __LINE__,                        \
                          ::timealg::base::Logger::ERROR)            \
      .stream()
#define LOG_FATAL                                                    \
  ::timealg::base::Logger(__FILE__, __LINE__,                        \
                          ::timealg::base::Logger::FATAL)            \
      .stream()

}  // namespace base
}  // namespace timealg

#endif
