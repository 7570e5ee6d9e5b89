#include "base/Logging.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

namespace timealg {
namespace base {

const char *LogLevelName[Logger::NUM_LOG_LEVELS] = {
    "[TRACE] ", "[DEBUG] ", "[INFO]  ", "[WARN]  ", "[ERROR] ", "[FATAL] ",
};

Logger::LogLevel g_logLevel = Logger::INFO;

void defaultOutput(const char *msg, int len) {
  size_t n = fwrite(msg, 1, len, stderr);
  size_t remain = len - n;
  while (remain > 0) {
    size_t x = ::fwrite(msg + n, sizeof(char), remain, stderr);
    if (x == 0) {
      int err = ferror(stderr);
      if (err) {
        fprintf(stderr, "Logging.cpp: defaultOutput() failed %s\n",
                strerror(err));
      }
      break;
    }
    remain = remain - x;
    n += x;
  }
}

void defaultFlush() { fflush(stderr); }

Logger::OutputFunc g_output = defaultOutput;
Logger::FlushFunc g_flush = defaultFlush;

inline LogStream &operator<<(LogStream &s, const Logger::SourceFile &v) {
  s.append(v.data_, v.size_);
  return s;
}

Logger::Impl::Impl(LogLevel level, const SourceFile &file, int line)
    : time_(TimeStamp::now()),
      stream_(),
      level_(level),
      line_(line),
      basename_(file) {
  formatTime();
  stream_ << LogLevelName[level];
}

void Logger::Impl::formatTime() { stream_ << time_.toFormattedString() << ' '; }

void Logger::Impl::finish() {
  stream_ << " - " << basename_ << ':' << line_ << '\n';
}

Logger::Logger(SourceFile file, int line) : impl_(INFO, file, line) {}

Logger::Logger(SourceFile file, int line, LogLevel level, const char *func)
    : impl_(level, file, line) {
  impl_.stream_ << func << ' ';
}

Logger::Logger(SourceFile file, int line, LogLevel level)
    : impl_(level, file, line) {}

Logger::~Logger() {
  impl_.finish();
  const LogStream::Buffer &buf(stream().buffer());
  g_output(buf.data(), buf.length());
  if (impl_.level_ == FATAL) {
    g_flush();
    abort();
  }
}

void Logger::setLogLevel(Logger::LogLevel level) { g_logLevel = level; }

void Logger::setOutput(OutputFunc out) { g_output = out; }

void Logger::setFlush(FlushFunc flush) { g_flush = flush; }

}  // namespace base
}  // namespace timealg
