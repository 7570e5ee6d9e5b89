#include <stdio.h>

#include <limits>
#include <string>

#include "base/Error.hpp"
#include "base/LogStream.hpp"
#include "base/Logging.hpp"
#include "base/TimeAlgException.hpp"
#include "base/TimeStamp.hpp"
#include "gtest/gtest.h"

namespace timealg {
namespace base {

std::string g_captured;

void captureOutput(const char *msg, int len) { g_captured.append(msg, len); }

void stderrOutput(const char *msg, int len) { fwrite(msg, 1, len, stderr); }

class BaseTest : public testing::Test {
 protected:
  void TearDown() {
    Logger::setOutput(stderrOutput);
    Logger::setLogLevel(Logger::INFO);
  }
};

TEST_F(BaseTest, TestError) {
  error::Error err;
  ASSERT_FALSE(err);
  err.set("ttl must be positive");
  ASSERT_TRUE(err);
  err.wrap("cache options");
  ASSERT_EQ("cache options: ttl must be positive", err.error());
  ASSERT_EQ("ttl must be positive", error::unwrap(err).error());
  err.unwrap();
  ASSERT_TRUE(err == std::string("ttl must be positive"));
  ASSERT_EQ("a: b", error::wrap(error::Error("b"), "a").error());
}

TEST_F(BaseTest, TestException) {
  try {
    throw InvalidArgument(error::Error("bad gap"));
  } catch (const TimeAlgException &e) {
    ASSERT_STREQ("bad gap", e.what());
  }
  ASSERT_THROW(throw ValidationError("x"), TimeAlgException);
  ASSERT_THROW(throw ConstructionError("x"), std::exception);
}

TEST_F(BaseTest, TestLogStream) {
  LogStream s;
  s << 0 << ' ' << -42 << ' ' << std::numeric_limits<int64_t>::min() << ' '
    << std::numeric_limits<uint64_t>::max() << ' ' << true << ' '
    << std::string("x") << ' ' << static_cast<const char *>(NULL);
  ASSERT_EQ("0 -42 -9223372036854775808 18446744073709551615 1 x (null)",
            s.buffer().toString());
  s.resetBuffer();
  ASSERT_EQ(0, s.buffer().length());
}

TEST_F(BaseTest, TestLogger) {
  Logger::setOutput(captureOutput);
  g_captured.clear();

  LOG_INFO << "cache miss " << 42;
  ASSERT_NE(std::string::npos, g_captured.find("[INFO]"));
  ASSERT_NE(std::string::npos, g_captured.find("cache miss 42"));
  ASSERT_NE(std::string::npos, g_captured.find("base_test.cc"));

  g_captured.clear();
  LOG_DEBUG << "hidden";
  ASSERT_TRUE(g_captured.empty());

  Logger::setLogLevel(Logger::TRACE);
  LOG_TRACE << "shown";
  ASSERT_NE(std::string::npos, g_captured.find("shown"));
}

TEST_F(BaseTest, TestTimeStamp) {
  TimeStamp t1 = TimeStamp::fromUnixTime(1700000000);
  TimeStamp t2 = addTime(t1, 1.5);
  ASSERT_TRUE(t1 < t2);
  ASSERT_DOUBLE_EQ(1.5, timeDifference(t2, t1));
  ASSERT_EQ("20231114 22:13:20", t1.toFormattedString(false));
  ASSERT_TRUE(TimeStamp::now().valid());
}

}  // namespace base
}  // namespace timealg

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
