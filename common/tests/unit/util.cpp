#include <lambdalocal/common/exceptions.hpp>
#include <lambdalocal/common/util.hpp>

#include <cstdlib>

#include <gtest/gtest.h>

using namespace lambdalocal::common;

TEST(Util, Getenv)
{
  setenv("LAMBDALOCAL_TEST_VALUE", "42", 1);
  EXPECT_EQ(util::getenv("LAMBDALOCAL_TEST_VALUE"), "42");
  EXPECT_EQ(util::getenv_int("LAMBDALOCAL_TEST_VALUE"), 42);

  setenv("LAMBDALOCAL_TEST_VALUE", "", 1);
  EXPECT_FALSE(util::getenv("LAMBDALOCAL_TEST_VALUE").has_value());
  EXPECT_FALSE(util::getenv_int("LAMBDALOCAL_TEST_VALUE").has_value());

  setenv("LAMBDALOCAL_TEST_VALUE", "12ab", 1);
  EXPECT_THROW(util::getenv_int("LAMBDALOCAL_TEST_VALUE"), InvalidConfigurationError);

  unsetenv("LAMBDALOCAL_TEST_VALUE");
  EXPECT_FALSE(util::getenv_int("LAMBDALOCAL_TEST_VALUE").has_value());
}

TEST(Util, GetenvFlag)
{
  setenv("LAMBDALOCAL_TEST_FLAG", "1", 1);
  EXPECT_TRUE(util::getenv_flag("LAMBDALOCAL_TEST_FLAG"));

  setenv("LAMBDALOCAL_TEST_FLAG", "false", 1);
  EXPECT_FALSE(util::getenv_flag("LAMBDALOCAL_TEST_FLAG"));

  setenv("LAMBDALOCAL_TEST_FLAG", "0", 1);
  EXPECT_FALSE(util::getenv_flag("LAMBDALOCAL_TEST_FLAG"));

  unsetenv("LAMBDALOCAL_TEST_FLAG");
  EXPECT_FALSE(util::getenv_flag("LAMBDALOCAL_TEST_FLAG"));
}

TEST(Util, Timestamps)
{
  std::chrono::system_clock::time_point time{std::chrono::milliseconds{1609459200250}};

  EXPECT_EQ(util::unix_ms(time), 1609459200250);
  EXPECT_EQ(util::format_utc_timestamp(time), "2021-01-01T00:00:00.250Z");
}
