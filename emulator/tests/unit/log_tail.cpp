#include <lambdalocal/emulator/log_tail.hpp>

#include <gtest/gtest.h>

using namespace lambdalocal::emulator;

TEST(LogTail, KeepsMostRecent)
{
  LogTail tail{8};

  tail.append("abcdef");
  EXPECT_EQ(tail.contents(), "abcdef");

  tail.append("ghij");
  EXPECT_EQ(tail.contents(), "cdefghij");

  tail.append("0123456789");
  EXPECT_EQ(tail.contents(), "23456789");
  EXPECT_EQ(tail.contents().size(), tail.capacity());

  tail.clear();
  EXPECT_EQ(tail.contents(), "");
}

TEST(LogTail, ReportLogger)
{
  auto tail = std::make_shared<LogTail>();
  auto logger = create_report_logger(tail);

  logger->info("END RequestId: {}", "abcd");
  logger->debug("hidden");

  EXPECT_EQ(tail->contents(), "END RequestId: abcd\n");
}
