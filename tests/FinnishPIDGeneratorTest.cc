#include <gtest/gtest.h>

#include <climits>
#include <set>
#include <string>
#include <vector>

#include "FinnishPID.hpp"
#include "FinnishPIDGenerator.hpp"

namespace {

FinnishPIDGenerator::Config MakeConfig(int min_year, int max_year,
                                       FinnishPID::Validity validity) {
  FinnishPIDGenerator::Config config;
  config.min_year = min_year;
  config.max_year = max_year;
  config.validity = validity;
  return config;
}

TEST(FinnishPIDGeneratorTest, DefaultConfig) {
  FinnishPIDGenerator generator;
  EXPECT_EQ(1966, generator.config().min_year);
  EXPECT_EQ(2042, generator.config().max_year);
  EXPECT_EQ(FinnishPID::kValid, generator.config().validity);

  std::vector<std::string> pids = generator.GenerateMany(42);
  ASSERT_EQ(42u, pids.size());
  for (const std::string& pid : pids) {
    FinnishPID result = FinnishPID::Verify(pid);
    EXPECT_EQ(FinnishPID::kValid, result.validity()) << pid;
    EXPECT_GE(result.year(), 1966) << pid;
    EXPECT_LE(result.year(), 2042) << pid;
  }
}

TEST(FinnishPIDGeneratorTest, GeneratedValidPIDs) {
  FinnishPIDGenerator generator(MakeConfig(1800, 2099, FinnishPID::kValid));
  for (int i = 0; i < 1000; ++i) {
    std::string pid;
    ASSERT_TRUE(generator.Generate(&pid));
    ASSERT_EQ(11u, pid.size());
    FinnishPID result = FinnishPID::Verify(pid);
    EXPECT_EQ(FinnishPID::kValid, result.validity()) << pid;
    EXPECT_GE(result.individual_number(), 2) << pid;
    EXPECT_LE(result.individual_number(), 899) << pid;
  }
}

TEST(FinnishPIDGeneratorTest, GeneratedTestPIDs) {
  FinnishPIDGenerator generator(MakeConfig(1800, 2099, FinnishPID::kTest));
  std::vector<std::string> pids = generator.GenerateMany(1000);
  ASSERT_EQ(1000u, pids.size());
  for (const std::string& pid : pids) {
    FinnishPID result = FinnishPID::Verify(pid);
    EXPECT_EQ(FinnishPID::kTest, result.validity()) << pid;
    EXPECT_GE(result.individual_number(), 900) << pid;
  }
}

TEST(FinnishPIDGeneratorTest, SingleYear) {
  FinnishPIDGenerator generator(MakeConfig(1800, 1800, FinnishPID::kValid), 42);
  for (const std::string& pid : generator.GenerateMany(100)) {
    EXPECT_EQ('+', pid[6]) << pid;
    EXPECT_EQ("00", pid.substr(4, 2)) << pid;
    EXPECT_EQ(1800, FinnishPID::Verify(pid).year()) << pid;
  }
}

TEST(FinnishPIDGeneratorTest, CenturyCharAmbiguity) {
  FinnishPIDGenerator generator(MakeConfig(1950, 1950, FinnishPID::kValid), 7);
  std::set<char> century_chars;
  for (const std::string& pid : generator.GenerateMany(500)) {
    century_chars.insert(pid[6]);
  }
  EXPECT_GT(century_chars.size(), 1u);
  EXPECT_EQ(6u, century_chars.size());
  EXPECT_EQ(0u, century_chars.count('+'));
  EXPECT_EQ(0u, century_chars.count('A'));

  generator = FinnishPIDGenerator(MakeConfig(2000, 2099, FinnishPID::kTest), 7);
  century_chars.clear();
  for (const std::string& pid : generator.GenerateMany(500)) {
    century_chars.insert(pid[6]);
  }
  EXPECT_EQ(std::set<char>({'A', 'B', 'C', 'D', 'E', 'F'}), century_chars);
}

TEST(FinnishPIDGeneratorTest, LateDaysOfMonthAreReachable) {
  // Leap year, so Feb 29 can come out too.
  FinnishPIDGenerator generator(MakeConfig(2024, 2024, FinnishPID::kValid), 1);
  std::set<std::string> days;
  for (const std::string& pid : generator.GenerateMany(5000)) {
    days.insert(pid.substr(0, 4));
  }
  EXPECT_EQ(1u, days.count("2902"));
  EXPECT_EQ(1u, days.count("3101"));
  EXPECT_EQ(1u, days.count("3012"));
  EXPECT_EQ(0u, days.count("3102"));
  EXPECT_EQ(0u, days.count("3104"));
}

TEST(FinnishPIDGeneratorTest, SameSeedSameOutput) {
  FinnishPIDGenerator::Config config =
      MakeConfig(1900, 2050, FinnishPID::kValid);
  FinnishPIDGenerator first(config, 1234);
  FinnishPIDGenerator second(config, 1234);
  EXPECT_EQ(first.GenerateMany(20), second.GenerateMany(20));
}

TEST(FinnishPIDGeneratorTest, RejectedConfigs) {
  std::vector<FinnishPIDGenerator::Config> configs = {
    MakeConfig(1799, 2000, FinnishPID::kValid),
    MakeConfig(1900, 2100, FinnishPID::kValid),
    MakeConfig(2000, 1900, FinnishPID::kValid),
    MakeConfig(1900, 2000, FinnishPID::kInvalid),
  };
  for (const FinnishPIDGenerator::Config& config : configs) {
    EXPECT_FALSE(FinnishPIDGenerator::IsValidConfig(config));
    FinnishPIDGenerator generator(config);
    std::string pid = "unchanged";
    EXPECT_FALSE(generator.Generate(&pid));
    EXPECT_EQ("", pid);
    EXPECT_TRUE(generator.GenerateMany(10).empty());
  }
}

TEST(FinnishPIDGeneratorTest, BoundaryYears) {
  EXPECT_TRUE(FinnishPIDGenerator::IsValidConfig(
      MakeConfig(1800, 2099, FinnishPID::kValid)));
  FinnishPIDGenerator generator(MakeConfig(2099, 2099, FinnishPID::kTest));
  std::string pid;
  ASSERT_TRUE(generator.Generate(&pid));
  EXPECT_EQ(2099, FinnishPID::Verify(pid).year());
}

TEST(FinnishPIDGeneratorTest, HugeCountWithRejectedConfig) {
  FinnishPIDGenerator generator(MakeConfig(1700, 1750, FinnishPID::kValid));
  std::vector<std::string> pids;
  EXPECT_NO_THROW(pids = generator.GenerateMany(INT_MAX));
  EXPECT_TRUE(pids.empty());
}

TEST(FinnishPIDGeneratorTest, NonPositiveCount) {
  FinnishPIDGenerator generator;
  EXPECT_TRUE(generator.GenerateMany(0).empty());
  EXPECT_TRUE(generator.GenerateMany(-5).empty());
}

}  // namespace
