#ifndef FINNISH_PID_GENERATOR_H_
#define FINNISH_PID_GENERATOR_H_

#include <random>
#include <string>
#include <vector>

#include "FinnishPID.hpp"
#include "FinnishPIDUtil.hpp"

// Generates random, well formed Finnish PIDs for testing.
//
// Birth years are drawn from [min_year, max_year], which must lie within
// 1800-2099. For the 1900s and 2000s the century character is picked at
// random among all characters of that century. The same PID may come out
// more than once in a batch. Invalid PIDs are never generated.
//
// A generator owns its random engine, use one instance per thread.
class FinnishPIDGenerator {
 public:
  static const int kMinYear = 1800;
  static const int kMaxYear = 2099;

  struct Config {
    int min_year = 1966;
    int max_year = 2042;
    FinnishPID::Validity validity = FinnishPID::kValid;
  };

  FinnishPIDGenerator() : FinnishPIDGenerator(Config()) {}

  explicit FinnishPIDGenerator(const Config& config)
      : config_(config), mt_(std::random_device()()) {}

  // Fixed seed, for reproducible output.
  FinnishPIDGenerator(const Config& config, unsigned int seed)
      : config_(config), mt_(seed) {}

  const Config& config() const { return config_; }

  static bool IsValidConfig(const Config& config) {
    if (config.min_year < kMinYear || config.max_year > kMaxYear) {
      return false;
    }
    if (config.min_year > config.max_year) {
      return false;
    }
    return config.validity == FinnishPID::kValid ||
           config.validity == FinnishPID::kTest;
  }

  // Generates a single PID. Returns false and clears the output if the
  // configuration is out of range or no PID could be built.
  bool Generate(std::string *pid) {
    *pid = "";
    if (!IsValidConfig(config_)) {
      return false;
    }

    int year, month, day;
    RandomDate(&year, &month, &day);
    if (!FinnishPIDUtil::IsValidDate(year, month, day)) {
      return false;
    }

    std::vector<char> century_chars =
        FinnishPIDUtil::CenturyCharsForYear(year);
    if (century_chars.empty()) {
      return false;
    }
    char century_char = century_chars[RandomInt(
        0, static_cast<int>(century_chars.size()) - 1)];

    int individual_number =
        config_.validity == FinnishPID::kValid
            ? RandomInt(FinnishPID::kMinValidIndividualNumber,
                        FinnishPID::kMaxValidIndividualNumber)
            : RandomInt(FinnishPID::kMinTestIndividualNumber,
                        FinnishPID::kMaxTestIndividualNumber);

    std::string date = FinnishPIDUtil::TwoDigits(day) +
                       FinnishPIDUtil::TwoDigits(month) +
                       FinnishPIDUtil::TwoDigits(year % 100);
    std::string number = std::to_string(individual_number / 100) +
                         FinnishPIDUtil::TwoDigits(individual_number % 100);

    char control_char;
    if (!FinnishPIDUtil::ControlChar(date + number, &control_char)) {
      return false;
    }
    *pid = date + century_char + number + control_char;
    return true;
  }

  // Generates up to count PIDs. Failed attempts are skipped, so the result
  // may hold fewer than count PIDs. A rejected configuration gives none.
  std::vector<std::string> GenerateMany(int count) {
    std::vector<std::string> pids;
    if (count <= 0 || !IsValidConfig(config_)) {
      return pids;
    }
    std::string pid;
    while (count--) {
      if (Generate(&pid)) {
        pids.push_back(pid);
      }
    }
    return pids;
  }

 private:
  int RandomInt(int min, int max) {
    std::uniform_int_distribution<int> dist(min, max);
    return dist(mt_);
  }

  // Day is drawn over the real length of the chosen month, so the 29th to
  // 31st and leap days come out with the right frequency.
  void RandomDate(int *year, int *month, int *day) {
    *year = RandomInt(config_.min_year, config_.max_year);
    *month = RandomInt(1, 12);
    *day = RandomInt(1, FinnishPIDUtil::DaysInMonth(*year, *month));
  }

  Config config_;
  std::mt19937 mt_;
};

#endif  // FINNISH_PID_GENERATOR_H_
