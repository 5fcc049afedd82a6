#ifndef FINNISH_PID_H_
#define FINNISH_PID_H_

#include <cstdlib>
#include <string>

#include "FinnishPIDUtil.hpp"

// Result of verifying a Finnish Personal Identity Code.
//
// The code has the form ddmmyyCnnnK, where:
//   * ddmmyy is the date of birth.
//   * C is the century character: '+' for 1800, one of '-', 'Y', 'X', 'W',
//     'V', 'U' for 1900 and one of 'A' to 'F' for 2000.
//   * nnn is the individual number of persons born on that day. Odd numbers
//     are given to males, even numbers to females. 002-899 are real codes,
//     900-999 are for testing only.
//   * K is the control character computed from ddmmyynnn.
//
// Use FinnishPID::Verify() to build one. Verification never fails: anything
// that is not a well formed code ends up as kInvalid.
class FinnishPID {
 public:
  enum Validity {
    kInvalid,
    kValid,
    kTest,
  };

  enum Gender {
    kUndefined,
    kMale,
    kFemale,
  };

  static const int kMinValidIndividualNumber = 2;
  static const int kMaxValidIndividualNumber = 899;
  static const int kMinTestIndividualNumber = 900;
  static const int kMaxTestIndividualNumber = 999;

  struct BirthDate {
    int year;
    int month;
    int day;

    bool operator==(const BirthDate& other) const {
      return year == other.year && month == other.month && day == other.day;
    }

    bool operator<(const BirthDate& other) const {
      if (year != other.year) return year < other.year;
      if (month != other.month) return month < other.month;
      return day < other.day;
    }
  };

  static FinnishPID Verify(const std::string& pid) {
    FinnishPID result(pid);

    // Counted in characters, a multi byte character is still one.
    if (FinnishPIDUtil::CodePointCount(pid) != FinnishPIDUtil::kPIDLength) {
      return result;
    }
    // Every position holds an ASCII character in a well formed code.
    if (pid.size() != FinnishPIDUtil::kPIDLength) {
      return result;
    }

    int individual_number;
    result.has_individual_number_ =
        ParseIndividualNumber(pid, &individual_number);
    if (result.has_individual_number_) {
      result.individual_number_ = individual_number;
    }

    int century;
    if (!FinnishPIDUtil::CenturyFromChar(
            pid[FinnishPIDUtil::kCenturyCharIndex], &century)) {
      return result;
    }

    BirthDate birth_date;
    if (!ParseBirthDate(pid.substr(0, 6), century, &birth_date)) {
      return result;
    }

    if (!HasCorrectControlChar(pid)) {
      return result;
    }

    // The control character covers the individual number digits, so they
    // parsed above.
    if (!result.has_individual_number_) {
      return result;
    }

    Validity validity = ClassifyIndividualNumber(individual_number);
    if (validity == kInvalid) {
      return result;
    }
    result.validity_ = validity;
    result.gender_ = individual_number % 2 == 0 ? kFemale : kMale;
    result.birth_date_ = birth_date;
    result.has_birth_date_ = true;
    return result;
  }

  static Validity ClassifyIndividualNumber(int individual_number) {
    if (individual_number >= kMinValidIndividualNumber &&
        individual_number <= kMaxValidIndividualNumber) {
      return kValid;
    }
    if (individual_number >= kMinTestIndividualNumber &&
        individual_number <= kMaxTestIndividualNumber) {
      return kTest;
    }
    return kInvalid;
  }

  const std::string& pid() const { return pid_; }
  Validity validity() const { return validity_; }
  Gender gender() const { return gender_; }

  // True only for real codes, test codes are not valid.
  bool IsValid() const { return validity_ == kValid; }

  bool has_birth_date() const { return has_birth_date_; }
  const BirthDate& birth_date() const { return birth_date_; }

  // Calendar fields of the birth date, 0 when there is no birth date.
  int year() const { return has_birth_date_ ? birth_date_.year : 0; }
  int month() const { return has_birth_date_ ? birth_date_.month : 0; }
  int day() const { return has_birth_date_ ? birth_date_.day : 0; }

  // Set whenever the nnn part holds three digits, even for invalid codes.
  bool has_individual_number() const { return has_individual_number_; }
  int individual_number() const { return individual_number_; }

  // Formats the birth date as d.m.yyyy, e.g. "5.3.1901". Returns false and
  // leaves the output empty when there is no birth date.
  bool DateString(std::string *date_string) const {
    *date_string = "";
    if (!has_birth_date_) {
      return false;
    }
    *date_string = std::to_string(birth_date_.day) + "." +
                   std::to_string(birth_date_.month) + "." +
                   std::to_string(birth_date_.year);
    return true;
  }

  std::string DateString() const {
    std::string date_string;
    DateString(&date_string);
    return date_string;
  }

  bool operator==(const FinnishPID& other) const {
    return pid_ == other.pid_;
  }

  bool operator!=(const FinnishPID& other) const {
    return pid_ != other.pid_;
  }

  // Orders valid codes by birth date, then by individual number. Test and
  // invalid codes never compare less than anything, which is not a strict
  // weak ordering over mixed input: only sort all valid codes, or use
  // std::stable_sort with the test and invalid codes already at the end.
  bool operator<(const FinnishPID& other) const {
    if (validity_ != kValid || other.validity_ != kValid) {
      return false;
    }
    if (!(birth_date_ == other.birth_date_)) {
      return birth_date_ < other.birth_date_;
    }
    return individual_number_ < other.individual_number_;
  }

 private:
  explicit FinnishPID(const std::string& pid)
      : pid_(pid),
        validity_(kInvalid),
        gender_(kUndefined),
        birth_date_{0, 0, 0},
        has_birth_date_(false),
        individual_number_(0),
        has_individual_number_(false) {}

  static bool ParseIndividualNumber(const std::string& pid,
                                    int *individual_number) {
    std::string digits = pid.substr(FinnishPIDUtil::kIndividualNumberIndex, 3);
    if (!FinnishPIDUtil::AllDigits(digits)) {
      return false;
    }
    *individual_number = atoi(digits.c_str());
    return true;
  }

  // Parses ddmmyy using the century from the century character.
  static bool ParseBirthDate(const std::string& date, int century,
                             BirthDate *birth_date) {
    if (date.size() != 6 || !FinnishPIDUtil::AllDigits(date)) {
      return false;
    }
    int day = atoi(date.substr(0, 2).c_str());
    int month = atoi(date.substr(2, 2).c_str());
    int year = century + atoi(date.substr(4, 2).c_str());
    if (!FinnishPIDUtil::IsValidDate(year, month, day)) {
      return false;
    }
    birth_date->year = year;
    birth_date->month = month;
    birth_date->day = day;
    return true;
  }

  static bool HasCorrectControlChar(const std::string& pid) {
    std::string digits =
        pid.substr(0, 6) + pid.substr(FinnishPIDUtil::kIndividualNumberIndex, 3);
    char expected_control_char;
    if (!FinnishPIDUtil::ControlChar(digits, &expected_control_char)) {
      return false;
    }
    return expected_control_char == pid[FinnishPIDUtil::kControlCharIndex];
  }

  std::string pid_;
  Validity validity_;
  Gender gender_;
  BirthDate birth_date_;
  bool has_birth_date_;
  int individual_number_;
  bool has_individual_number_;
};

#endif  // FINNISH_PID_H_
