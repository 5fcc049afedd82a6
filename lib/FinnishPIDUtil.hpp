#ifndef FINNISH_PID_UTIL_H_
#define FINNISH_PID_UTIL_H_

#include <cctype>
#include <string>
#include <vector>

// Tables and arithmetic shared by the verifier and the generator.
class FinnishPIDUtil {
 public:
  static const size_t kPIDLength = 11;
  static const size_t kCenturyCharIndex = 6;
  static const size_t kIndividualNumberIndex = 7;
  static const size_t kControlCharIndex = 10;
  static const int kCheckSumDivider = 31;

  struct CenturyChar {
    char symbol;
    int century;
  };

  // All characters allowed in the century position and the century each of
  // them stands for.
  static const std::vector<CenturyChar>& CenturyChars() {
    static const std::vector<CenturyChar> century_chars = {
      {'+', 1800},
      {'-', 1900}, {'Y', 1900}, {'X', 1900},
      {'W', 1900}, {'V', 1900}, {'U', 1900},
      {'A', 2000}, {'B', 2000}, {'C', 2000},
      {'D', 2000}, {'E', 2000}, {'F', 2000},
    };
    return century_chars;
  }

  // G, I, O and Q are left out so they can't be mistaken for digits.
  static const std::string& CheckSumChars() {
    static const std::string check_sum_chars = "0123456789ABCDEFHJKLMNPRSTUVWXY";
    return check_sum_chars;
  }

  // Looks up the century for a century character. Returns false if the
  // character is not a century character.
  static bool CenturyFromChar(char c, int *century) {
    for (const CenturyChar& entry : CenturyChars()) {
      if (entry.symbol == c) {
        *century = entry.century;
        return true;
      }
    }
    return false;
  }

  static bool IsCenturyChar(char c) {
    int century;
    return CenturyFromChar(c, &century);
  }

  // Returns every century character that maps to the century of the supplied
  // year. Only the hundreds of the year matter.
  static std::vector<char> CenturyCharsForYear(int year) {
    std::vector<char> result;
    for (const CenturyChar& entry : CenturyChars()) {
      if ((year / 100) * 100 == entry.century) {
        result.push_back(entry.symbol);
      }
    }
    return result;
  }

  static bool AllDigits(const std::string& s) {
    for (char c : s) {
      if (!isdigit(static_cast<unsigned char>(c))) {
        return false;
      }
    }
    return true;
  }

  // Computes the control character for the nine digits ddmmyynnn. Returns
  // false if the input is not exactly nine ASCII digits.
  static bool ControlChar(const std::string& digits, char *control_char) {
    if (digits.size() != 9 || !AllDigits(digits)) {
      return false;
    }
    // At most 999999999, fits an int.
    int checksum = 0;
    for (char c : digits) {
      checksum = checksum * 10 + (c - '0');
    }
    *control_char = CheckSumChars()[checksum % kCheckSumDivider];
    return true;
  }

  static bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  }

  // Proleptic Gregorian month length, 0 for months outside 1-12.
  static int DaysInMonth(int year, int month) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
      return 0;
    }
    if (month == 2 && IsLeapYear(year)) {
      return 29;
    }
    return days[month - 1];
  }

  static bool IsValidDate(int year, int month, int day) {
    return day >= 1 && day <= DaysInMonth(year, month);
  }

  // Counts UTF-8 code points by skipping continuation bytes.
  static size_t CodePointCount(const std::string& s) {
    size_t count = 0;
    for (char c : s) {
      if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
        ++count;
      }
    }
    return count;
  }

  // Two digit, zero padded.
  static std::string TwoDigits(int value) {
    std::string result(2, '0');
    result[0] += (value / 10) % 10;
    result[1] += value % 10;
    return result;
  }
};

#endif  // FINNISH_PID_UTIL_H_
