#ifndef FINNISH_PID_DESCRIPTION_H_
#define FINNISH_PID_DESCRIPTION_H_

#include <string>

#include "FinnishPID.hpp"

// English, human readable summaries of verification results. Translations
// are left to the caller, who can build its own strings from the enums.
class FinnishPIDDescription {
 public:
  static std::string GenderName(FinnishPID::Gender gender) {
    switch (gender) {
      case FinnishPID::kMale:
        return "male";
      case FinnishPID::kFemale:
        return "female";
      case FinnishPID::kUndefined:
        break;
    }
    return "undefined";
  }

  static std::string ValidityName(FinnishPID::Validity validity) {
    switch (validity) {
      case FinnishPID::kValid:
        return "valid";
      case FinnishPID::kTest:
        return "test";
      case FinnishPID::kInvalid:
        break;
    }
    return "invalid";
  }

  // One line summary, e.g.
  //   "Valid PID: 050301-679T, born: 5.3.1901, gender: male"
  static std::string Describe(const FinnishPID& result) {
    switch (result.validity()) {
      case FinnishPID::kValid:
        return "Valid PID: " + result.pid() + Details(result);
      case FinnishPID::kTest:
        return "Test PID: " + result.pid() + Details(result);
      case FinnishPID::kInvalid:
        break;
    }
    return "Invalid PID: " + result.pid();
  }

 private:
  static std::string Details(const FinnishPID& result) {
    return ", born: " + result.DateString() +
           ", gender: " + GenderName(result.gender());
  }
};

#endif  // FINNISH_PID_DESCRIPTION_H_
