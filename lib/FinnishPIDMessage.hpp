#ifndef FINNISH_PID_MESSAGE_H_
#define FINNISH_PID_MESSAGE_H_

#include <google/protobuf/stubs/common.h>
#include <google/protobuf/text_format.h>
#include <google/protobuf/util/json_util.h>
#include <iostream>
#include <string>
#include <vector>

#include "finnishpid.pb.h"

#include "FinnishPID.hpp"
#include "FinnishPIDDescription.hpp"
#include "FinnishPIDGenerator.hpp"

// Converts verification results and generated batches into their protobuf
// messages and renders those as text format or JSON.
class FinnishPIDMessage {
 public:
  static finnishpid::Validity ToProto(FinnishPID::Validity validity) {
    switch (validity) {
      case FinnishPID::kValid:
        return finnishpid::VALIDITY_VALID;
      case FinnishPID::kTest:
        return finnishpid::VALIDITY_TEST;
      case FinnishPID::kInvalid:
        break;
    }
    return finnishpid::VALIDITY_INVALID;
  }

  static finnishpid::Gender ToProto(FinnishPID::Gender gender) {
    switch (gender) {
      case FinnishPID::kMale:
        return finnishpid::GENDER_MALE;
      case FinnishPID::kFemale:
        return finnishpid::GENDER_FEMALE;
      case FinnishPID::kUndefined:
        break;
    }
    return finnishpid::GENDER_UNDEFINED;
  }

  static void Fill(const FinnishPID& result,
                   finnishpid::VerificationResult *message) {
    message->Clear();
    message->set_pid(result.pid());
    message->set_validity(ToProto(result.validity()));
    message->set_gender(ToProto(result.gender()));
    if (result.has_birth_date()) {
      finnishpid::BirthDate *birth_date = message->mutable_birth_date();
      birth_date->set_year(result.year());
      birth_date->set_month(result.month());
      birth_date->set_day(result.day());
      message->set_date_string(result.DateString());
    }
    if (result.has_individual_number()) {
      message->set_individual_number(result.individual_number());
    }
    message->set_description(FinnishPIDDescription::Describe(result));
  }

  static void Fill(const FinnishPIDGenerator::Config& config,
                   int requested_count,
                   const std::vector<std::string>& pids,
                   finnishpid::GeneratedPIDs *message) {
    message->Clear();
    message->set_requested_count(requested_count);
    message->set_validity(ToProto(config.validity));
    message->set_min_year(config.min_year);
    message->set_max_year(config.max_year);
    for (const std::string& pid : pids) {
      message->add_pids(pid);
    }
  }

  static bool ToText(const google::protobuf::Message& message,
                     std::string *text) {
    *text = "";
    if (!google::protobuf::TextFormat::PrintToString(message, text)) {
      std::cerr << "FinnishPIDMessage::ToText failed to print "
                << message.GetTypeName() << "." << std::endl;
      *text = "";
      return false;
    }
    return true;
  }

  // Field names are kept as in the .proto file and enum values are printed
  // by name. Fields with default values are printed too, so every output
  // has the same keys.
  static bool ToJson(const google::protobuf::Message& message,
                     std::string *json) {
    *json = "";
    google::protobuf::util::JsonPrintOptions options;
#if GOOGLE_PROTOBUF_VERSION >= 5026000
    options.always_print_fields_with_no_presence = true;
#else
    options.always_print_primitive_fields = true;
#endif
    options.preserve_proto_field_names = true;
    auto status =
        google::protobuf::util::MessageToJsonString(message, json, options);
    if (!status.ok()) {
      std::cerr << "FinnishPIDMessage::ToJson: " << status.ToString()
                << std::endl;
      *json = "";
      return false;
    }
    return true;
  }
};

#endif  // FINNISH_PID_MESSAGE_H_
