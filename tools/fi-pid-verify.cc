#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "finnishpid.pb.h"

#include "FinnishPID.hpp"
#include "FinnishPIDDescription.hpp"
#include "FinnishPIDMessage.hpp"

void PrintUsage() {
  std::cerr << "Usage: ./fi-pid-verify [text|json|proto] [pid ...]" << std::endl;
  std::cerr << "Reads PIDs from standard input, one per line, when none are "
            << "given." << std::endl;
}

int main(int argc, char** argv) {
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  // Sort out output format, it is optional.
  int first_pid_arg = 1;
  std::string format = "text";
  if (argc >= 2) {
    std::string arg(argv[1]);
    if (arg == "text" || arg == "json" || arg == "proto") {
      format = arg;
      first_pid_arg = 2;
    } else if (arg == "-h" || arg == "--help") {
      PrintUsage();
      exit(1);
    }
  }

  // One lambda per output format.
  auto text_fn = [] (const FinnishPID& result) -> bool {
    std::cout << FinnishPIDDescription::Describe(result) << std::endl;
    return true;
  };
  auto json_fn = [] (const FinnishPID& result) -> bool {
    finnishpid::VerificationResult message;
    FinnishPIDMessage::Fill(result, &message);
    std::string json;
    if (!FinnishPIDMessage::ToJson(message, &json)) return false;
    std::cout << json << std::endl;
    return true;
  };
  auto proto_fn = [] (const FinnishPID& result) -> bool {
    finnishpid::VerificationResult message;
    FinnishPIDMessage::Fill(result, &message);
    std::string text;
    if (!FinnishPIDMessage::ToText(message, &text)) return false;
    std::cout << text << std::endl;
    return true;
  };

  std::function<bool(const FinnishPID& result)> print;
  if (format == "json") {
    print = json_fn;
  } else if (format == "proto") {
    print = proto_fn;
  } else {
    print = text_fn;
  }

  // Exit status is 0 only if every PID was a real or a test PID.
  int pid_count = 0;
  bool all_verified = true;
  auto verify_fn = [&] (const std::string& pid) -> void {
    FinnishPID result = FinnishPID::Verify(pid);
    if (!print(result)) {
      exit(1);
    }
    if (result.validity() == FinnishPID::kInvalid) {
      all_verified = false;
    }
    ++pid_count;
  };

  if (first_pid_arg < argc) {
    for (int i = first_pid_arg; i < argc; ++i) {
      verify_fn(argv[i]);
    }
  } else {
    std::ios::sync_with_stdio(false);
    std::string pid;
    while (std::getline(std::cin, pid)) {
      // Tolerate CRLF line endings.
      if (!pid.empty() && pid[pid.size() - 1] == '\r') {
        pid.erase(pid.size() - 1);
      }
      verify_fn(pid);
    }
  }

  if (pid_count == 0) {
    PrintUsage();
    return 1;
  }

  google::protobuf::ShutdownProtobufLibrary();
  return all_verified ? 0 : 1;
}
