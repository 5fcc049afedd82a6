#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "finnishpid.pb.h"

#include "FinnishPID.hpp"
#include "FinnishPIDGenerator.hpp"
#include "FinnishPIDMessage.hpp"

void PrintUsage() {
  std::cout << "Usage: ./fi-pid-gen count [valid|test] [min_year max_year] "
            << "[text|json]" << std::endl;
}

// Parses a whole argument as a number, atoi would accept "12abc".
bool ParseInt(const char* arg, int *value) {
  char* end = nullptr;
  long parsed = strtol(arg, &end, 10);
  if (end == arg || *end != '\0' || parsed < -100000 || parsed > 100000) {
    return false;
  }
  *value = (int) parsed;
  return true;
}

int main(int argc, char** argv) {
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  // Check argument count.
  if (argc < 2 || argc > 6) {
    PrintUsage();
    exit(1);
  }

  int n = 0;
  if (!ParseInt(argv[1], &n) || n <= 0) {
    std::cerr << "Count of PIDs to generate must be > 0." << std::endl;
    PrintUsage();
    exit(1);
  }

  FinnishPIDGenerator::Config config;
  bool json = false;
  std::vector<int> years;
  for (int i = 2; i < argc; ++i) {
    int year;
    if (strcmp(argv[i], "valid") == 0) {
      config.validity = FinnishPID::kValid;
    } else if (strcmp(argv[i], "test") == 0) {
      config.validity = FinnishPID::kTest;
    } else if (strcmp(argv[i], "json") == 0) {
      json = true;
    } else if (strcmp(argv[i], "text") == 0) {
      json = false;
    } else if (ParseInt(argv[i], &year)) {
      years.push_back(year);
    } else {
      std::cerr << "Unknown argument \"" << argv[i] << "\"." << std::endl;
      PrintUsage();
      exit(1);
    }
  }

  // Years come in pairs or not at all.
  if (years.size() == 2) {
    config.min_year = years[0];
    config.max_year = years[1];
  } else if (!years.empty()) {
    PrintUsage();
    exit(1);
  }

  if (!FinnishPIDGenerator::IsValidConfig(config)) {
    std::cerr << "Birth years must be within " << FinnishPIDGenerator::kMinYear
              << "-" << FinnishPIDGenerator::kMaxYear
              << " and min_year <= max_year." << std::endl;
    exit(1);
  }

  FinnishPIDGenerator generator(config);
  std::vector<std::string> pids = generator.GenerateMany(n);
  if ((int) pids.size() < n) {
    std::cerr << "Generated only " << pids.size() << " of " << n << " PIDs."
              << std::endl;
  }

  if (json) {
    finnishpid::GeneratedPIDs message;
    FinnishPIDMessage::Fill(config, n, pids, &message);
    std::string out;
    if (!FinnishPIDMessage::ToJson(message, &out)) {
      exit(1);
    }
    std::cout << out << std::endl;
  } else {
    for (const std::string& pid : pids) {
      std::cout << pid << std::endl;
    }
  }

  google::protobuf::ShutdownProtobufLibrary();
  return 0;
}
