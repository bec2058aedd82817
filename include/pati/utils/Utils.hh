#pragma once

#include <string>

namespace pati {

class Utils {
public:
  // Thread-safe. Generates prefix + a process-wide sequence number + '_' +
  // `length` random hex digits. Never repeats within one process.
  static std::string generateUniqueId(const std::string& prefix, int length = 8);
};

} // namespace pati
