#include "pati/utils/Utils.hh"
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace pati {

std::string Utils::generateUniqueId(const std::string& prefix, int length) {
    static std::mutex idMutex;
    std::lock_guard<std::mutex> lock(idMutex);

    static std::mt19937 gen(std::random_device{}());
    static std::uniform_int_distribution<> dis(0, 15);
    // Listener ids are removal keys, so a repeated id would unregister the
    // wrong listener. The sequence number rules that out within a process.
    static uint64_t sequence = 0;

    std::stringstream ss;
    ss << prefix << std::hex << ++sequence << '_';

    for (int i = 0; i < length; i++) {
        ss << dis(gen);
    }

    return ss.str();
}

} // namespace pati
