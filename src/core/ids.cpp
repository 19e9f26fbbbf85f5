#include "rms/core/ids.hpp"

#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace rms {

std::string generate_token(std::size_t random_bytes) {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    std::ostringstream oss;
    std::lock_guard lock(mutex);
    for (std::size_t i = 0; i < random_bytes; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(engine() & 0xffU);
    }
    return oss.str();
}

std::string generate_id(const std::string& prefix) {
    return prefix + "-" + generate_token(8);
}

} // namespace rms
