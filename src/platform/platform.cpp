#include "platform.hpp"
#include <ctime>
#include <mutex>
#include <random>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix) {
    // Use pid + random for uniqueness
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(getpid()));
    static std::mutex rng_mutex;
    std::uniform_int_distribution<int> dist(10000, 99999);

    fs::path p;
    do {
        std::lock_guard<std::mutex> lock(rng_mutex);
        p = temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" + std::to_string(dist(rng)));
    } while (fs::exists(p));
    return p;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
