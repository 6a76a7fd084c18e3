#pragma once
#include <string>
#include <random>
#include <sstream>

namespace toolbridge::core::config {

    // Generates a simple 8-character hex ID prefixed with "worker-"
    inline std::string generate_worker_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "worker-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace toolbridge::core::config
