#pragma once
#include <random>
#include <sstream>
#include <string>

namespace toolbridge::core::config {

    // Generates an 8-character hex ID with the given prefix, e.g. "tb-3fa09c1e"
    inline std::string generate_instance_id(const std::string& prefix = "tb") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace toolbridge::core::config
