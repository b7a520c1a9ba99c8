#pragma once
#include <string>
#include <random>
#include <sstream>

namespace crew::core::config {

    // Returns `prefix` followed by 8 random hex characters, e.g. "goal-3fa9c01b".
    inline std::string generate_id(const std::string& prefix) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace crew::core::config
