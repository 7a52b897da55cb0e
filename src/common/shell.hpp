#pragma once

#include <cstdlib>
#include <string>

namespace calmroom {
namespace shell {

// Single-quote for /bin/sh
inline std::string quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

// True when the command ran and exited with status 0
inline bool run(const std::string& command) {
    int result = system(command.c_str());
    return result == 0;
}

} // namespace shell
} // namespace calmroom
