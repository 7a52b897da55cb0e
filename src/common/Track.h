#pragma once
#include <string>

namespace calmroom {

struct Track {
    std::string id;
    std::string path;
    std::string title;
    std::string composer;

    // Display string for the music page
    std::string to_string() const {
        if (composer.empty()) {
            return title;
        }
        return composer + " — " + title;
    }
};

} // namespace calmroom
