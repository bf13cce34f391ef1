#pragma once

#include <filesystem>
#include <string>

namespace hs::config {

// Process facts captured once at startup and handed to whoever needs them.
struct Environment {
    std::filesystem::path home;
    std::string hostname;

    static Environment capture();
};

}
