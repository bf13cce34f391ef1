#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>

namespace hs::sync::model {

struct LogFile {
    std::filesystem::path path;
    std::string project_path;   // "/" for files directly under the scan root
    std::string session_id;     // file name without the extension
    std::time_t mod_time{};
    std::uintmax_t size{};
};

}
