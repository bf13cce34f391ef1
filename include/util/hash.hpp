#pragma once

#include <string>
#include <string_view>

namespace hs::util {

// Lowercase hex SHA-256 of the raw bytes.
std::string sha256Hex(std::string_view data);

}
