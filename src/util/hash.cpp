#include "util/hash.hpp"

#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace hs::util {

std::string sha256Hex(const std::string_view data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream oss;
    for (const unsigned char c : hash) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

}
