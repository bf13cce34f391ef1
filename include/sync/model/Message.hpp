#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace hs::sync::model {

struct Message {
    std::string uuid, timestamp, role, content;
    std::string model{};   // empty when the record carried none
    std::string type{};    // structured records only; never serialized
    int64_t tokens{};

    bool operator==(const Message&) const = default;
};

// uuid, timestamp, role, content, then model and tokens only when set.
// Key order is part of the content hash contract.
nlohmann::ordered_json toCanonicalJson(const Message& m);

}
