#pragma once

#include "sync/model/Message.hpp"

#include <string>
#include <vector>

namespace hs::sync::model {

// Never empty: "no new messages" is represented by the absence of a Delta.
struct Delta {
    std::string session_id, project_path;
    std::vector<Message> messages;
    std::string new_last_uuid;
};

}
