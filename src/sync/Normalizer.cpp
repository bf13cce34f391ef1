#include "sync/Normalizer.hpp"
#include "sync/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

using namespace hs::sync;
using namespace hs::sync::model;
using namespace hs::logging;
using json = nlohmann::json;

namespace {

// Missing and null both leave `out` empty; any other non-string is a mismatch.
bool readString(const json& obj, const char* key, std::string& out) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

bool readTokens(const json& obj, int64_t& out) {
    const auto it = obj.find("tokens");
    if (it == obj.end() || it->is_null()) return true;
    if (!it->is_number_integer()) return false;
    out = it->get<int64_t>();
    return true;
}

// A plain string is used verbatim; for a list of parts only the first
// {"type":"text"} part counts.
bool readContent(const json& message, std::string& out) {
    const auto it = message.find("content");
    if (it == message.end() || it->is_null()) return true;
    if (it->is_string()) {
        out = it->get<std::string>();
        return true;
    }
    if (!it->is_array()) return false;

    for (const auto& part : *it) {
        if (!part.is_object()) continue;
        const auto type = part.find("type");
        if (type == part.end() || !type->is_string() || type->get<std::string>() != "text") continue;
        const auto text = part.find("text");
        if (text != part.end() && text->is_string()) out = text->get<std::string>();
        break;
    }
    return true;
}

bool isUsable(const Message& m) { return !m.uuid.empty() && !m.role.empty(); }

}

std::optional<Message> Normalizer::fromStructured(const json& record) {
    if (!record.is_object()) return std::nullopt;

    const auto inner = record.find("message");
    if (inner == record.end() || !inner->is_object()) return std::nullopt;

    Message m;
    if (!readString(record, "uuid", m.uuid)
        || !readString(record, "timestamp", m.timestamp)
        || !readString(record, "type", m.type)
        || !readString(*inner, "role", m.role)
        || !readString(*inner, "model", m.model)
        || !readContent(*inner, m.content))
        return std::nullopt;

    if (!isUsable(m)) return std::nullopt;
    return m;
}

std::optional<Message> Normalizer::fromLegacy(const json& record) {
    if (!record.is_object()) return std::nullopt;

    Message m;
    if (!readString(record, "uuid", m.uuid)
        || !readString(record, "timestamp", m.timestamp)
        || !readString(record, "role", m.role)
        || !readString(record, "content", m.content)
        || !readString(record, "model", m.model)
        || !readTokens(record, m.tokens))
        return std::nullopt;

    if (!isUsable(m)) return std::nullopt;
    return m;
}

std::optional<Message> Normalizer::normalizeLine(std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.empty()) return std::nullopt;

    const auto record = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (record.is_discarded()) return std::nullopt;

    if (auto m = fromStructured(record)) return m;
    return fromLegacy(record);
}

std::vector<Message> Normalizer::readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw HashError("opening file " + path.string() + ": " + std::strerror(errno));

    std::vector<Message> messages;
    std::string line;
    size_t lineNo = 0, discarded = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (auto m = normalizeLine(line)) messages.push_back(std::move(*m));
        else if (!line.empty()) ++discarded;
    }

    if (in.bad()) throw HashError("reading file " + path.string() + " failed after line " + std::to_string(lineNo));

    if (discarded > 0)
        LogRegistry::sync()->debug("[Normalizer] {}: skipped {} of {} lines", path.string(), discarded, lineNo);

    return messages;
}
