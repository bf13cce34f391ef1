#include "auth/FileTokenStore.hpp"
#include "sync/errors.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

using namespace hs::auth;
using namespace hs::logging;
using hs::sync::CredentialError;
using namespace std::chrono;

FileTokenStore::FileTokenStore(fs::path path) : path_(std::move(path)) {}

Token FileTokenStore::load() {
    std::error_code ec;
    if (fs::status(path_, ec).type() == fs::file_type::not_found)
        throw CredentialError("no tokens stored at " + path_.string());

    std::ifstream in(path_);
    if (!in) throw CredentialError("reading token file " + path_.string() + ": " + std::strerror(errno));

    try {
        const auto j = nlohmann::json::parse(in);
        Token t;
        t.access_token = j.value("access_token", std::string{});
        t.refresh_token = j.value("refresh_token", std::string{});
        t.expires_at = system_clock::from_time_t(j.value("expires_at", std::time_t{0}));
        if (t.access_token.empty()) throw CredentialError("token file " + path_.string() + " holds no access token");
        return t;
    } catch (const nlohmann::json::exception& e) {
        throw CredentialError("parsing token file " + path_.string() + ": " + e.what());
    }
}

void FileTokenStore::save(const Token& token) const {
    const nlohmann::json j = {
        {"access_token", token.access_token},
        {"refresh_token", token.refresh_token},
        {"expires_at", system_clock::to_time_t(token.expires_at)}
    };
    const auto data = j.dump(2);

    util::createPrivateDirectories(path_.parent_path());

    const int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) throw std::runtime_error("writing token file " + path_.string() + ": " + std::strerror(errno));

    const ssize_t w = ::write(fd, data.data(), data.size());
    const int err = errno;
    ::close(fd);
    if (w != static_cast<ssize_t>(data.size()))
        throw std::runtime_error("writing token file " + path_.string() + ": " + std::strerror(err));
}

void FileTokenStore::clear() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) throw std::runtime_error("removing token file " + path_.string() + ": " + ec.message());
    LogRegistry::auth()->debug("[FileTokenStore] Cleared {}", path_.string());
}
