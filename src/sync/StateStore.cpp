#include "sync/StateStore.hpp"
#include "sync/errors.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

using namespace hs::sync;
using namespace hs::sync::model;
using namespace hs::logging;

StateStore::StateStore(fs::path path) : path_(std::move(path)) {}

SyncState StateStore::load() const {
    std::error_code ec;
    if (fs::status(path_, ec).type() == fs::file_type::not_found) {
        LogRegistry::state()->debug("[StateStore] No state at {}, starting fresh", path_.string());
        return {};
    }
    if (ec) throw StateError("reading state file " + path_.string() + ": " + ec.message());

    std::ifstream in(path_, std::ios::binary);
    if (!in) throw StateError("opening state file " + path_.string() + ": " + std::strerror(errno));

    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) throw StateError("reading state file " + path_.string() + " failed");

    try {
        return nlohmann::json::parse(buf.str()).get<SyncState>();
    } catch (const nlohmann::json::exception& e) {
        throw StateError("parsing state file " + path_.string() + ": " + e.what());
    }
}

void StateStore::writeFileSynced(const fs::path& target, const std::string& data) const {
    const int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) throw PersistError("writing temp state file " + target.string() + ": " + std::strerror(errno));

    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        const ssize_t w = ::write(fd, p, left);
        if (w < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            throw PersistError("writing temp state file " + target.string() + ": " + std::strerror(err));
        }
        p += w;
        left -= static_cast<size_t>(w);
    }

    const int syncRc = ::fsync(fd);
    const int syncErr = errno;
    if (::close(fd) != 0 || syncRc != 0)
        throw PersistError("flushing temp state file " + target.string() + ": "
                           + std::strerror(syncRc != 0 ? syncErr : errno));
}

void StateStore::save(SyncState& state) const {
    state.last_sync_at = util::nowRfc3339();

    const std::string data = nlohmann::json(state).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

    try {
        util::createPrivateDirectories(path_.parent_path());
    } catch (const std::runtime_error& e) {
        throw PersistError(std::string("creating state directory: ") + e.what());
    }

    const fs::path tmp = path_.string() + ".tmp";

    try {
        writeFileSynced(tmp, data);
    } catch (const PersistError&) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw;
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw PersistError("renaming state file into " + path_.string() + ": " + ec.message());
    }

    LogRegistry::state()->debug("[StateStore] Saved {} sessions to {}", state.sessions.size(), path_.string());
}
