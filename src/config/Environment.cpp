#include "config/Environment.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>
#include <limits.h>

using namespace hs::config;

Environment Environment::capture() {
    Environment env;

    if (const char* home = std::getenv("HOME"); home && *home) env.home = home;
    else if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) env.home = pw->pw_dir;
    else env.home = ".";

    char host[HOST_NAME_MAX + 1] = {};
    if (gethostname(host, sizeof(host) - 1) == 0) env.hostname = host;
    if (env.hostname.empty()) env.hostname = "unknown-host";

    return env;
}
