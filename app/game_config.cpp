/*---------------------------------------------------------*/
/*                                                         */
/*   game_config.cpp - Start-up settings from environment  */
/*                                                         */
/*---------------------------------------------------------*/

#include "game_config.h"

#include <cstdio>
#include <cstdlib>
#include <cerrno>

static const unsigned kMinTickMs = 1;
static const unsigned kMaxTickMs = 50;

static const char* systemLookup(const char* name) {
    return std::getenv(name);
}

GameConfig GameConfig::fromEnvironment() {
    return fromLookup(&systemLookup);
}

GameConfig GameConfig::fromLookup(EnvLookup lookup) {
    GameConfig cfg;

    const char* path = lookup("TVSNAKE_LEADERBOARD_PATH");
    if (path && path[0] != '\0')
        cfg.leaderboardPath = path;

    const char* dir = lookup("TVSNAKE_CRASH_DIR");
    if (dir && dir[0] != '\0')
        cfg.crashDir = dir;

    const char* tick = lookup("TVSNAKE_TICK_MS");
    if (tick && tick[0] != '\0') {
        char* end = nullptr;
        errno = 0;
        long v = std::strtol(tick, &end, 10);
        if (errno != 0 || end == tick || *end != '\0') {
            fprintf(stderr, "[config] WARNING: TVSNAKE_TICK_MS=%s is not a number, using %u\n",
                    tick, cfg.tickMs);
        } else if (v < (long)kMinTickMs || v > (long)kMaxTickMs) {
            unsigned clamped = v < (long)kMinTickMs ? kMinTickMs : kMaxTickMs;
            fprintf(stderr, "[config] WARNING: TVSNAKE_TICK_MS=%ld out of range, using %u\n",
                    v, clamped);
            cfg.tickMs = clamped;
        } else {
            cfg.tickMs = (unsigned)v;
        }
    }

    fprintf(stderr, "[config] leaderboard=%s crashDir=%s tickMs=%u\n",
            cfg.leaderboardPath.c_str(), cfg.crashDir.c_str(), cfg.tickMs);
    return cfg;
}
