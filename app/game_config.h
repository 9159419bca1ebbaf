/*---------------------------------------------------------*/
/*                                                         */
/*   game_config.h - Start-up settings from environment    */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef GAME_CONFIG_H
#define GAME_CONFIG_H

#include <string>

struct GameConfig {
    std::string leaderboardPath = "snake_leaderboard.json";
    std::string crashDir = "logs/crashes";
    unsigned tickMs = 10;  // loop period; bounds CPU use only

    // TVSNAKE_LEADERBOARD_PATH, TVSNAKE_CRASH_DIR, TVSNAKE_TICK_MS.
    // Bad values keep the default and log a warning.
    static GameConfig fromEnvironment();

    // Same rules, with a lookup function instead of getenv (tests).
    typedef const char* (*EnvLookup)(const char* name);
    static GameConfig fromLookup(EnvLookup lookup);
};

#endif // GAME_CONFIG_H
