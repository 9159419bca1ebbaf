/*---------------------------------------------------------*/
/*                                                         */
/*   leaderboard.h - Per-difficulty top-10 high scores     */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef LEADERBOARD_H
#define LEADERBOARD_H

#include "difficulty.h"

#include <array>
#include <string>
#include <vector>

struct LeaderboardEntry {
    std::string name;
    int score {0};
};

static constexpr size_t kLeaderboardSize = 10;
static constexpr size_t kMaxNameLength = 20;

class Leaderboard {
public:
    // True when the tier has a free slot or `score` beats its lowest entry.
    bool isHighScore(int score, Difficulty d) const;

    // Inserts, keeps the list sorted by score descending (ties keep
    // arrival order) and truncates to the top 10.
    void addHighScore(const std::string& name, int score, Difficulty d);

    const std::vector<LeaderboardEntry>& entries(Difficulty d) const;
    bool empty() const;
    void clear();

    std::string toJson() const;
    // Parses the leaderboard file format. Returns false (and leaves the
    // board untouched) on anything malformed.
    bool fromJson(const std::string& json);

    // Uppercases and validates a player name: 1-20 letters or digits.
    static bool normalizeName(const std::string& raw, std::string& out);

private:
    std::array<std::vector<LeaderboardEntry>, kDifficultyCount> tiers;
};

struct StoreResult {
    bool ok;
    std::string message;
};

// Read-modify-write access to the leaderboard file. No locking: one
// game process at a time.
class LeaderboardStore {
public:
    explicit LeaderboardStore(const std::string& path);

    // Missing or unreadable files give an empty leaderboard.
    Leaderboard load() const;
    StoreResult save(const Leaderboard& board) const;

    const std::string& path() const { return filePath; }

private:
    std::string filePath;
};

#endif // LEADERBOARD_H
