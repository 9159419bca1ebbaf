/*---------------------------------------------------------*/
/*                                                         */
/*   leaderboard.cpp - Per-difficulty top-10 high scores   */
/*                                                         */
/*---------------------------------------------------------*/

#include "leaderboard.h"
#include "json_lite.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>

static void sortAndTrim(std::vector<LeaderboardEntry>& list) {
    std::stable_sort(list.begin(), list.end(),
                     [](const LeaderboardEntry& a, const LeaderboardEntry& b) {
                         return a.score > b.score;
                     });
    if (list.size() > kLeaderboardSize)
        list.resize(kLeaderboardSize);
}

bool Leaderboard::isHighScore(int score, Difficulty d) const {
    const auto& list = tiers[(int)d];
    if (list.size() < kLeaderboardSize)
        return true;
    int lowest = list.front().score;
    for (const auto& e : list)
        lowest = std::min(lowest, e.score);
    return score > lowest;
}

void Leaderboard::addHighScore(const std::string& name, int score, Difficulty d) {
    LeaderboardEntry entry;
    entry.name = name;
    std::transform(entry.name.begin(), entry.name.end(), entry.name.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    entry.score = score;

    auto& list = tiers[(int)d];
    list.push_back(entry);
    sortAndTrim(list);
}

const std::vector<LeaderboardEntry>& Leaderboard::entries(Difficulty d) const {
    return tiers[(int)d];
}

bool Leaderboard::empty() const {
    for (const auto& list : tiers)
        if (!list.empty()) return false;
    return true;
}

void Leaderboard::clear() {
    for (auto& list : tiers)
        list.clear();
}

bool Leaderboard::normalizeName(const std::string& raw, std::string& out) {
    std::string name;
    for (char c : raw) {
        if (c == ' ' || c == '\0')
            continue;  // TInputLine pads with spaces
        if (!std::isalnum((unsigned char)c))
            return false;
        name.push_back((char)std::toupper((unsigned char)c));
    }
    if (name.empty() || name.size() > kMaxNameLength)
        return false;
    out = name;
    return true;
}

std::string Leaderboard::toJson() const {
    std::ostringstream json;
    json << "{\n";
    for (int i = 0; i < kDifficultyCount; ++i) {
        const Difficulty d = difficultyFromIndex(i);
        const auto& list = tiers[i];
        json << "  \"" << difficultyName(d) << "\": [";
        for (size_t k = 0; k < list.size(); ++k) {
            json << (k == 0 ? "\n" : ",\n");
            json << "    {\"name\": \"" << jsonEscape(list[k].name)
                 << "\", \"score\": " << list[k].score << "}";
        }
        if (!list.empty())
            json << "\n  ";
        json << "]" << (i + 1 < kDifficultyCount ? ",\n" : "\n");
    }
    json << "}\n";
    return json.str();
}

static bool parseEntry(const std::string& s, size_t& pos, LeaderboardEntry& out) {
    if (!jsonConsume(s, pos, '{'))
        return false;
    bool haveName = false, haveScore = false;
    if (!jsonConsume(s, pos, '}')) {
        for (;;) {
            std::string key;
            if (!jsonParseString(s, pos, key) || !jsonConsume(s, pos, ':'))
                return false;
            if (key == "name") {
                if (!jsonParseString(s, pos, out.name)) return false;
                haveName = true;
            } else if (key == "score") {
                long v = 0;
                if (!jsonParseNumber(s, pos, v) || v < 0 || v > 2000000000L) return false;
                out.score = (int)v;
                haveScore = true;
            } else if (!jsonSkipValue(s, pos)) {
                return false;
            }
            if (jsonConsume(s, pos, ',')) continue;
            if (jsonConsume(s, pos, '}')) break;
            return false;
        }
    }
    return haveName && haveScore;
}

static bool parseEntryList(const std::string& s, size_t& pos, std::vector<LeaderboardEntry>& out) {
    if (!jsonConsume(s, pos, '['))
        return false;
    if (jsonConsume(s, pos, ']'))
        return true;
    for (;;) {
        LeaderboardEntry e;
        if (!parseEntry(s, pos, e))
            return false;
        std::string name;
        if (Leaderboard::normalizeName(e.name, name)) {
            e.name = name;
            out.push_back(e);
        } else {
            fprintf(stderr, "[leaderboard] dropping entry with invalid name \"%s\"\n", e.name.c_str());
        }
        if (jsonConsume(s, pos, ',')) continue;
        if (jsonConsume(s, pos, ']')) return true;
        return false;
    }
}

bool Leaderboard::fromJson(const std::string& json) {
    std::array<std::vector<LeaderboardEntry>, kDifficultyCount> parsed;
    size_t pos = 0;
    if (!jsonConsume(json, pos, '{'))
        return false;

    if (!jsonConsume(json, pos, '}')) {
        for (;;) {
            std::string key;
            if (!jsonParseString(json, pos, key) || !jsonConsume(json, pos, ':'))
                return false;
            Difficulty d;
            if (parseDifficulty(key, d)) {
                if (!parseEntryList(json, pos, parsed[(int)d]))
                    return false;
            } else if (!jsonSkipValue(json, pos)) {
                return false;
            }
            if (jsonConsume(json, pos, ',')) continue;
            if (jsonConsume(json, pos, '}')) break;
            return false;
        }
    }

    jsonSkipWs(json, pos);
    if (pos != json.size())
        return false;

    for (auto& list : parsed)
        sortAndTrim(list);
    tiers = parsed;
    return true;
}

// ── LeaderboardStore ──────────────────────────────────────

LeaderboardStore::LeaderboardStore(const std::string& path) : filePath(path) {}

Leaderboard LeaderboardStore::load() const {
    Leaderboard board;
    std::ifstream in(filePath);
    if (!in) {
        fprintf(stderr, "[leaderboard] no file at %s, starting empty\n", filePath.c_str());
        return board;
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!board.fromJson(data)) {
        fprintf(stderr, "[leaderboard] WARNING: %s is malformed, starting empty\n", filePath.c_str());
        board.clear();
    }
    return board;
}

StoreResult LeaderboardStore::save(const Leaderboard& board) const {
    if (filePath.empty())
        return {false, "no leaderboard path configured"};

    const std::string json = board.toJson();
    const std::string tmpPath = filePath + ".tmp";

    std::ofstream out(tmpPath.c_str(), std::ios::out | std::ios::trunc);
    if (!out)
        return {false, "cannot open " + tmpPath + " for writing"};
    out << json;
    out.close();
    if (!out.good()) {
        std::remove(tmpPath.c_str());
        return {false, "write to " + tmpPath + " failed"};
    }

    if (std::rename(tmpPath.c_str(), filePath.c_str()) != 0) {
        std::remove(tmpPath.c_str());
        return {false, "cannot replace " + filePath};
    }
    fprintf(stderr, "[leaderboard] saved %s\n", filePath.c_str());
    return {true, filePath};
}
