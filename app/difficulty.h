/*---------------------------------------------------------*/
/*                                                         */
/*   difficulty.h - Difficulty tiers                       */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef DIFFICULTY_H
#define DIFFICULTY_H

#include <cstdint>
#include <string>

enum class Difficulty : uint8_t { Easy = 0, Medium, Hard, Insane };

static constexpr int kDifficultyCount = 4;

// Lowercase key used in the leaderboard file ("easy", "medium", ...).
const char* difficultyName(Difficulty d);
// Capitalized label for the HUD ("Easy", "Medium", ...).
const char* difficultyLabel(Difficulty d);
bool parseDifficulty(const std::string& name, Difficulty& out);
Difficulty difficultyFromIndex(int index);

int obstacleCount(Difficulty d);
// Seconds between scheduled moves.
double moveInterval(Difficulty d);

#endif // DIFFICULTY_H
