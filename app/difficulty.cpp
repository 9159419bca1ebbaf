/*---------------------------------------------------------*/
/*                                                         */
/*   difficulty.cpp - Difficulty tiers                     */
/*                                                         */
/*---------------------------------------------------------*/

#include "difficulty.h"

const char* difficultyName(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard:   return "hard";
        case Difficulty::Insane: return "insane";
        default: return "easy";
    }
}

const char* difficultyLabel(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return "Easy";
        case Difficulty::Medium: return "Medium";
        case Difficulty::Hard:   return "Hard";
        case Difficulty::Insane: return "Insane";
        default: return "Easy";
    }
}

bool parseDifficulty(const std::string& name, Difficulty& out) {
    for (int i = 0; i < kDifficultyCount; ++i) {
        Difficulty d = difficultyFromIndex(i);
        if (name == difficultyName(d)) {
            out = d;
            return true;
        }
    }
    return false;
}

Difficulty difficultyFromIndex(int index) {
    switch (index) {
        case 1:  return Difficulty::Medium;
        case 2:  return Difficulty::Hard;
        case 3:  return Difficulty::Insane;
        default: return Difficulty::Easy;
    }
}

int obstacleCount(Difficulty d) {
    switch (d) {
        case Difficulty::Medium: return 5;
        case Difficulty::Hard:   return 10;
        case Difficulty::Insane: return 15;
        default: return 0;
    }
}

double moveInterval(Difficulty d) {
    switch (d) {
        case Difficulty::Medium: return 0.3;
        case Difficulty::Hard:   return 0.2;
        case Difficulty::Insane: return 0.05;
        default: return 0.6;
    }
}
