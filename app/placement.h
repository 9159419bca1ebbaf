/*---------------------------------------------------------*/
/*                                                         */
/*   placement.h - Random obstacle and food placement      */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef PLACEMENT_H
#define PLACEMENT_H

#include "grid.h"

#include <deque>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when a game cannot be set up (board too small, no free cells).
class GameSetupError : public std::runtime_error {
public:
    explicit GameSetupError(const std::string& msg) : std::runtime_error(msg) {}
};

// Rejection sampling gave up: the sampling range is empty or too full.
class PlacementExhausted : public GameSetupError {
public:
    explicit PlacementExhausted(const std::string& msg) : GameSetupError(msg) {}
};

// Attempts allowed per placed entity before giving up.
static constexpr int kMaxPlacementAttempts = 10000;

// Picks `count` distinct obstacle cells, none of them in `forbidden`.
// Order of the result is the order cells were accepted.
std::vector<Position> placeObstacles(int count,
                                     const Grid& grid,
                                     const std::vector<Position>& forbidden,
                                     std::mt19937& rng,
                                     int maxAttempts = kMaxPlacementAttempts);

// First sampled food cell not covered by the snake or an obstacle.
// After `maxAttempts` misses, a random free cell from a full scan.
// Throws PlacementExhausted only when no cell is free.
Position placeFood(const Grid& grid,
                   const std::deque<Position>& snake,
                   const std::vector<Position>& obstacles,
                   std::mt19937& rng,
                   int maxAttempts = kMaxPlacementAttempts);

#endif // PLACEMENT_H
