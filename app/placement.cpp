/*---------------------------------------------------------*/
/*                                                         */
/*   placement.cpp - Random obstacle and food placement    */
/*                                                         */
/*---------------------------------------------------------*/

#include "placement.h"

#include <algorithm>
#include <cstdio>
#include <set>

template <typename Container>
static bool contains(const Container& c, const Position& p) {
    return std::find(c.begin(), c.end(), p) != c.end();
}

std::vector<Position> placeObstacles(int count,
                                     const Grid& grid,
                                     const std::vector<Position>& forbidden,
                                     std::mt19937& rng,
                                     int maxAttempts)
{
    std::vector<Position> chosen;
    if (count <= 0)
        return chosen;
    if (!grid.hasObstacleRange())
        throw PlacementExhausted("board too small for obstacles");

    chosen.reserve(count);
    for (int n = 0; n < count; ++n) {
        int attempts = 0;
        for (;;) {
            if (attempts++ >= maxAttempts) {
                fprintf(stderr, "[snake] obstacle placement gave up after %d attempts (%d/%d placed)\n",
                        maxAttempts, n, count);
                throw PlacementExhausted("no free cell for obstacle " + std::to_string(n + 1) +
                                         " of " + std::to_string(count));
            }
            Position p = grid.randomObstacleCell(rng);
            if (!contains(forbidden, p) && !contains(chosen, p)) {
                chosen.push_back(p);
                break;
            }
        }
    }
    return chosen;
}

Position placeFood(const Grid& grid,
                   const std::deque<Position>& snake,
                   const std::vector<Position>& obstacles,
                   std::mt19937& rng,
                   int maxAttempts)
{
    if (!grid.hasFoodRange())
        throw PlacementExhausted("board too small for food");

    for (int attempts = 0; attempts < maxAttempts; ++attempts) {
        Position p = grid.randomFoodCell(rng);
        if (!contains(snake, p) && !contains(obstacles, p))
            return p;
    }
    // Sampling budget spent: pick among the cells that are actually free.
    std::set<Position> taken(snake.begin(), snake.end());
    taken.insert(obstacles.begin(), obstacles.end());
    std::vector<Position> vacant;
    for (int r = 1; r <= grid.height() - 2; ++r) {
        for (int c = 1; c <= grid.width() - 2; ++c) {
            Position p(r, c);
            if (!taken.count(p))
                vacant.push_back(p);
        }
    }
    if (vacant.empty()) {
        fprintf(stderr, "[snake] no free cell for food (snake=%zu obstacles=%zu)\n",
                snake.size(), obstacles.size());
        throw PlacementExhausted("no free cell for food");
    }
    std::uniform_int_distribution<size_t> pick(0, vacant.size() - 1);
    return vacant[pick(rng)];
}
