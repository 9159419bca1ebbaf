/*---------------------------------------------------------*/
/*                                                         */
/*   snake_rules.h - Snake movement and collision rules    */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef SNAKE_RULES_H
#define SNAKE_RULES_H

#include "grid.h"

#include <cstdint>
#include <deque>
#include <vector>

enum class Dir : uint8_t { Up, Down, Left, Right };

// front = head, back = tail
typedef std::deque<Position> SnakeBody;

struct StepResult {
    SnakeBody snake;
    bool ateFood {false};
};

Position offset(const Position& p, Dir d);
Dir opposite(Dir d);
const char* dirName(Dir d);

// Three cells centred on the board, heading right.
SnakeBody initialSnake(const Grid& grid);

// Advances the snake one cell. Eating food keeps the old tail.
StepResult step(const SnakeBody& snake, Dir dir, const Position& food);

// True if the head is on a wall, on another segment or on an obstacle.
bool checkCollision(const SnakeBody& snake, const Grid& grid,
                    const std::vector<Position>& obstacles);

#endif // SNAKE_RULES_H
