/*---------------------------------------------------------*/
/*                                                         */
/*   snake_rules.cpp - Snake movement and collision rules  */
/*                                                         */
/*---------------------------------------------------------*/

#include "snake_rules.h"

#include <algorithm>

Position offset(const Position& p, Dir d) {
    switch (d) {
        case Dir::Up:    return Position(p.row - 1, p.col);
        case Dir::Down:  return Position(p.row + 1, p.col);
        case Dir::Left:  return Position(p.row, p.col - 1);
        case Dir::Right: return Position(p.row, p.col + 1);
    }
    return p;
}

Dir opposite(Dir d) {
    switch (d) {
        case Dir::Up:    return Dir::Down;
        case Dir::Down:  return Dir::Up;
        case Dir::Left:  return Dir::Right;
        case Dir::Right: return Dir::Left;
    }
    return d;
}

const char* dirName(Dir d) {
    switch (d) {
        case Dir::Up:    return "up";
        case Dir::Down:  return "down";
        case Dir::Left:  return "left";
        case Dir::Right: return "right";
    }
    return "?";
}

SnakeBody initialSnake(const Grid& grid) {
    const int r = grid.height() / 2;
    const int c = grid.width() / 2;
    SnakeBody body;
    body.push_back(Position(r, c));
    body.push_back(Position(r, c - 1));
    body.push_back(Position(r, c - 2));
    return body;
}

StepResult step(const SnakeBody& snake, Dir dir, const Position& food) {
    StepResult result;
    result.snake = snake;
    const Position head = offset(snake.front(), dir);
    result.snake.push_front(head);

    if (head == food) {
        result.ateFood = true;  // tail stays = growth
    } else {
        result.snake.pop_back();
    }
    return result;
}

bool checkCollision(const SnakeBody& snake, const Grid& grid,
                    const std::vector<Position>& obstacles)
{
    const Position& head = snake.front();

    if (grid.isWall(head))
        return true;

    if (std::find(snake.begin() + 1, snake.end(), head) != snake.end())
        return true;

    return std::find(obstacles.begin(), obstacles.end(), head) != obstacles.end();
}
