/*---------------------------------------------------------*/
/*                                                         */
/*   game_controller.cpp - Game state and per-tick driver  */
/*                                                         */
/*---------------------------------------------------------*/

#include "game_controller.h"
#include "placement.h"

#include <cstdio>
#include <vector>

GameState newGameState(Difficulty difficulty, int height, int width, std::mt19937& rng) {
    // Initial snake spans (H/2, W/2-2)..(H/2, W/2); it must sit inside the walls.
    if (height < 5 || width < 6) {
        throw GameSetupError("board " + std::to_string(width) + "x" + std::to_string(height) +
                             " is too small (need at least 6x5)");
    }

    GameState s;
    s.grid = Grid(height, width);
    s.difficulty = difficulty;
    s.snake = initialSnake(s.grid);
    s.direction = Dir::Right;

    std::vector<Position> startCells(s.snake.begin(), s.snake.end());
    s.obstacles = placeObstacles(obstacleCount(difficulty), s.grid, startCells, rng);
    s.food = placeFood(s.grid, s.snake, s.obstacles, rng);
    s.score = 0;
    s.status = GameStatus::Running;
    return s;
}

GameController::GameController() : rng(std::random_device{}()) {}

GameController::GameController(unsigned seed) : rng(seed) {}

void GameController::start(Difficulty difficulty, int height, int width, double now) {
    gameState = newGameState(difficulty, height, width, rng);
    moveTimer = MoveTimer(moveInterval(difficulty), now);
    hasGame = true;
    fprintf(stderr, "[snake] new game difficulty=%s board=%dx%d obstacles=%zu\n",
            difficultyName(difficulty), width, height, gameState.obstacles.size());
}

void GameController::restore(const GameState& state, double now) {
    gameState = state;
    moveTimer = MoveTimer(moveInterval(state.difficulty), now);
    hasGame = true;
}

TickResult GameController::tick(double now, const KeyEvent* key) {
    TickResult result;
    if (!hasGame || gameState.isOver())
        return result;

    const InputSignal signal = resolveInput(gameState.direction, key);
    if (signal == InputSignal::Quit) {
        gameState.status = GameStatus::Quit;
        result.finished = true;
        return result;
    }

    if (!moveTimer.poll(now, signal == InputSignal::ForceMove))
        return result;

    advance(result);
    return result;
}

void GameController::advance(TickResult& result) {
    StepResult next = step(gameState.snake, gameState.direction, gameState.food);
    gameState.snake.swap(next.snake);
    result.moved = true;

    if (checkCollision(gameState.snake, gameState.grid, gameState.obstacles)) {
        gameState.status = GameStatus::Crashed;
        result.finished = true;
        fprintf(stderr, "[snake] crashed at (%d,%d) score=%d\n",
                gameState.snake.front().row, gameState.snake.front().col, gameState.score);
        return;
    }

    if (!next.ateFood)
        return;

    result.ateFood = true;
    gameState.score += kPointsPerFood;
    try {
        gameState.food = placeFood(gameState.grid, gameState.snake, gameState.obstacles, rng);
    } catch (const PlacementExhausted& e) {
        // Snake fills the interior: nothing left to eat.
        fprintf(stderr, "[snake] board full: %s\n", e.what());
        gameState.status = GameStatus::BoardFull;
        result.finished = true;
    }
}

GameSnapshot GameController::snapshot() const {
    GameSnapshot snap;
    if (!hasGame)
        return snap;

    const GameState& s = gameState;
    snap.valid = true;
    snap.score = s.score;
    snap.difficulty = difficultyName(s.difficulty);
    snap.snakeLength = (int)s.snake.size();
    if (!s.snake.empty())
        snap.head = s.snake.front();
    for (size_t i = 0; i < s.snake.size() && i < kSnapshotPrefix; ++i)
        snap.bodyPrefix.push_back(s.snake[i]);
    snap.direction = dirName(s.direction);
    snap.moveInterval = moveTimer.interval();
    snap.food = s.food;
    snap.obstacleCount = (int)s.obstacles.size();
    for (size_t i = 0; i < s.obstacles.size() && i < kSnapshotPrefix; ++i)
        snap.obstaclePrefix.push_back(s.obstacles[i]);
    return snap;
}
