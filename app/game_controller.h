/*---------------------------------------------------------*/
/*                                                         */
/*   game_controller.h - Game state and per-tick driver    */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef GAME_CONTROLLER_H
#define GAME_CONTROLLER_H

#include "difficulty.h"
#include "grid.h"
#include "input_resolver.h"
#include "move_timer.h"
#include "snake_rules.h"

#include <random>
#include <string>
#include <vector>

enum class GameStatus : uint8_t { Running, Crashed, Quit, BoardFull };

// Everything that describes one game at one tick.
struct GameState {
    Grid grid;
    Difficulty difficulty {Difficulty::Easy};
    SnakeBody snake;
    Dir direction {Dir::Right};
    Position food;
    std::vector<Position> obstacles;
    int score {0};
    GameStatus status {GameStatus::Running};

    bool isOver() const { return status != GameStatus::Running; }
};

static constexpr int kPointsPerFood = 10;

// Builds the opening state: snake, obstacles clear of it, then food.
// Throws GameSetupError if the board cannot hold the game.
GameState newGameState(Difficulty difficulty, int height, int width, std::mt19937& rng);

// Read-only copy of the fields a crash report prints.
struct GameSnapshot {
    bool valid {false};
    int score {0};
    std::string difficulty;
    int snakeLength {0};
    Position head;
    std::vector<Position> bodyPrefix;      // first few segments
    std::string direction;
    double moveInterval {0.0};
    Position food;
    int obstacleCount {0};
    std::vector<Position> obstaclePrefix;  // first few obstacles
};

static constexpr size_t kSnapshotPrefix = 5;

struct TickResult {
    bool moved {false};
    bool ateFood {false};
    bool finished {false};  // status left Running on this tick
};

class GameController {
public:
    GameController();
    explicit GameController(unsigned seed);

    // Starts a fresh game. `now` seeds the move timer.
    void start(Difficulty difficulty, int height, int width, double now);
    // Continues from a prepared state (scripted boards, replays).
    void restore(const GameState& state, double now);

    // One loop iteration: resolve `key` (may be null), decide whether a
    // move is due, then step, collide, eat.
    TickResult tick(double now, const KeyEvent* key);

    bool started() const { return hasGame; }
    const GameState& state() const { return gameState; }
    const MoveTimer& timer() const { return moveTimer; }
    GameSnapshot snapshot() const;

private:
    void advance(TickResult& result);

    GameState gameState;
    MoveTimer moveTimer;
    std::mt19937 rng;
    bool hasGame {false};
};

#endif // GAME_CONTROLLER_H
