/*---------------------------------------------------------*/
/*   game_controller_test.cpp - ctest for ticks + loop     */
/*---------------------------------------------------------*/

#include "game_controller.h"
#include "game_loop.h"
#include "placement.h"
#include "renderer.h"

#include <algorithm>
#include <deque>
#include <iostream>
#include <map>
#include <string>
#include <vector>

static int failures = 0;

static void check(const char* name, bool cond) {
    if (cond) {
        std::cout << "  PASS: " << name << "\n";
    } else {
        std::cerr << "  FAIL: " << name << "\n";
        failures++;
    }
}

// Records what the loop draws and hands out queued keys.
class RecordingRenderer : public Renderer {
public:
    void clear() override {
        cells.clear();
        texts.clear();
        clears++;
    }
    void drawCell(const Position& pos, Glyph glyph) override { cells[pos] = glyph; }
    void drawText(const Position& pos, const std::string& text) override {
        texts.push_back(std::make_pair(pos, text));
    }
    bool pollKey(KeyEvent& out) override {
        if (keys.empty())
            return false;
        out = keys.front();
        keys.pop_front();
        return true;
    }

    bool hasText(const Position& pos, const std::string& text) const {
        for (const auto& t : texts)
            if (t.first == pos && t.second == text) return true;
        return false;
    }
    Glyph at(int row, int col) const {
        auto it = cells.find(Position(row, col));
        return it == cells.end() ? Glyph::Empty : it->second;
    }

    std::map<Position, Glyph> cells;
    std::vector<std::pair<Position, std::string>> texts;
    std::deque<KeyEvent> keys;
    int clears {0};
};

// 20x20 easy board, snake heading right from the centre, food ahead.
static GameState scriptedState(int height = 20, int width = 20) {
    GameState s;
    s.grid = Grid(height, width);
    s.difficulty = Difficulty::Easy;
    s.snake = initialSnake(s.grid);
    s.direction = Dir::Right;
    s.food = offset(s.snake.front(), Dir::Right);
    s.score = 0;
    s.status = GameStatus::Running;
    return s;
}

int main() {
    std::cout << "=== GameController Tests ===\n\n";

    std::cout << "[Controller: scheduled move and eating]\n";
    {
        GameController ctl(7);
        check("no game before start", !ctl.started() && !ctl.snapshot().valid);
        ctl.restore(scriptedState(), 0.0);

        TickResult r = ctl.tick(0.25, nullptr);
        check("idle before interval", !r.moved && !r.finished);

        r = ctl.tick(0.625, nullptr);
        const GameState& s = ctl.state();
        check("moved on schedule", r.moved);
        check("ate food", r.ateFood);
        check("score +10", s.score == 10);
        check("snake grew to 4", s.snake.size() == 4);
        check("head on old food cell", s.snake.front() == Position(10, 11));
        check("new food off the snake",
              std::find(s.snake.begin(), s.snake.end(), s.food) == s.snake.end());
        check("new food inside the walls", s.grid.isInterior(s.food));
        check("still running", s.status == GameStatus::Running);
    }

    std::cout << "\n[Controller: input]\n";
    {
        GameController ctl(7);
        GameState start = scriptedState();
        start.food = Position(3, 3);
        ctl.restore(start, 0.0);

        KeyEvent left(KeyKind::Left);
        TickResult r = ctl.tick(0.125, &left);
        check("reversal does not move", !r.moved);
        check("reversal keeps heading", ctl.state().direction == Dir::Right);

        KeyEvent up(KeyKind::Up);
        r = ctl.tick(0.25, &up);
        check("turn forces a move", r.moved);
        check("turned up", ctl.state().direction == Dir::Up);
        check("head moved up", ctl.state().snake.front() == Position(9, 10));

        KeyEvent boost(KeyKind::Up);
        r = ctl.tick(0.28125, &boost);
        check("boost rate limited", !r.moved);
        r = ctl.tick(0.3125, &boost);
        check("boost after spacing", r.moved && ctl.state().snake.front() == Position(8, 10));

        KeyEvent quit(KeyKind::Quit);
        r = ctl.tick(0.375, &quit);
        check("quit finishes", r.finished && !r.moved);
        check("status quit", ctl.state().status == GameStatus::Quit);
        check("quit keeps score", ctl.state().score == 0);

        r = ctl.tick(5.0, nullptr);
        check("no ticks after game over", !r.moved && !r.finished);
    }

    std::cout << "\n[Controller: crashes]\n";
    {
        GameController ctl(7);
        GameState s = scriptedState();
        s.snake = SnakeBody{ Position(10, 18), Position(10, 17), Position(10, 16) };
        s.food = Position(3, 3);
        s.score = 30;
        ctl.restore(s, 0.0);
        TickResult r = ctl.tick(0.625, nullptr);
        check("wall crash finishes", r.moved && r.finished);
        check("status crashed", ctl.state().status == GameStatus::Crashed);
        check("score kept", ctl.state().score == 30);
        check("game over", ctl.state().isOver());

        GameController ctl2(7);
        GameState o = scriptedState();
        o.food = Position(3, 3);
        o.obstacles.push_back(Position(10, 11));
        ctl2.restore(o, 0.0);
        ctl2.tick(0.625, nullptr);
        check("obstacle crash", ctl2.state().status == GameStatus::Crashed);
    }

    std::cout << "\n[Controller: board full]\n";
    {
        // 5x5 interior is 3x3; the snake covers all but (1,1) and eats there.
        GameState s = scriptedState(5, 5);
        s.snake = SnakeBody{ Position(2, 1), Position(3, 1), Position(3, 2), Position(3, 3),
                             Position(2, 3), Position(2, 2), Position(1, 2), Position(1, 3) };
        s.direction = Dir::Up;
        s.food = Position(1, 1);
        GameController ctl(11);
        ctl.restore(s, 0.0);
        TickResult r = ctl.tick(0.625, nullptr);
        check("ate the last free cell", r.ateFood && ctl.state().snake.size() == 9);
        check("finished as board full", r.finished && ctl.state().status == GameStatus::BoardFull);
        check("final food counted", ctl.state().score == 10);
    }
    {
        // Large board with two free cells left: never reported as full.
        GameState base = scriptedState(60, 60);
        const Position freeA(30, 30), freeB(40, 40);
        base.snake.clear();
        base.snake.push_back(Position(2, 1));
        for (int row = 1; row <= 58; ++row) {
            for (int col = 1; col <= 58; ++col) {
                Position p(row, col);
                if (p == Position(1, 1) || p == Position(2, 1) || p == freeA || p == freeB)
                    continue;
                base.snake.push_back(p);
            }
        }
        base.direction = Dir::Up;
        base.food = Position(1, 1);

        bool running = true, foodOnFreeCell = true;
        for (unsigned seed = 0; seed < 20; ++seed) {
            GameController ctl(seed);
            ctl.restore(base, 0.0);
            TickResult r = ctl.tick(0.625, nullptr);
            if (!r.ateFood || r.finished || ctl.state().status != GameStatus::Running)
                running = false;
            if (ctl.state().food != freeA && ctl.state().food != freeB)
                foodOnFreeCell = false;
        }
        check("two free cells keep the game running", running);
        check("food lands on a free cell", foodOnFreeCell);
    }

    std::cout << "\n[Controller: start]\n";
    {
        GameController ctl(2024);
        ctl.start(Difficulty::Insane, 20, 20, 0.0);
        const GameState& s = ctl.state();
        check("started", ctl.started());
        check("15 obstacles", s.obstacles.size() == 15);
        check("initial snake", s.snake.size() == 3 && s.snake.front() == Position(10, 10));
        bool clear = true;
        for (const auto& p : s.snake)
            if (std::find(s.obstacles.begin(), s.obstacles.end(), p) != s.obstacles.end()) clear = false;
        check("obstacles avoid snake", clear);
        check("food avoids obstacles",
              std::find(s.obstacles.begin(), s.obstacles.end(), s.food) == s.obstacles.end());
        check("food avoids snake", std::find(s.snake.begin(), s.snake.end(), s.food) == s.snake.end());
        check("heading right", s.direction == Dir::Right);
        check("insane timer", ctl.timer().interval() == 0.05);
        check("score zero", s.score == 0);

        bool threw = false;
        try {
            ctl.start(Difficulty::Easy, 4, 20, 0.0);
        } catch (const GameSetupError&) {
            threw = true;
        }
        check("too short board rejected", threw);

        threw = false;
        try {
            ctl.start(Difficulty::Easy, 20, 5, 0.0);
        } catch (const GameSetupError&) {
            threw = true;
        }
        check("too narrow board rejected", threw);
        check("failed start keeps the old game", ctl.state().obstacles.size() == 15);
    }

    std::cout << "\n[Controller: snapshot]\n";
    {
        GameController ctl(3);
        GameState s = scriptedState();
        s.score = 40;
        s.obstacles = { Position(3, 3), Position(4, 4), Position(5, 5),
                        Position(6, 6), Position(7, 7), Position(8, 8) };
        ctl.restore(s, 0.0);
        GameSnapshot snap = ctl.snapshot();
        check("snapshot valid", snap.valid);
        check("snapshot score", snap.score == 40);
        check("snapshot difficulty", snap.difficulty == "easy");
        check("snapshot head", snap.head == Position(10, 10));
        check("snapshot length", snap.snakeLength == 3 && snap.bodyPrefix.size() == 3);
        check("snapshot direction", snap.direction == "right");
        check("snapshot interval", snap.moveInterval == 0.6);
        check("obstacle count", snap.obstacleCount == 6);
        check("obstacle prefix capped", snap.obstaclePrefix.size() == kSnapshotPrefix);
    }

    std::cout << "\n[GameLoop: frame]\n";
    {
        GameController ctl(5);
        GameState s = scriptedState(20, 60);
        s.food = Position(4, 40);
        s.obstacles.push_back(Position(15, 15));
        ctl.restore(s, 0.0);

        RecordingRenderer screen;
        GameLoop loop(ctl, screen);
        loop.render();
        check("one clear per frame", screen.clears == 1);
        check("corner wall", screen.at(0, 0) == Glyph::Wall);
        check("side wall", screen.at(7, 59) == Glyph::Wall);
        check("head drawn", screen.at(10, 30) == Glyph::Head);
        check("body drawn", screen.at(10, 29) == Glyph::Body && screen.at(10, 28) == Glyph::Body);
        check("food drawn", screen.at(4, 40) == Glyph::Food);
        check("obstacle drawn", screen.at(15, 15) == Glyph::Obstacle);
        check("interior empty", screen.at(5, 5) == Glyph::Empty);
        check("score label", screen.hasText(Position(0, 2), "Score: 0"));
        check("difficulty label", screen.hasText(Position(0, 42), "Difficulty: Easy"));
        check("instructions", screen.hasText(Position(19, 2), GameLoop::instructionsText()));

        TickResult r = loop.tick(0.25);
        check("no redraw without a move", !r.moved && screen.clears == 1);

        screen.keys.push_back(KeyEvent(KeyKind::Right));
        screen.keys.push_back(KeyEvent(KeyKind::Up));
        r = loop.tick(0.3125);
        check("one key per tick", r.moved && screen.keys.size() == 1);
        check("redrawn after move", screen.clears == 2 && screen.at(10, 31) == Glyph::Head);

        screen.keys.clear();
        screen.keys.push_back(KeyEvent(KeyKind::Quit));
        r = loop.tick(0.375);
        check("quit ends the loop", r.finished);
        check("game over title", screen.hasText(Position(9, 25), "GAME OVER!"));
        check("final score line", screen.hasText(Position(10, 23), "Final Score: 0"));
    }

    std::cout << "\n[GameLoop: narrow board]\n";
    {
        GameController ctl(5);
        GameState s = scriptedState(20, 30);
        s.food = Position(2, 2);
        ctl.restore(s, 0.0);
        RecordingRenderer screen;
        GameLoop loop(ctl, screen);
        loop.render();
        bool clipped = false;
        for (const auto& t : screen.texts)
            if (t.first == Position(19, 2)) clipped = t.second.size() == 26;
        check("instructions clipped to W-4", clipped);
        check("score text helper", GameLoop::scoreText(120) == "Score: 120");
        check("difficulty text helper", GameLoop::difficultyText(Difficulty::Insane) == "Difficulty: Insane");
    }

    std::cout << "\n=== Results: " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures;
}
