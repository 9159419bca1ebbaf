/*---------------------------------------------------------*/
/*                                                         */
/*   game_loop.cpp - One tick: input, move, mutate, render */
/*                                                         */
/*---------------------------------------------------------*/

#include "game_loop.h"

GameLoop::GameLoop(GameController& controller_, Renderer& renderer)
    : controller(controller_), out(renderer)
{
}

std::string GameLoop::scoreText(int score) {
    return "Score: " + std::to_string(score);
}

std::string GameLoop::difficultyText(Difficulty d) {
    return std::string("Difficulty: ") + difficultyLabel(d);
}

const char* GameLoop::instructionsText() {
    return "Arrow keys: change/boost direction, 'q': quit";
}

TickResult GameLoop::tick(double now) {
    KeyEvent key;
    const bool hasKey = out.pollKey(key);

    TickResult result = controller.tick(now, hasKey ? &key : nullptr);
    if (result.moved || result.finished)
        render();
    return result;
}

void GameLoop::render() {
    if (!controller.started())
        return;
    out.clear();
    drawBoard();
    drawHud();
    if (controller.state().isOver())
        drawGameOver();
}

void GameLoop::drawBoard() {
    const GameState& s = controller.state();
    const int h = s.grid.height();
    const int w = s.grid.width();

    for (int r = 0; r < h; ++r) {
        for (int c = 0; c < w; ++c) {
            Position p(r, c);
            out.drawCell(p, s.grid.isWall(p) ? Glyph::Wall : Glyph::Empty);
        }
    }

    for (const auto& o : s.obstacles)
        out.drawCell(o, Glyph::Obstacle);
    out.drawCell(s.food, Glyph::Food);

    // Tail first so the head wins on the lethal overlap.
    for (size_t i = s.snake.size(); i-- > 1;)
        out.drawCell(s.snake[i], Glyph::Body);
    if (!s.snake.empty())
        out.drawCell(s.snake.front(), Glyph::Head);
}

void GameLoop::drawHud() {
    const GameState& s = controller.state();
    const int h = s.grid.height();
    const int w = s.grid.width();

    out.drawText(Position(0, 2), scoreText(s.score));

    const std::string diff = difficultyText(s.difficulty);
    out.drawText(Position(0, w - (int)diff.size() - 2), diff);

    std::string help = instructionsText();
    if (w - 4 < (int)help.size())
        help.resize(w > 4 ? w - 4 : 0);
    out.drawText(Position(h - 1, 2), help);
}

void GameLoop::drawGameOver() {
    const GameState& s = controller.state();
    const int mid = s.grid.height() / 2;
    const char* title = s.status == GameStatus::BoardFull ? "BOARD FULL!" : "GAME OVER!";
    drawCentered(mid - 1, title);
    drawCentered(mid, "Final Score: " + std::to_string(s.score));
}

void GameLoop::drawCentered(int row, const std::string& text) {
    const int w = controller.state().grid.width();
    int col = (w - (int)text.size()) / 2;
    if (col < 0)
        col = 0;
    out.drawText(Position(row, col), text);
}
