/*---------------------------------------------------------*/
/*                                                         */
/*   game_loop.h - One tick: input, move, mutate, render   */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef GAME_LOOP_H
#define GAME_LOOP_H

#include "game_controller.h"
#include "renderer.h"

#include <string>

class GameLoop {
public:
    GameLoop(GameController& controller, Renderer& renderer);

    // Samples at most one key, advances the controller and redraws the
    // frame when anything changed.
    TickResult tick(double now);

    // Full redraw of the board and HUD.
    void render();

    static std::string scoreText(int score);
    static std::string difficultyText(Difficulty d);
    static const char* instructionsText();

private:
    void drawBoard();
    void drawHud();
    void drawGameOver();
    void drawCentered(int row, const std::string& text);

    GameController& controller;
    Renderer& out;
};

#endif // GAME_LOOP_H
