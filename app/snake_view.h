/*---------------------------------------------------------*/
/*                                                         */
/*   snake_view.h - Snake board view and game window       */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef SNAKE_VIEW_H
#define SNAKE_VIEW_H

#define Uses_TView
#define Uses_TDrawBuffer
#define Uses_TRect
#include <tvision/tv.h>
#include <vector>

#include "game_controller.h"
#include "game_loop.h"
#include "renderer.h"

class CrashReporter;

// Posted to the application when a game ends; infoPtr is the TSnakeView.
extern const ushort cmSnakeGameOver;

// Turbo Vision side of the game: implements Renderer over a cell back
// buffer and drives GameLoop from a periodic timer.
class TSnakeView : public TView, public Renderer {
public:
    TSnakeView(const TRect &bounds, Difficulty difficulty,
               unsigned tickMs, CrashReporter &reporter);
    virtual ~TSnakeView();

    virtual void draw() override;
    virtual void handleEvent(TEvent &ev) override;
    virtual void setState(ushort aState, Boolean enable) override;

    // Renderer
    virtual void clear() override;
    virtual void drawCell(const Position& pos, Glyph glyph) override;
    virtual void drawText(const Position& pos, const std::string& text) override;
    virtual bool pollKey(KeyEvent& out) override;

    const GameState& gameState() const { return controller.state(); }

private:
    void startTimer();
    void stopTimer();
    void tick();
    bool mapKey(const TEvent &ev, KeyEvent& out) const;
    TScreenCell* cellAt(int row, int col);

    GameController controller;
    GameLoop loop;
    CrashReporter &reporter;

    unsigned periodMs;
    TTimerId timerId {0};
    bool gameOverPosted {false};

    // Single-slot input buffer: the latest unconsumed key wins.
    KeyEvent pendingKey;
    bool hasPendingKey {false};

    int bufW {0};
    int bufH {0};
    std::vector<TScreenCell> cells;
    std::vector<TScreenCell> lineBuf;
};

// Window sized to `bounds` hosting a new game at `difficulty`.
// Throws GameSetupError when the board cannot hold the game.
class TWindow;
TWindow* createSnakeWindow(const TRect &bounds, Difficulty difficulty,
                           unsigned tickMs, CrashReporter &reporter);

#endif // SNAKE_VIEW_H
