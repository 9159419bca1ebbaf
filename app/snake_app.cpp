/*---------------------------------------------------------*/
/*                                                         */
/*   snake_app.cpp - tvsnake application and entry point   */
/*                                                         */
/*---------------------------------------------------------*/

#define Uses_TKeys
#define Uses_TApplication
#define Uses_TEvent
#define Uses_TRect
#define Uses_TMenuBar
#define Uses_TSubMenu
#define Uses_TMenuItem
#define Uses_TStatusLine
#define Uses_TStatusItem
#define Uses_TStatusDef
#define Uses_TDeskTop
#define Uses_TWindow
#define Uses_MsgBox
#include <tvision/tv.h>

#include "crash_report.h"
#include "game_config.h"
#include "leaderboard.h"
#include "placement.h"
#include "snake_dialogs.h"
#include "snake_view.h"

#include <cstdio>
#include <string>

// Command constants
const ushort cmNewGame = 3001;
const ushort cmHighScores = 3002;
const ushort cmAbout = 3003;

/*---------------------------------------------------------*/
/* TSnakeApp - Main application class                      */
/*---------------------------------------------------------*/
class TSnakeApp : public TApplication
{
public:
    TSnakeApp(const GameConfig& config, CrashReporter& reporter);
    virtual void handleEvent(TEvent& event);
    static TMenuBar* initMenuBar(TRect);
    static TStatusLine* initStatusLine(TRect);

    bool playedAny() const { return played; }
    int lastScore() const { return finalScore; }

private:
    void newGame();
    void gameOver(TSnakeView* view);
    void showHighScores();
    void closeGameWindow();

    GameConfig config;
    CrashReporter& reporter;
    LeaderboardStore store;
    TWindow* gameWindow;
    Difficulty lastDifficulty;
    bool played;
    int finalScore;
};

TSnakeApp::TSnakeApp(const GameConfig& config_, CrashReporter& reporter_) :
    TProgInit(&TSnakeApp::initStatusLine,
              &TSnakeApp::initMenuBar,
              &TSnakeApp::initDeskTop),
    config(config_),
    reporter(reporter_),
    store(config_.leaderboardPath),
    gameWindow(nullptr),
    lastDifficulty(Difficulty::Easy),
    played(false),
    finalScore(0)
{
    // Open the start menu as soon as the event loop runs.
    TEvent ev;
    ev.what = evCommand;
    ev.message.command = cmNewGame;
    ev.message.infoPtr = nullptr;
    putEvent(ev);
}

void TSnakeApp::handleEvent(TEvent& event)
{
    TApplication::handleEvent(event);

    if (event.what == evCommand)
    {
        switch (event.message.command)
        {
            case cmNewGame:
                newGame();
                clearEvent(event);
                break;
            case cmHighScores:
                showHighScores();
                clearEvent(event);
                break;
            case cmSnakeGameOver:
                gameOver(static_cast<TSnakeView*>(event.message.infoPtr));
                clearEvent(event);
                break;
            case cmAbout:
                messageBox("\003tvsnake\n\n\003Arrow keys steer and boost.\n\003q or Esc ends a game.",
                           mfInformation | mfOKButton);
                clearEvent(event);
                break;
            default:
                break;
        }
    }
}

// The player can close the game window at any time, so a stored pointer
// is only trusted while the desktop still holds it.
static bool deskTopContains(TView* v)
{
    TView* last = TProgram::deskTop->last;
    if (!v || !last)
        return false;
    TView* p = last;
    do {
        p = p->next;
        if (p == v)
            return true;
    } while (p != last);
    return false;
}

void TSnakeApp::closeGameWindow()
{
    if (gameWindow && deskTopContains(gameWindow)) {
        TObject::destroy(gameWindow);
    }
    gameWindow = nullptr;
}

void TSnakeApp::newGame()
{
    Difficulty d;
    if (!runDifficultyDialog(lastDifficulty, d))
        return;
    lastDifficulty = d;

    closeGameWindow();
    TRect bounds = deskTop->getExtent();
    try {
        gameWindow = createSnakeWindow(bounds, d, config.tickMs, reporter);
    } catch (const GameSetupError& e) {
        fprintf(stderr, "[snake] setup failed: %s\n", e.what());
        std::string msg = std::string("Cannot start game:\n") + e.what();
        messageBox(msg.c_str(), mfError | mfOKButton);
        return;
    }
    deskTop->insert(gameWindow);
}

void TSnakeApp::gameOver(TSnakeView* view)
{
    if (!view || !deskTopContains(gameWindow) || view->owner != gameWindow)
        return;
    const GameState& s = view->gameState();
    const int score = s.score;
    const Difficulty tier = s.difficulty;
    played = true;
    finalScore = score;
    fprintf(stderr, "[snake] game over difficulty=%s score=%d\n", difficultyName(tier), score);

    std::string msg = std::string("\003") +
        (s.status == GameStatus::BoardFull ? "BOARD FULL!" : "GAME OVER!") +
        "\n\n\003Final Score: " + std::to_string(score);
    messageBox(msg.c_str(), mfInformation | mfOKButton);

    Leaderboard board = store.load();
    if (board.isHighScore(score, tier)) {
        std::string name;
        if (runNameEntryDialog(score, tier, name)) {
            board.addHighScore(name, score, tier);
            StoreResult saved = store.save(board);
            if (!saved.ok) {
                fprintf(stderr, "[leaderboard] ERROR: save failed: %s\n", saved.message.c_str());
                std::string warn = "High score not saved:\n" + saved.message;
                messageBox(warn.c_str(), mfWarning | mfOKButton);
            }
            runHighScoresDialog(board, tier);
        }
    }

    closeGameWindow();
    newGame();
}

void TSnakeApp::showHighScores()
{
    Leaderboard board = store.load();
    runHighScoresDialog(board, lastDifficulty);
}

TMenuBar* TSnakeApp::initMenuBar(TRect r)
{
    r.b.y = r.a.y + 1;

    return new TMenuBar(r,
        *new TSubMenu("~G~ame", kbAltG) +
            *new TMenuItem("~N~ew Game...", cmNewGame, kbF2, hcNoContext, "F2") +
            *new TMenuItem("~H~igh Scores", cmHighScores, kbF3, hcNoContext, "F3") +
            newLine() +
            *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X") +
        *new TSubMenu("~H~elp", kbAltH) +
            *new TMenuItem("~A~bout tvsnake", cmAbout, kbNoKey)
    );
}

TStatusLine* TSnakeApp::initStatusLine(TRect r)
{
    r.a.y = r.b.y - 1;
    return new TStatusLine(r,
        *new TStatusDef(0, 0xFFFF) +
            *new TStatusItem("~Alt-X~ Exit", kbAltX, cmQuit) +
            *new TStatusItem("~F2~ New Game", kbF2, cmNewGame) +
            *new TStatusItem("~F3~ High Scores", kbF3, cmHighScores) +
            *new TStatusItem("~F10~ Menu", kbF10, cmMenu)
    );
}

int main()
{
    GameConfig config = GameConfig::fromEnvironment();
    CrashReporter reporter(config.crashDir);
    bool played = false;
    int score = 0;

    try {
        // The application owns the terminal; leaving this scope, normally
        // or by exception, restores it.
        TSnakeApp app(config, reporter);
        app.run();
        played = app.playedAny();
        score = app.lastScore();
    } catch (const std::exception& e) {
        CrashInfo info = reporter.hasCapture() ? reporter.captured() : CrashReporter::describe(e);
        std::string path = reporter.write(info);
        fprintf(stderr, "[crash] %s: %s\n", info.errorType.c_str(), info.message.c_str());
        if (!path.empty())
            fprintf(stderr, "[crash] report written to %s\n", path.c_str());
        return 1;
    }

    if (played)
        printf("\nThanks for playing! Final score: %d\n", score);
    return 0;
}
