/*---------------------------------------------------------*/
/*                                                         */
/*   snake_dialogs.h - Difficulty, name entry, high scores */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef SNAKE_DIALOGS_H
#define SNAKE_DIALOGS_H

#define Uses_TDialog
#define Uses_TRadioButtons
#define Uses_TEvent
#define Uses_TRect
#define Uses_TView
#include <tvision/tv.h>

#include <string>

#include "difficulty.h"
#include "leaderboard.h"

const ushort
    cmShowEasy   = 3111,
    cmShowMedium = 3112,
    cmShowHard   = 3113,
    cmShowInsane = 3114;

// Start menu: radio list of tiers; keys 1-4 pick and start at once,
// q or Esc cancels.
class TDifficultyDialog : public TDialog {
public:
    explicit TDifficultyDialog(Difficulty initial);

    virtual void handleEvent(TEvent& event) override;

    Difficulty selected() const;

private:
    TRadioButtons* tierButtons_;
};

// One tier of the leaderboard, rank / name / score.
class THighScoreList : public TView {
public:
    THighScoreList(const TRect& bounds, const Leaderboard& board, Difficulty tier);

    virtual void draw() override;

    void setTier(Difficulty tier);

private:
    const Leaderboard& board_;
    Difficulty tier_;
};

class THighScoresDialog : public TDialog {
public:
    THighScoresDialog(const Leaderboard& board, Difficulty initial);

    virtual void handleEvent(TEvent& event) override;

private:
    THighScoreList* list_;
};

// Modal helpers. Each returns false when the player cancels.
bool runDifficultyDialog(Difficulty initial, Difficulty& out);
bool runNameEntryDialog(int score, Difficulty tier, std::string& name);
void runHighScoresDialog(const Leaderboard& board, Difficulty initial);

#endif // SNAKE_DIALOGS_H
