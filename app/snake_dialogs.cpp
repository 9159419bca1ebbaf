/*---------------------------------------------------------*/
/*                                                         */
/*   snake_dialogs.cpp - Difficulty, name entry, scores    */
/*                                                         */
/*---------------------------------------------------------*/

#include "snake_dialogs.h"

#define Uses_TButton
#define Uses_TInputLine
#define Uses_TLabel
#define Uses_TStaticText
#define Uses_TSItem
#define Uses_TKeys
#define Uses_TDrawBuffer
#define Uses_TProgram
#define Uses_TDeskTop
#define Uses_TFilterValidator
#define Uses_MsgBox
#include <tvision/tv.h>

#include <cstdio>

static const char* const kNameChars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

// Centres a dialog of w x h on the desktop.
static TRect centeredRect(int w, int h) {
    TRect r(0, 0, w, h);
    r.move((TProgram::deskTop->size.x - w) / 2,
           (TProgram::deskTop->size.y - h) / 2);
    return r;
}

// ── TDifficultyDialog ─────────────────────────────────────

TDifficultyDialog::TDifficultyDialog(Difficulty initial) :
    TDialog(centeredRect(50, 16), "Snake"),
    TWindowInit(&TDifficultyDialog::initFrame),
    tierButtons_(nullptr)
{
    insert(new TStaticText(TRect(2, 2, 48, 3), "\003SNAKE GAME"));
    insert(new TStaticText(TRect(2, 4, 48, 5), "\003Select Difficulty:"));

    tierButtons_ = new TRadioButtons(TRect(4, 6, 46, 10),
        new TSItem("~1~. Easy (No obstacles, 0.6s speed)",
        new TSItem("~2~. Medium (5 obstacles, 0.3s speed)",
        new TSItem("~3~. Hard (10 obstacles, 0.2s speed)",
        new TSItem("~4~. Insane (15 obstacles, 0.05s speed)", nullptr)))));
    tierButtons_->value = (int)initial;
    insert(tierButtons_);

    insert(new TStaticText(TRect(2, 11, 48, 12), "\003Press 1-4 to start, q or Esc to quit"));

    insert(new TButton(TRect(12, 13, 24, 15), "~P~lay", cmOK, bfDefault));
    insert(new TButton(TRect(26, 13, 38, 15), "Cancel", cmCancel, bfNormal));

    tierButtons_->select();
}

void TDifficultyDialog::handleEvent(TEvent& event) {
    if (event.what == evKeyDown) {
        const char ch = event.keyDown.charScan.charCode;
        if (ch >= '1' && ch <= '4') {
            tierButtons_->value = ch - '1';
            tierButtons_->drawView();
            clearEvent(event);
            endModal(cmOK);
            return;
        }
        if (ch == 'q') {
            clearEvent(event);
            endModal(cmCancel);
            return;
        }
    }
    TDialog::handleEvent(event);
}

Difficulty TDifficultyDialog::selected() const {
    return difficultyFromIndex((int)tierButtons_->value);
}

bool runDifficultyDialog(Difficulty initial, Difficulty& out) {
    TDifficultyDialog* dlg = new TDifficultyDialog(initial);
    ushort result = TProgram::deskTop->execView(dlg);
    if (result == cmOK)
        out = dlg->selected();
    TObject::destroy(dlg);
    return result == cmOK;
}

// ── Name entry ────────────────────────────────────────────

bool runNameEntryDialog(int score, Difficulty tier, std::string& name) {
    for (;;) {
        TDialog* dlg = new TDialog(centeredRect(44, 11), "New High Score");

        char header[64];
        snprintf(header, sizeof(header), "\003%d points on %s", score, difficultyLabel(tier));
        dlg->insert(new TStaticText(TRect(2, 2, 42, 3), header));

        TInputLine* input = new TInputLine(TRect(3, 5, 41, 6), kMaxNameLength + 1,
                                           new TFilterValidator(kNameChars));
        dlg->insert(new TLabel(TRect(2, 4, 40, 5), "~Y~our name (letters and digits):", input));
        dlg->insert(input);

        dlg->insert(new TButton(TRect(9, 8, 21, 10), "~O~K", cmOK, bfDefault));
        dlg->insert(new TButton(TRect(23, 8, 35, 10), "Skip", cmCancel, bfNormal));
        input->select();

        ushort result = TProgram::deskTop->execView(dlg);
        char buf[64] = {0};
        if (result == cmOK)
            input->getData(buf);
        TObject::destroy(dlg);

        if (result != cmOK)
            return false;
        if (Leaderboard::normalizeName(buf, name))
            return true;
        messageBox("Enter 1-20 letters or digits.", mfWarning | mfOKButton);
    }
}

// ── High scores ───────────────────────────────────────────

static const TColorAttr LIST_ATTR   = TColorAttr(TColorRGB(0x00, 0x00, 0x00), TColorRGB(0xAA, 0xAA, 0xAA));
static const TColorAttr HEADER_ATTR = TColorAttr(TColorRGB(0x00, 0x00, 0x00), TColorRGB(0x00, 0xFF, 0x00));

THighScoreList::THighScoreList(const TRect& bounds, const Leaderboard& board, Difficulty tier)
    : TView(bounds), board_(board), tier_(tier)
{
}

void THighScoreList::setTier(Difficulty tier) {
    tier_ = tier;
    drawView();
}

void THighScoreList::draw() {
    const auto& list = board_.entries(tier_);
    TDrawBuffer b;
    char line[64];

    for (int y = 0; y < size.y; ++y) {
        b.moveChar(0, ' ', LIST_ATTR, size.x);
        if (y == 0) {
            snprintf(line, sizeof(line), " %s - top %zu", difficultyLabel(tier_), kLeaderboardSize);
            b.moveStr(0, line, HEADER_ATTR);
        } else if (y == 1 && list.empty()) {
            b.moveStr(0, "  (no scores yet)", LIST_ATTR);
        } else if (y >= 1 && (size_t)(y - 1) < list.size()) {
            const LeaderboardEntry& e = list[y - 1];
            snprintf(line, sizeof(line), " %2d. %-20s %7d", y, e.name.c_str(), e.score);
            b.moveStr(0, line, LIST_ATTR);
        }
        writeLine(0, y, size.x, 1, b);
    }
}

THighScoresDialog::THighScoresDialog(const Leaderboard& board, Difficulty initial) :
    TDialog(centeredRect(50, 18), "High Scores"),
    TWindowInit(&THighScoresDialog::initFrame),
    list_(nullptr)
{
    list_ = new THighScoreList(TRect(3, 2, 47, 13), board, initial);
    insert(list_);

    insert(new TButton(TRect(2, 14, 12, 16), "~E~asy", cmShowEasy, bfNormal));
    insert(new TButton(TRect(12, 14, 23, 16), "~M~edium", cmShowMedium, bfNormal));
    insert(new TButton(TRect(23, 14, 32, 16), "~H~ard", cmShowHard, bfNormal));
    insert(new TButton(TRect(32, 14, 42, 16), "~I~nsane", cmShowInsane, bfNormal));
    insert(new TButton(TRect(42, 14, 48, 16), "OK", cmOK, bfDefault));
}

void THighScoresDialog::handleEvent(TEvent& event) {
    TDialog::handleEvent(event);

    if (event.what == evCommand) {
        switch (event.message.command) {
            case cmShowEasy:   list_->setTier(Difficulty::Easy);   clearEvent(event); break;
            case cmShowMedium: list_->setTier(Difficulty::Medium); clearEvent(event); break;
            case cmShowHard:   list_->setTier(Difficulty::Hard);   clearEvent(event); break;
            case cmShowInsane: list_->setTier(Difficulty::Insane); clearEvent(event); break;
            default: break;
        }
    }
}

void runHighScoresDialog(const Leaderboard& board, Difficulty initial) {
    THighScoresDialog* dlg = new THighScoresDialog(board, initial);
    TProgram::deskTop->execView(dlg);
    TObject::destroy(dlg);
}
