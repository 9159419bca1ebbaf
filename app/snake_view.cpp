/*---------------------------------------------------------*/
/*                                                         */
/*   snake_view.cpp - Snake board view and game window     */
/*                                                         */
/*---------------------------------------------------------*/

#include "snake_view.h"
#include "crash_report.h"

#define Uses_TWindow
#define Uses_TEvent
#define Uses_TKeys
#define Uses_TProgram
#include <tvision/tv.h>

#include <algorithm>

const ushort cmSnakeGameOver = 3101;

// ── Colors ────────────────────────────────────────────────

static const TColorAttr HEAD_ATTR     = TColorAttr(TColorRGB(0x00, 0xFF, 0x00), TColorRGB(0x00, 0x20, 0x00));
static const TColorAttr BODY_ATTR     = TColorAttr(TColorRGB(0x00, 0xC0, 0x00), TColorRGB(0x00, 0x00, 0x00));
static const TColorAttr FOOD_ATTR     = TColorAttr(TColorRGB(0xFF, 0x30, 0x30), TColorRGB(0x40, 0x00, 0x00));
static const TColorAttr OBSTACLE_ATTR = TColorAttr(TColorRGB(0xC0, 0x80, 0x40), TColorRGB(0x08, 0x08, 0x08));
static const TColorAttr WALL_ATTR     = TColorAttr(TColorRGB(0x40, 0x40, 0x40), TColorRGB(0x80, 0x80, 0x80));
static const TColorAttr EMPTY_ATTR    = TColorAttr(TColorRGB(0x0A, 0x0A, 0x0A), TColorRGB(0x1A, 0x1A, 0x1A));
static const TColorAttr TEXT_ATTR     = TColorAttr(TColorRGB(0xFF, 0xFF, 0xFF), TColorRGB(0x40, 0x40, 0x40));
static const TColorAttr BG_ATTR       = TColorAttr(TColorRGB(0x08, 0x08, 0x08), TColorRGB(0x08, 0x08, 0x08));

static char glyphChar(Glyph g) {
    switch (g) {
        case Glyph::Wall:     return '\xB1';  // CP437 medium shade
        case Glyph::Head:     return '@';
        case Glyph::Body:     return '*';
        case Glyph::Food:     return '#';
        case Glyph::Obstacle: return '\xDB';  // CP437 full block
        default:              return ' ';
    }
}

static TColorAttr glyphAttr(Glyph g) {
    switch (g) {
        case Glyph::Wall:     return WALL_ATTR;
        case Glyph::Head:     return HEAD_ATTR;
        case Glyph::Body:     return BODY_ATTR;
        case Glyph::Food:     return FOOD_ATTR;
        case Glyph::Obstacle: return OBSTACLE_ATTR;
        default:              return EMPTY_ATTR;
    }
}

// ── TSnakeView ────────────────────────────────────────────

TSnakeView::TSnakeView(const TRect &bounds, Difficulty difficulty,
                       unsigned tickMs, CrashReporter &reporter_)
    : TView(bounds), loop(controller, *this), reporter(reporter_), periodMs(tickMs)
{
    options |= ofSelectable | ofFirstClick;
    eventMask |= evBroadcast | evKeyDown;

    // Board is the view's size at game start and never changes.
    bufW = size.x;
    bufH = size.y;
    cells.resize((size_t)std::max(0, bufW * bufH));

    controller.start(difficulty, bufH, bufW, monotonicSeconds());
    reporter.track(controller.snapshot());
    loop.render();
}

TSnakeView::~TSnakeView() {
    stopTimer();
}

void TSnakeView::startTimer() {
    if (timerId == 0 && !controller.state().isOver())
        timerId = setTimer(periodMs, (int)periodMs);
}

void TSnakeView::stopTimer() {
    if (timerId != 0) {
        killTimer(timerId);
        timerId = 0;
    }
}

// ── Renderer ──────────────────────────────────────────────

TScreenCell* TSnakeView::cellAt(int row, int col) {
    if (row < 0 || row >= bufH || col < 0 || col >= bufW)
        return nullptr;
    return &cells[row * bufW + col];
}

void TSnakeView::clear() {
    for (auto &c : cells)
        ::setCell(c, ' ', EMPTY_ATTR);
}

void TSnakeView::drawCell(const Position& pos, Glyph glyph) {
    if (TScreenCell *c = cellAt(pos.row, pos.col))
        ::setCell(*c, glyphChar(glyph), glyphAttr(glyph));
}

void TSnakeView::drawText(const Position& pos, const std::string& text) {
    for (size_t i = 0; i < text.size(); ++i) {
        if (TScreenCell *c = cellAt(pos.row, pos.col + (int)i))
            ::setCell(*c, text[i], TEXT_ATTR);
    }
}

bool TSnakeView::pollKey(KeyEvent& out) {
    if (!hasPendingKey)
        return false;
    out = pendingKey;
    hasPendingKey = false;
    return true;
}

// ── Game tick ─────────────────────────────────────────────

void TSnakeView::tick() {
    TickResult result;
    try {
        result = loop.tick(monotonicSeconds());
    } catch (const std::exception &e) {
        // Record where it happened, then let it reach main().
        reporter.capture(e);
        throw;
    }
    reporter.track(controller.snapshot());

    if (result.moved || result.finished)
        drawView();

    if (controller.state().isOver() && !gameOverPosted) {
        stopTimer();
        gameOverPosted = true;
        TEvent ev;
        ev.what = evCommand;
        ev.message.command = cmSnakeGameOver;
        ev.message.infoPtr = this;
        putEvent(ev);
    }
}

// ── Drawing ───────────────────────────────────────────────

void TSnakeView::draw() {
    const int W = size.x;
    const int H = size.y;
    if (W <= 0 || H <= 0) return;

    if ((int)lineBuf.size() < W)
        lineBuf.resize(W);

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            if (TScreenCell *c = cellAt(y, x))
                lineBuf[x] = *c;
            else
                ::setCell(lineBuf[x], ' ', BG_ATTR);
        }
        writeLine(0, y, W, 1, lineBuf.data());
    }
}

// ── Event handling ────────────────────────────────────────

bool TSnakeView::mapKey(const TEvent &ev, KeyEvent& out) const {
    const ushort key = ev.keyDown.keyCode;
    const uchar ch = ev.keyDown.charScan.charCode;

    switch (key) {
        case kbUp:    out = KeyEvent(KeyKind::Up);    return true;
        case kbDown:  out = KeyEvent(KeyKind::Down);  return true;
        case kbLeft:  out = KeyEvent(KeyKind::Left);  return true;
        case kbRight: out = KeyEvent(KeyKind::Right); return true;
        case kbEsc:   out = KeyEvent(KeyKind::Quit);  return true;
        case kbEnter: out = KeyEvent(KeyKind::Confirm); return true;
        default: break;
    }
    if (ch == 'q') {
        out = KeyEvent(KeyKind::Quit, 'q');
        return true;
    }
    if (ch >= 0x20 && ch < 0x7F) {
        out = KeyEvent(KeyKind::Character, (char)ch);
        return true;
    }
    return false;
}

void TSnakeView::handleEvent(TEvent &ev) {
    TView::handleEvent(ev);

    if (ev.what == evBroadcast && ev.message.command == cmTimerExpired) {
        if (timerId != 0 && ev.message.infoPtr == timerId) {
            tick();
            clearEvent(ev);
            return;
        }
    }

    if (ev.what == evKeyDown && !controller.state().isOver()) {
        KeyEvent key;
        if (mapKey(ev, key)) {
            pendingKey = key;
            hasPendingKey = true;
            clearEvent(ev);
        }
    }
}

void TSnakeView::setState(ushort aState, Boolean enable) {
    TView::setState(aState, enable);
    if ((aState & sfExposed) != 0) {
        if (enable) {
            startTimer();
            drawView();
        } else {
            stopTimer();
        }
    }
}

// ── Window wrapper ────────────────────────────────────────

class TSnakeWindow : public TWindow {
public:
    explicit TSnakeWindow(const TRect &bounds)
        : TWindow(bounds, "Snake", wnNoNumber)
        , TWindowInit(&TSnakeWindow::initFrame) {}

    void setup(Difficulty difficulty, unsigned tickMs, CrashReporter &reporter) {
        flags &= ~(wfGrow | wfZoom);
        TRect c = getExtent();
        c.grow(-1, -1);
        insert(new TSnakeView(c, difficulty, tickMs, reporter));
    }
};

TWindow* createSnakeWindow(const TRect &bounds, Difficulty difficulty,
                           unsigned tickMs, CrashReporter &reporter) {
    auto *w = new TSnakeWindow(bounds);
    try {
        w->setup(difficulty, tickMs, reporter);
    } catch (...) {
        TObject::destroy(w);
        throw;
    }
    return w;
}
