/*---------------------------------------------------------*/
/*   input_timing_test.cpp - ctest for keys and move timer */
/*---------------------------------------------------------*/

#include "input_resolver.h"
#include "move_timer.h"

#include <iostream>

static int failures = 0;

static void check(const char* name, bool cond) {
    if (cond) {
        std::cout << "  PASS: " << name << "\n";
    } else {
        std::cerr << "  FAIL: " << name << "\n";
        failures++;
    }
}

int main() {
    std::cout << "=== Input and Timing Tests ===\n\n";

    std::cout << "[Input: direction changes]\n";
    {
        Dir d = Dir::Right;
        check("no key, no signal", resolveInput(d, nullptr) == InputSignal::None && d == Dir::Right);

        KeyEvent left(KeyKind::Left);
        check("reversal ignored", resolveInput(d, &left) == InputSignal::None);
        check("reversal keeps direction", d == Dir::Right);

        KeyEvent right(KeyKind::Right);
        check("same direction boosts", resolveInput(d, &right) == InputSignal::ForceMove);
        check("boost keeps direction", d == Dir::Right);

        KeyEvent up(KeyKind::Up);
        check("turn boosts", resolveInput(d, &up) == InputSignal::ForceMove);
        check("turn updates direction", d == Dir::Up);

        KeyEvent down(KeyKind::Down);
        check("reversal from up ignored", resolveInput(d, &down) == InputSignal::None && d == Dir::Up);
    }

    std::cout << "\n[Input: reversal from every heading]\n";
    {
        const Dir all[] = { Dir::Up, Dir::Down, Dir::Left, Dir::Right };
        const KeyKind keyFor[] = { KeyKind::Up, KeyKind::Down, KeyKind::Left, KeyKind::Right };
        bool ignored = true, kept = true;
        for (Dir heading : all) {
            Dir back = opposite(heading);
            KeyEvent key(keyFor[(int)back]);
            Dir d = heading;
            if (resolveInput(d, &key) != InputSignal::None) ignored = false;
            if (d != heading) kept = false;
        }
        check("opposite key never signals", ignored);
        check("opposite key never turns", kept);
    }

    std::cout << "\n[Input: other keys]\n";
    {
        Dir d = Dir::Left;
        KeyEvent quit(KeyKind::Quit);
        check("quit signalled", resolveInput(d, &quit) == InputSignal::Quit);
        check("quit keeps direction", d == Dir::Left);

        KeyEvent enter(KeyKind::Confirm);
        check("confirm ignored", resolveInput(d, &enter) == InputSignal::None);

        KeyEvent x(KeyKind::Character, 'x');
        check("letter ignored", resolveInput(d, &x) == InputSignal::None && d == Dir::Left);

        Dir out = Dir::Up;
        check("keyToDir rejects quit", !keyToDir(KeyKind::Quit, out) && out == Dir::Up);
        check("keyToDir maps down", keyToDir(KeyKind::Down, out) && out == Dir::Down);
    }

    std::cout << "\n[Timing: shouldMove]\n";
    {
        check("interval elapsed", shouldMove(0.6, 0.0, 0.6, false));
        check("interval not elapsed", !shouldMove(0.5, 0.0, 0.6, false));
        check("force after 0.05s", shouldMove(0.05, 0.0, 0.6, true));
        check("force too soon", !shouldMove(0.04, 0.0, 0.6, true));
        check("no force, too soon", !shouldMove(0.1, 0.0, 0.6, false));
        check("insane interval", shouldMove(0.05, 0.0, 0.05, false));
    }

    std::cout << "\n[Timing: MoveTimer]\n";
    {
        MoveTimer t(0.6, 0.0);
        check("interval stored", t.interval() == 0.6);
        check("waits for interval", !t.poll(0.5, false));
        check("cursor unchanged while waiting", t.lastMoveTime() == 0.0);
        check("moves on schedule", t.poll(0.625, false));
        check("cursor reset on move", t.lastMoveTime() == 0.625);
        check("next move measured from cursor", !t.poll(1.0, false));
        check("forced move", t.poll(1.0, true));
        check("forced moves rate limited", !t.poll(1.03125, true));
        check("forced move after spacing", t.poll(1.0625, true));
        check("cursor follows forced move", t.lastMoveTime() == 1.0625);
    }

    std::cout << "\n[Timing: clock]\n";
    {
        double a = monotonicSeconds();
        double b = monotonicSeconds();
        check("monotonic clock does not go back", b >= a);
    }

    std::cout << "\n=== Results: " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures;
}
