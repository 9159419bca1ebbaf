/*---------------------------------------------------------*/
/*                                                         */
/*   input_resolver.cpp - Key to direction state machine   */
/*                                                         */
/*---------------------------------------------------------*/

#include "input_resolver.h"

bool keyToDir(KeyKind kind, Dir& out) {
    switch (kind) {
        case KeyKind::Up:    out = Dir::Up;    return true;
        case KeyKind::Down:  out = Dir::Down;  return true;
        case KeyKind::Left:  out = Dir::Left;  return true;
        case KeyKind::Right: out = Dir::Right; return true;
        default: return false;
    }
}

InputSignal resolveInput(Dir& current, const KeyEvent* key) {
    if (!key)
        return InputSignal::None;

    if (key->kind == KeyKind::Quit)
        return InputSignal::Quit;

    Dir wanted;
    if (!keyToDir(key->kind, wanted))
        return InputSignal::None;

    if (wanted == current)
        return InputSignal::ForceMove;

    // Anti-suicide guard: never turn back onto the neck.
    if (wanted == opposite(current))
        return InputSignal::None;

    current = wanted;
    return InputSignal::ForceMove;
}
