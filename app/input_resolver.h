/*---------------------------------------------------------*/
/*                                                         */
/*   input_resolver.h - Key to direction state machine     */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef INPUT_RESOLVER_H
#define INPUT_RESOLVER_H

#include "snake_rules.h"

#include <cstdint>

// Front-end key codes after platform mapping.
enum class KeyKind : uint8_t { Up, Down, Left, Right, Quit, Confirm, Character };

struct KeyEvent {
    KeyKind kind {KeyKind::Character};
    char ch {0};

    KeyEvent() = default;
    KeyEvent(KeyKind k, char c = 0) : kind(k), ch(c) {}
};

enum class InputSignal : uint8_t { None, ForceMove, Quit };

bool keyToDir(KeyKind kind, Dir& out);

// Applies one key to the current direction.
//   same direction      -> ForceMove, direction unchanged
//   new, not reversal   -> direction updated, ForceMove
//   reversal            -> ignored
//   Quit                -> Quit
// `key` may be null when nothing was pressed this tick.
InputSignal resolveInput(Dir& current, const KeyEvent* key);

#endif // INPUT_RESOLVER_H
