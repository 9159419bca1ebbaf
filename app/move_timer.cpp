/*---------------------------------------------------------*/
/*                                                         */
/*   move_timer.cpp - Scheduled and forced move decisions  */
/*                                                         */
/*---------------------------------------------------------*/

#include "move_timer.h"

#include <chrono>

bool shouldMove(double now, double lastMoveTime, double interval, bool forceMove) {
    const double elapsed = now - lastMoveTime;
    if (elapsed >= interval)
        return true;
    return forceMove && elapsed >= kMinForceSpacing;
}

bool MoveTimer::poll(double now, bool forceMove) {
    if (!shouldMove(now, lastMove, moveInterval, forceMove))
        return false;
    lastMove = now;
    return true;
}

double monotonicSeconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}
