/*---------------------------------------------------------*/
/*                                                         */
/*   move_timer.h - Scheduled and forced move decisions    */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef MOVE_TIMER_H
#define MOVE_TIMER_H

// Forced moves are never closer together than this (20 moves/s).
static constexpr double kMinForceSpacing = 0.05;

// All times are in seconds on a monotonic clock.
bool shouldMove(double now, double lastMoveTime, double interval, bool forceMove);

class MoveTimer {
public:
    MoveTimer() = default;
    MoveTimer(double interval, double startTime)
        : moveInterval(interval), lastMove(startTime) {}

    // Returns true and resets the cursor to `now` when a move is due.
    bool poll(double now, bool forceMove);

    double interval() const { return moveInterval; }
    double lastMoveTime() const { return lastMove; }

private:
    double moveInterval {0.6};
    double lastMove {0.0};
};

// Seconds since an arbitrary fixed point (steady clock).
double monotonicSeconds();

#endif // MOVE_TIMER_H
