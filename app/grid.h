/*---------------------------------------------------------*/
/*                                                         */
/*   grid.h - Playfield geometry with a 1-cell wall ring   */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef GRID_H
#define GRID_H

#include <random>

struct Position {
    int row {0};
    int col {0};

    Position() = default;
    Position(int r, int c) : row(r), col(c) {}

    bool operator==(const Position& o) const { return row == o.row && col == o.col; }
    bool operator!=(const Position& o) const { return !(*this == o); }
    bool operator<(const Position& o) const {
        return row < o.row || (row == o.row && col < o.col);
    }
};

// Rectangular board of H rows by W cols. Row 0, row H-1, col 0 and
// col W-1 are wall; everything else is interior.
class Grid {
public:
    Grid() = default;
    Grid(int height, int width) : h(height), w(width) {}

    int height() const { return h; }
    int width() const { return w; }

    bool isWall(const Position& p) const {
        return p.row == 0 || p.row == h - 1 || p.col == 0 || p.col == w - 1;
    }
    bool isInterior(const Position& p) const {
        return p.row >= 1 && p.row <= h - 2 && p.col >= 1 && p.col <= w - 2;
    }

    // Food may land anywhere inside the wall ring.
    bool hasFoodRange() const { return h >= 3 && w >= 3; }
    Position randomFoodCell(std::mt19937& rng) const;

    // Obstacles keep one extra ring clear: rows [2, H-3], cols [2, W-3].
    bool hasObstacleRange() const { return h >= 5 && w >= 5; }
    Position randomObstacleCell(std::mt19937& rng) const;

private:
    int h {0};
    int w {0};
};

#endif // GRID_H
