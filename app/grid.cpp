/*---------------------------------------------------------*/
/*                                                         */
/*   grid.cpp - Playfield geometry                         */
/*                                                         */
/*---------------------------------------------------------*/

#include "grid.h"

static Position sampleRange(std::mt19937& rng, int rowLo, int rowHi, int colLo, int colHi) {
    std::uniform_int_distribution<int> distRow(rowLo, rowHi);
    std::uniform_int_distribution<int> distCol(colLo, colHi);
    int r = distRow(rng);
    int c = distCol(rng);
    return Position(r, c);
}

Position Grid::randomFoodCell(std::mt19937& rng) const {
    return sampleRange(rng, 1, h - 2, 1, w - 2);
}

Position Grid::randomObstacleCell(std::mt19937& rng) const {
    return sampleRange(rng, 2, h - 3, 2, w - 3);
}
