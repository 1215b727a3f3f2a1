#include "Contest.h"
#include "Block.h"
#include "Kinder.h"
#include "RandomSource.h"
#include <cmath>

bool rollSnatcher(int selfScore, int opponentScore, RandomSource &rng)
{
    int total = selfScore + opponentScore;
    if (total <= 0)
        return false;
    float chance = static_cast<float>(selfScore) / static_cast<float>(total);
    return rng.uniform() < chance;
}

int snatchAmount(int winnerScore, int victimScore)
{
    int total = winnerScore + victimScore;
    if (total <= 0)
        return 0;
    double share = static_cast<double>(winnerScore) / total * victimScore;
    // default rounding mode is to nearest, ties to even
    return static_cast<int>(std::nearbyint(share));
}

int snatchBlocks(Kinder &winner, Kinder &victim, std::vector<Block> &blocks)
{
    int amount = snatchAmount(winner.getScore(), victim.getScore());
    int moved = 0;
    for (int i = 0; i < amount; ++i)
    {
        // never leave the victim empty handed
        if (victim.getScore() <= 1)
            break;
        size_t blockIndex = victim.surrenderBlock();
        blocks[blockIndex].owner = winner.getId();
        winner.receiveBlock(blockIndex);
        ++moved;
    }
    return moved;
}
