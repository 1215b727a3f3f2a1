#pragma once
#include <vector>

class Kinder;
class RandomSource;
struct Block;

// per kinder contest bookkeeping: Idle (engaged == false) or Engaged(timer)
// opponents are kinder ids, which double as indices into the kinder table
struct ContestState
{
    bool engaged = false;
    int timer = 0;
    int opponent = -1;
    int lastOpponent = -1;
    bool snatcher = false;
};

// single trial: true when the side holding selfScore becomes the snatcher
// P(true) = selfScore / (selfScore + opponentScore)
bool rollSnatcher(int selfScore, int opponentScore, RandomSource &rng);

// target number of blocks the winner takes, round(w / (w + v) * v) with ties to even
int snatchAmount(int winnerScore, int victimScore);

// moves blocks one at a time from the top of the victim's stack to the winner
// stops early once the victim is down to one block; returns blocks moved
int snatchBlocks(Kinder &winner, Kinder &victim, std::vector<Block> &blocks);
