#pragma once

#include "vote/Condorcet.hpp"

int cmd_group(int argc, char** argv);

// WINNER / CYCLE_BROKEN / ranking lines, shared with `tally`
void print_vote_result(const vote::VotingResult& res);
