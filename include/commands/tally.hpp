#pragma once

int cmd_tally(int argc, char** argv);
