#pragma once

#include <string>
#include <vector>

// argv helpers shared by the subcommands; argv[0] is the subcommand name.
bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
int get_arg_int(int argc, char** argv, const std::string& key, int def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);

// "a, b,c" -> {"a", "b", "c"}; empty items dropped
std::vector<std::string> split_csv(const std::string& s);
