#pragma once

#include <string>

int catalogDump(const std::string& catalogPath);
