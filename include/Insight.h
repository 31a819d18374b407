#pragma once

#include <map>
#include <string>

// Narrative finding produced by an analysis call, with the numbers that back it.
struct Insight {
    std::string category;
    std::string severity;
    double confidence = 0.0;
    std::string finding;
    std::string evidence;
    std::string recommendation;
    std::map<std::string, double> metrics;
};
