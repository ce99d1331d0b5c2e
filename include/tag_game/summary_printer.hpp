#pragma once

#include <tagsim/simulation.hpp>

#include <iosfwd>

class SummaryPrinter {
public:
    static std::ostream& PrintHeader(std::ostream& stream);
    std::ostream& PrintBody(std::ostream& stream, const Simulation& simulation);
};
