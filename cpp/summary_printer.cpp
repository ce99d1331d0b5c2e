#include <tag_game/summary_printer.hpp>

#include <ostream>

std::ostream& SummaryPrinter::PrintHeader(std::ostream& stream) {
    stream << "Player,X,Y,Role,Tags,StepsAsIt,TaggedBy\n";
    return stream;
}

std::ostream& SummaryPrinter::PrintBody(std::ostream& stream, const Simulation& simulation) {
    const Environment& environment = simulation.GetEnvironment();
    for (PlayerIndex player = 0; player < environment.GetNumPlayers(); ++player) {
        const Position& pos = environment.GetPosition(player);
        stream << player << "," << pos.x << "," << pos.y << "," << environment.GetRole(player)
               << "," << simulation.GetTagCount(player) << "," << simulation.GetTimesIt(player)
               << ",";
        if (auto tagged_by = environment.GetTaggedBy(player)) {
            stream << *tagged_by;
        }
        stream << "\n";
    }
    return stream;
}
