#include <tag_game/ascii_viewer.hpp>
#include <tag_game/summary_printer.hpp>
#include <tagsim/simulation.hpp>

#include <glog/logging.h>
#include <gflags/gflags.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

DEFINE_uint64(player_count, 5, "Number of players, player 0 starts as It");
DEFINE_uint64(step_count, 100, "Number of steps to simulate");
DEFINE_int32(field_width, 0, "Field width, 0 picks a size from the player count");
DEFINE_int32(field_height, 0, "Field height, 0 picks a size from the player count");
DEFINE_uint64(seed, 0, "Seed of the random start placement");
DEFINE_string(placement, "random", "Start placement: random or grid");
DEFINE_bool(render, true, "Print an ascii frame after every step");
DEFINE_bool(summary, true, "Print a per-player summary when the run is over");

namespace {
std::shared_ptr<const IPlacement> MakePlacement(const std::string& name, uint64_t seed) {
    if (name == "random") {
        return std::make_shared<RandomPlacement>(seed);
    }
    if (name == "grid") {
        return std::make_shared<GridPlacement>();
    }
    throw InvalidConfiguration("unknown placement '" + name + "', expected random or grid");
}
}  // namespace

int main(int argc, char** argv) {
    google::LogToStderr();
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("Simulates a game of tag between greedy agents");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    try {
        Simulation::Builder builder;
        builder.SetPlayerCount(FLAGS_player_count)
            .SetStepCount(FLAGS_step_count)
            .SetPlacement(MakePlacement(FLAGS_placement, FLAGS_seed));
        if (FLAGS_field_width != 0 || FLAGS_field_height != 0) {
            builder.SetFieldSize(FLAGS_field_width, FLAGS_field_height);
        }
        Simulation simulation = std::move(builder).Build();

        AsciiViewer viewer{&std::cout, simulation.GetEnvironment().GetField()};
        if (FLAGS_render) {
            simulation.AddObserver(&viewer);
        }
        simulation.Run();

        if (FLAGS_summary) {
            SummaryPrinter printer;
            SummaryPrinter::PrintHeader(std::cout);
            printer.PrintBody(std::cout, simulation);
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << e.what();
        return 1;
    }
    return 0;
}
