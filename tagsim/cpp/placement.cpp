#include <tagsim/placement.hpp>
#include <tagsim/exceptions.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_set>
#include <glog/logging.h>

namespace {
void CheckFits(const Field& field, size_t num_players) {
    if (num_players == 0) {
        throw InvalidConfiguration("player count must be positive");
    }
    if (static_cast<int64_t>(num_players) > field.GetNumCells()) {
        throw InvalidConfiguration(std::to_string(num_players) + " players do not fit into a " +
                                   std::to_string(field.GetWidth()) + "x" +
                                   std::to_string(field.GetHeight()) + " field");
    }
}

inline Position CellAt(const Field& field, int64_t cell) {
    return {static_cast<Coord>(cell % field.GetWidth()),
            static_cast<Coord>(cell / field.GetWidth())};
}
}  // namespace

std::vector<Position> RandomPlacement::Place(const Field& field, PlayerCount num_players) const {
    CheckFits(field, num_players.Get());
    std::mt19937_64 rd{seed_};
    const int64_t num_cells = field.GetNumCells();

    std::vector<Position> positions;
    positions.reserve(num_players.Get());
    if (2 * static_cast<int64_t>(num_players.Get()) > num_cells) {
        // Crowded field, rejection sampling would spin.
        std::vector<int64_t> cells(num_cells);
        std::iota(cells.begin(), cells.end(), 0);
        std::shuffle(cells.begin(), cells.end(), rd);
        for (size_t i = 0; i < num_players.Get(); ++i) {
            positions.push_back(CellAt(field, cells[i]));
        }
    } else {
        std::uniform_int_distribution<int64_t> pick_cell{0, num_cells - 1};
        std::unordered_set<int64_t> taken;
        while (positions.size() < num_players.Get()) {
            int64_t cell = pick_cell(rd);
            if (taken.insert(cell).second) {
                positions.push_back(CellAt(field, cell));
            }
        }
    }
    VLOG(3) << "Placed " << positions.size() << " players randomly with seed " << seed_;
    return positions;
}

std::vector<Position> GridPlacement::Place(const Field& field, PlayerCount num_players) const {
    CheckFits(field, num_players.Get());
    const int64_t stride =
        std::max<int64_t>(1, field.GetNumCells() / static_cast<int64_t>(num_players.Get()));

    std::vector<Position> positions;
    positions.reserve(num_players.Get());
    for (size_t i = 0; i < num_players.Get(); ++i) {
        positions.push_back(CellAt(field, static_cast<int64_t>(i) * stride));
    }
    VLOG(3) << "Placed " << positions.size() << " players on a grid with stride " << stride;
    return positions;
}

Field DefaultFieldFor(PlayerCount num_players) {
    const double side = 2 * std::ceil(std::sqrt(static_cast<double>(num_players.Get())));
    if (side > static_cast<double>(std::numeric_limits<Coord>::max())) {
        throw InvalidConfiguration("no default field fits " + std::to_string(num_players.Get()) +
                                   " players, the side would exceed " +
                                   std::to_string(std::numeric_limits<Coord>::max()));
    }
    const Coord size = std::max(10, static_cast<Coord>(side));
    return Field{FieldWidth{size}, FieldHeight{size}};
}

std::vector<PlayerState> MakeInitialPlayers(const std::vector<Position>& positions) {
    std::vector<PlayerState> players;
    players.reserve(positions.size());
    for (const auto& pos : positions) {
        players.push_back({pos, players.empty() ? Role::kIt : Role::kRunner, std::nullopt});
    }
    return players;
}
