#include <tagsim/agent_strategy.hpp>

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>
#include <glog/logging.h>

namespace {
// Moves whose target stays on the field without clamping, in canonical order. Stay is
// always among them.
std::vector<std::pair<Move, Position>> LegalMoves(const EnvironmentView& view,
                                                  PlayerIndex self) {
    const Position from = view.GetPosition(self);
    std::vector<std::pair<Move, Position>> result;
    result.reserve(kAllMoves.size());
    for (Move move : kAllMoves) {
        Position to = ApplyDelta(from, move);
        if (view.GetField().Contains(to)) {
            result.emplace_back(move, to);
        }
    }
    return result;
}
}  // namespace

Move ItStrategy::Decide(const EnvironmentView& view, PlayerIndex self) const {
    auto nearest_runner = [&view, self](Position pos) {
        int64_t nearest = std::numeric_limits<int64_t>::max();
        for (PlayerIndex other = 0; other < view.GetNumPlayers(); ++other) {
            if (other != self && view.GetRole(other) == Role::kRunner) {
                nearest = std::min(nearest, SquaredDistance(pos, view.GetPosition(other)));
            }
        }
        return nearest;
    };

    if (view.GetNumPlayers() < 2) {
        return Move::kStay;
    }

    Move best_move = Move::kStay;
    int64_t best_distance = std::numeric_limits<int64_t>::max();
    for (const auto& [move, to] : LegalMoves(view, self)) {
        int64_t distance = nearest_runner(to);
        if (distance < best_distance) {
            best_move = move;
            best_distance = distance;
        }
    }
    VLOG(2) << "It " << self << " at " << view.GetPosition(self) << " picks " << best_move
            << " (squared distance " << best_distance << ")";
    return best_move;
}

Move RunnerStrategy::Decide(const EnvironmentView& view, PlayerIndex self) const {
    const Position it_position = view.GetPosition(view.GetIt());

    // Stay is the baseline, any other move has to strictly improve on it.
    Move best_move = Move::kStay;
    int64_t best_distance = SquaredDistance(view.GetPosition(self), it_position);
    for (const auto& [move, to] : LegalMoves(view, self)) {
        int64_t distance = SquaredDistance(to, it_position);
        if (distance > best_distance) {
            best_move = move;
            best_distance = distance;
        }
    }
    VLOG(2) << "Runner " << self << " at " << view.GetPosition(self) << " picks " << best_move
            << " (squared distance " << best_distance << ")";
    return best_move;
}

Move RoleBasedAgent::Decide(const EnvironmentView& view, PlayerIndex self) const {
    if (view.GetRole(self) == Role::kIt) {
        return it_strategy_.Decide(view, self);
    }
    return runner_strategy_.Decide(view, self);
}

std::unique_ptr<IAgentStrategy> MakeRoleBasedAgent(PlayerIndex /*player*/) {
    return std::make_unique<RoleBasedAgent>();
}
