#include <tagsim/environment.hpp>
#include <tagsim/exceptions.hpp>

#include <algorithm>
#include <glog/logging.h>

namespace {
PlayerIndex FindSingleIt(const Field& field, const std::vector<PlayerState>& players) {
    if (players.empty()) {
        throw InvalidConfiguration("at least one player is required");
    }
    std::optional<PlayerIndex> it;
    for (PlayerIndex player = 0; player < players.size(); ++player) {
        const auto& state = players[player];
        if (!field.Contains(state.position)) {
            throw InvalidConfiguration("player " + std::to_string(player) +
                                       " starts outside of the field");
        }
        if (state.role != Role::kIt) {
            continue;
        }
        if (it) {
            throw InvalidConfiguration("players " + std::to_string(*it) + " and " +
                                       std::to_string(player) + " are both It");
        }
        it = player;
    }
    if (!it) {
        throw InvalidConfiguration("no player is It");
    }
    return *it;
}
}  // namespace

EnvironmentView::EnvironmentView(Field field, std::vector<PlayerState> players)
    : field_(field), players_(std::move(players)), it_(FindSingleIt(field_, players_)) {
}

const PlayerState& EnvironmentView::GetState(PlayerIndex player) const {
    if (player >= players_.size()) {
        throw UnknownPlayer(player, players_.size());
    }
    return players_[player];
}

const Position& EnvironmentView::GetPosition(PlayerIndex player) const {
    return GetState(player).position;
}

Role EnvironmentView::GetRole(PlayerIndex player) const {
    return GetState(player).role;
}

std::optional<PlayerIndex> EnvironmentView::GetTaggedBy(PlayerIndex player) const {
    return GetState(player).tagged_by;
}

PlayerIndex EnvironmentView::GetIt() const {
    return it_;
}

Environment::Environment(Field field, std::vector<PlayerState> players)
    : state_(field, std::move(players)) {
}

void Environment::ApplyMove(PlayerIndex player, Move move) {
    if (player >= state_.players_.size()) {
        throw UnknownPlayer(player, state_.players_.size());
    }
    auto& position = state_.players_[player].position;
    position = state_.field_.Clamp(ApplyDelta(position, move));
}

std::vector<TagEvent> Environment::ResolveTags() {
    auto& players = state_.players_;
    const PlayerIndex it = state_.it_;
    const Position it_position = players[it].position;

    std::vector<TagEvent> events;
    for (PlayerIndex player = 0; player < players.size(); ++player) {
        if (player == it || players[player].position != it_position) {
            continue;
        }
        players[it].role = Role::kRunner;
        players[it].tagged_by.reset();
        players[player].role = Role::kIt;
        players[player].tagged_by = it;
        state_.it_ = player;
        events.push_back({it, player});
        LOG(INFO) << "Player " << it << " tagged player " << player << " at " << it_position;
        break;
    }

    CHECK_EQ(std::count_if(players.begin(), players.end(),
                           [](const PlayerState& state) { return state.role == Role::kIt; }),
             1)
        << "Single It invariant is broken";
    return events;
}

Snapshot Environment::GetSnapshot() const {
    Snapshot snapshot;
    snapshot.reserve(state_.players_.size());
    for (PlayerIndex player = 0; player < state_.players_.size(); ++player) {
        const auto& state = state_.players_[player];
        snapshot.push_back({player, state.position, state.role});
    }
    return snapshot;
}
