#pragma once

#include <optional>
#include <vector>

#include "geometry.hpp"

struct PlayerState {
    Position position;
    Role role{Role::kRunner};
    // Who tagged the current It, empty for runners and for the first It.
    std::optional<PlayerIndex> tagged_by;
};

struct TagEvent {
    PlayerIndex tagger;
    PlayerIndex tagged;
};

inline bool operator==(const TagEvent& lhs, const TagEvent& rhs) {
    return lhs.tagger == rhs.tagger && lhs.tagged == rhs.tagged;
}

struct PlayerSnapshot {
    PlayerIndex player;
    Position position;
    Role role;
};

inline bool operator==(const PlayerSnapshot& lhs, const PlayerSnapshot& rhs) {
    return lhs.player == rhs.player && lhs.position == rhs.position && lhs.role == rhs.role;
}

using Snapshot = std::vector<PlayerSnapshot>;

/**
 * Immutable copy of the field and every player's state.
 *
 * This is everything an agent is allowed to see: it has no mutating operations, and agents
 * get a copy taken before the step, so moves applied during the step are invisible to them.
 */
class EnvironmentView {
    friend class Environment;

public:
    EnvironmentView(Field field, std::vector<PlayerState> players);

    const Position& GetPosition(PlayerIndex player) const;
    Role GetRole(PlayerIndex player) const;
    std::optional<PlayerIndex> GetTaggedBy(PlayerIndex player) const;
    PlayerIndex GetIt() const;

    inline const Field& GetField() const {
        return field_;
    }

    inline size_t GetNumPlayers() const {
        return players_.size();
    }

private:
    const PlayerState& GetState(PlayerIndex player) const;

    Field field_;
    std::vector<PlayerState> players_;
    PlayerIndex it_;
};

/**
 * Authoritative state of the game, owned by the simulation.
 *
 * Positions change only through ApplyMove and roles only through ResolveTags. Construction
 * rejects states that break the single-it or the bounds invariant.
 */
class Environment {
public:
    Environment(Field field, std::vector<PlayerState> players);

    inline const Position& GetPosition(PlayerIndex player) const {
        return state_.GetPosition(player);
    }

    inline Role GetRole(PlayerIndex player) const {
        return state_.GetRole(player);
    }

    inline std::optional<PlayerIndex> GetTaggedBy(PlayerIndex player) const {
        return state_.GetTaggedBy(player);
    }

    inline PlayerIndex GetIt() const {
        return state_.GetIt();
    }

    inline const Field& GetField() const {
        return state_.GetField();
    }

    inline size_t GetNumPlayers() const {
        return state_.GetNumPlayers();
    }

    // Moves off the field stop at its edge.
    void ApplyMove(PlayerIndex player, Move move);

    // At most one event: the lowest-indexed runner on the It's cell takes over.
    std::vector<TagEvent> ResolveTags();

    inline EnvironmentView View() const {
        return state_;
    }

    Snapshot GetSnapshot() const;

private:
    EnvironmentView state_;
};
