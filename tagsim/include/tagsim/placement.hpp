#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include "environment.hpp"

/**
 * Start placement policy. Implementations return exactly `num_players` pairwise distinct
 * positions inside the field, and throw InvalidConfiguration when the field is too small.
 */
class IPlacement {
public:
    virtual std::vector<Position> Place(const Field& field, PlayerCount num_players) const = 0;
    virtual ~IPlacement() = default;
};

// Uniformly random distinct cells, reproducible for a given 64-bit seed.
class RandomPlacement final : public IPlacement {
public:
    explicit RandomPlacement(uint64_t seed) noexcept : seed_(seed) {
    }

    std::vector<Position> Place(const Field& field, PlayerCount num_players) const override;

private:
    uint64_t seed_;
};

// Cells spread evenly over the field in row-major order.
class GridPlacement final : public IPlacement {
public:
    std::vector<Position> Place(const Field& field, PlayerCount num_players) const override;
};

// Square field of side max(10, 2 * ceil(sqrt(num_players))). Throws InvalidConfiguration
// when that side does not fit into a coordinate.
Field DefaultFieldFor(PlayerCount num_players);

// Player 0 starts as It, everyone else as a runner.
std::vector<PlayerState> MakeInitialPlayers(const std::vector<Position>& positions);
