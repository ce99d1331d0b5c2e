#pragma once

#include <functional>
#include <memory>

#include "environment.hpp"

class IAgentStrategy {
public:
    virtual Move Decide(const EnvironmentView& view, PlayerIndex self) const = 0;
    virtual ~IAgentStrategy() = default;
};

// Chases the nearest runner.
class ItStrategy final : public IAgentStrategy {
public:
    Move Decide(const EnvironmentView& view, PlayerIndex self) const override;
};

// Runs away from the It, stays put when no move increases the distance.
class RunnerStrategy final : public IAgentStrategy {
public:
    Move Decide(const EnvironmentView& view, PlayerIndex self) const override;
};

/**
 * Default agent of every player: delegates to ItStrategy or RunnerStrategy depending on the
 * role the player holds in the view, since the role changes during the game.
 */
class RoleBasedAgent final : public IAgentStrategy {
public:
    Move Decide(const EnvironmentView& view, PlayerIndex self) const override;

private:
    ItStrategy it_strategy_;
    RunnerStrategy runner_strategy_;
};

using AgentFactory = std::function<std::unique_ptr<IAgentStrategy>(PlayerIndex)>;

std::unique_ptr<IAgentStrategy> MakeRoleBasedAgent(PlayerIndex player);
