#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "agent_strategy.hpp"
#include "builder.hpp"
#include "environment.hpp"
#include "exceptions.hpp"
#include "placement.hpp"

struct StepRecord {
    // Number of completed steps, starting from 1.
    size_t step;
    // Indexed by player.
    std::vector<Move> moves;
    std::vector<TagEvent> tags;
    Snapshot snapshot;
};

class IStepObserver {
public:
    virtual void OnStep(const StepRecord& record) = 0;
    virtual ~IStepObserver() = default;
};

class Simulation {
public:
    enum class State { kNotStarted, kRunning, kFinished };

    class Builder;

    Simulation(Environment environment, StepCount step_count,
               std::vector<std::unique_ptr<IAgentStrategy>> agents);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) = default;
    Simulation& operator=(Simulation&&) = default;

    const StepRecord& Step();
    void Run();

    // Observers are not owned and must outlive the simulation.
    inline void AddObserver(IStepObserver* observer) {
        observers_.push_back(observer);
    }

    inline State GetState() const {
        return state_;
    }

    inline size_t GetCurrentStep() const {
        return current_step_;
    }

    inline size_t GetStepCount() const {
        return step_count_;
    }

    inline const Environment& GetEnvironment() const {
        return environment_;
    }

    const StepRecord& GetLastRecord() const;

    size_t GetTagCount(PlayerIndex player) const;
    size_t GetTimesIt(PlayerIndex player) const;

private:
    Environment environment_;
    size_t step_count_;
    std::vector<std::unique_ptr<IAgentStrategy>> agents_;
    std::vector<IStepObserver*> observers_;

    State state_{State::kNotStarted};
    size_t current_step_{0};
    std::optional<StepRecord> last_record_;
    std::vector<size_t> tag_counts_;
    std::vector<size_t> times_it_;
};

class Simulation::Builder {
public:
    Builder() = default;
    Builder& SetPlayerCount(size_t val);
    Builder& SetStepCount(size_t val);
    Builder& SetFieldSize(Coord width, Coord height);
    Builder& SetPlacement(std::shared_ptr<const IPlacement> placement);
    Builder& SetAgentFactory(AgentFactory factory);

    Simulation Build() &&;

private:
    template <class T>
    static bool IsPositive(const T& value) {
        return value.Get() > 0;
    }

    BuilderOption<PlayerCount> player_count_{"player_count", IsPositive<PlayerCount>,
                                             "must be positive"};
    BuilderOption<StepCount> step_count_{"step_count", IsPositive<StepCount>, "must be positive"};
    std::optional<Field> field_;
    std::shared_ptr<const IPlacement> placement_;
    AgentFactory agent_factory_{MakeRoleBasedAgent};
};
