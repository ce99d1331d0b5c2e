#include <tagsim/simulation.hpp>

#include <gtest/gtest.h>

namespace {
class ScriptedAgent final : public IAgentStrategy {
public:
    explicit ScriptedAgent(Move move) : move_(move) {
    }

    Move Decide(const EnvironmentView&, PlayerIndex) const override {
        return move_;
    }

private:
    Move move_;
};

class RecordingObserver final : public IStepObserver {
public:
    void OnStep(const StepRecord& record) override {
        records.push_back(record);
    }

    std::vector<StepRecord> records;
};

Simulation MakeSimulation(Coord width, Coord height, std::vector<Position> positions,
                          size_t step_count) {
    std::vector<std::unique_ptr<IAgentStrategy>> agents;
    for (PlayerIndex i = 0; i < positions.size(); ++i) {
        agents.push_back(MakeRoleBasedAgent(i));
    }
    Environment environment{Field{FieldWidth{width}, FieldHeight{height}},
                            MakeInitialPlayers(positions)};
    return Simulation{std::move(environment), StepCount{step_count}, std::move(agents)};
}

void CheckInvariants(const Field& field, const StepRecord& record) {
    size_t num_its = 0;
    for (const auto& player : record.snapshot) {
        ASSERT_TRUE(field.Contains(player.position))
            << "player " << player.player << " at " << player.position;
        num_its += player.role == Role::kIt;
    }
    ASSERT_EQ(num_its, 1) << "step " << record.step;
}

PlayerIndex FindIt(const Snapshot& snapshot) {
    for (const auto& player : snapshot) {
        if (player.role == Role::kIt) {
            return player.player;
        }
    }
    return snapshot.size();
}
}  // namespace

TEST(Simulation, StateMachine) {
    auto simulation = MakeSimulation(10, 10, {{0, 0}, {5, 5}}, 3);
    ASSERT_EQ(simulation.GetState(), Simulation::State::kNotStarted);
    ASSERT_EQ(simulation.GetCurrentStep(), 0);
    ASSERT_THROW(simulation.GetLastRecord(), SimulationNotStarted);

    ASSERT_EQ(simulation.Step().step, 1);
    ASSERT_EQ(simulation.GetState(), Simulation::State::kRunning);
    ASSERT_EQ(simulation.GetLastRecord().step, 1);

    simulation.Step();
    ASSERT_EQ(simulation.GetState(), Simulation::State::kRunning);
    simulation.Step();
    ASSERT_EQ(simulation.GetState(), Simulation::State::kFinished);
    ASSERT_EQ(simulation.GetCurrentStep(), 3);
    ASSERT_THROW(simulation.Step(), SimulationFinished);
    ASSERT_EQ(simulation.GetLastRecord().step, 3);
}

TEST(Simulation, RejectsInvalidConfiguration) {
    ASSERT_THROW(MakeSimulation(10, 10, {{0, 0}, {5, 5}}, 0), InvalidConfiguration);

    std::vector<std::unique_ptr<IAgentStrategy>> agents;
    agents.push_back(MakeRoleBasedAgent(0));
    Environment environment{Field{FieldWidth{4}, FieldHeight{4}},
                            MakeInitialPlayers({{0, 0}, {1, 1}})};
    ASSERT_THROW((Simulation{std::move(environment), StepCount{5}, std::move(agents)}),
                 InvalidConfiguration);
}

TEST(Simulation, FirstStepScenario) {
    auto simulation = MakeSimulation(10, 10, {{0, 0}, {1, 0}}, 10);
    const auto& record = simulation.Step();

    ASSERT_EQ(record.moves, (std::vector<Move>{Move::kRight, Move::kRight}));
    ASSERT_TRUE(record.tags.empty());
    ASSERT_EQ(record.snapshot[0].position, (Position{1, 0}));
    ASSERT_EQ(record.snapshot[1].position, (Position{2, 0}));
    ASSERT_EQ(record.snapshot[0].role, Role::kIt);
    ASSERT_EQ(record.snapshot[1].role, Role::kRunner);
}

TEST(Simulation, DecisionsUseStateBeforeStep) {
    // Had the runner seen the It already moved to (4,6), it would have picked Right.
    auto simulation = MakeSimulation(10, 10, {{4, 5}, {5, 6}}, 1);
    const auto& record = simulation.Step();
    ASSERT_EQ(record.moves, (std::vector<Move>{Move::kDown, Move::kDown}));
    ASSERT_EQ(record.snapshot[0].position, (Position{4, 6}));
    ASSERT_EQ(record.snapshot[1].position, (Position{5, 7}));
}

TEST(Simulation, CorneredRunnerGetsTagged) {
    auto simulation = MakeSimulation(5, 1, {{3, 0}, {4, 0}}, 10);
    const auto& record = simulation.Step();
    ASSERT_EQ(record.moves[1], Move::kStay);
    ASSERT_EQ(record.moves[0], Move::kRight);
    ASSERT_EQ(record.tags, (std::vector<TagEvent>{{0, 1}}));
    ASSERT_EQ(simulation.GetEnvironment().GetIt(), 1);
    ASSERT_EQ(simulation.GetEnvironment().GetTaggedBy(1), 0);
}

TEST(Simulation, ChaseInCorridorEndsWithTag) {
    const Coord kWidth = 6;
    auto simulation = MakeSimulation(kWidth, 1, {{0, 0}, {3, 0}}, 50);
    std::optional<size_t> tag_step;
    while (simulation.GetState() != Simulation::State::kFinished && !tag_step) {
        const auto& record = simulation.Step();
        if (!record.tags.empty()) {
            tag_step = record.step;
            ASSERT_EQ(record.tags, (std::vector<TagEvent>{{0, 1}}));
            ASSERT_EQ(record.snapshot[0].position, record.snapshot[1].position);
        }
    }
    ASSERT_TRUE(tag_step.has_value());
    ASSERT_LE(*tag_step, static_cast<size_t>(kWidth));
    ASSERT_EQ(simulation.GetTagCount(0), 1);
    ASSERT_EQ(simulation.GetTagCount(1), 0);
    ASSERT_EQ(simulation.GetTimesIt(1), 1);
    ASSERT_EQ(simulation.GetTimesIt(0), *tag_step - 1);
}

TEST(Simulation, NoImmediateTagBack) {
    auto simulation = MakeSimulation(5, 1, {{3, 0}, {4, 0}}, 2);
    simulation.Step();
    const auto& record = simulation.Step();
    ASSERT_TRUE(record.tags.empty());
    ASSERT_EQ(record.moves[1], Move::kStay);
    ASSERT_EQ(record.moves[0], Move::kLeft);
    ASSERT_EQ(simulation.GetEnvironment().GetIt(), 1);
}

TEST(Simulation, LowerIndexRunnerIsTagged) {
    std::vector<std::unique_ptr<IAgentStrategy>> agents;
    agents.push_back(std::make_unique<ScriptedAgent>(Move::kStay));
    agents.push_back(std::make_unique<ScriptedAgent>(Move::kLeft));
    agents.push_back(std::make_unique<ScriptedAgent>(Move::kRight));
    Environment environment{Field{FieldWidth{5}, FieldHeight{5}},
                            MakeInitialPlayers({{2, 2}, {3, 2}, {1, 2}})};
    Simulation simulation{std::move(environment), StepCount{1}, std::move(agents)};

    const auto& record = simulation.Step();
    ASSERT_EQ(record.tags, (std::vector<TagEvent>{{0, 1}}));
    ASSERT_EQ(record.snapshot[0].role, Role::kRunner);
    ASSERT_EQ(record.snapshot[1].role, Role::kIt);
    ASSERT_EQ(record.snapshot[2].role, Role::kRunner);
}

TEST(Simulation, ScriptedMovesAreClamped) {
    std::vector<std::unique_ptr<IAgentStrategy>> agents;
    agents.push_back(std::make_unique<ScriptedAgent>(Move::kLeft));
    agents.push_back(std::make_unique<ScriptedAgent>(Move::kDown));
    Environment environment{Field{FieldWidth{3}, FieldHeight{3}},
                            MakeInitialPlayers({{0, 0}, {2, 1}})};
    Simulation simulation{std::move(environment), StepCount{4}, std::move(agents)};
    simulation.Run();

    const auto& environment_after = simulation.GetEnvironment();
    ASSERT_EQ(environment_after.GetPosition(0), (Position{0, 0}));
    ASSERT_EQ(environment_after.GetPosition(1), (Position{2, 2}));
}

TEST(Simulation, ObserverSeesEveryStep) {
    auto simulation = MakeSimulation(8, 8, {{0, 0}, {7, 7}, {3, 4}}, 12);
    RecordingObserver observer;
    simulation.AddObserver(&observer);
    simulation.Run();

    ASSERT_EQ(observer.records.size(), 12);
    for (size_t i = 0; i < observer.records.size(); ++i) {
        ASSERT_EQ(observer.records[i].step, i + 1);
        ASSERT_EQ(observer.records[i].moves.size(), 3);
        ASSERT_EQ(observer.records[i].snapshot.size(), 3);
    }
    ASSERT_EQ(observer.records.back().snapshot, simulation.GetEnvironment().GetSnapshot());
}

TEST(Simulation, InvariantsHoldOnRandomGames) {
    for (size_t num_players : {1, 2, 5, 13}) {
        for (uint64_t seed : {0, 1, 7}) {
            Simulation::Builder builder;
            builder.SetPlayerCount(num_players)
                .SetStepCount(200)
                .SetFieldSize(7, 5)
                .SetPlacement(std::make_shared<RandomPlacement>(seed));
            Simulation simulation = std::move(builder).Build();
            const Field field = simulation.GetEnvironment().GetField();

            RecordingObserver observer;
            simulation.AddObserver(&observer);
            simulation.Run();

            PlayerIndex it = 0;
            for (const auto& record : observer.records) {
                CheckInvariants(field, record);

                // Runners on the It's cell after the moves: the lowest one takes over.
                std::optional<PlayerIndex> caught;
                for (const auto& player : record.snapshot) {
                    if (player.player != it &&
                        player.position == record.snapshot[it].position) {
                        caught = player.player;
                        break;
                    }
                }
                if (caught) {
                    ASSERT_EQ(record.tags, (std::vector<TagEvent>{{it, *caught}}));
                    it = *caught;
                } else {
                    ASSERT_TRUE(record.tags.empty());
                }
                ASSERT_EQ(FindIt(record.snapshot), it);
            }
        }
    }
}

TEST(Simulation, Deterministic) {
    auto run = [] {
        Simulation::Builder builder;
        builder.SetPlayerCount(6).SetStepCount(100).SetPlacement(
            std::make_shared<RandomPlacement>(1234));
        Simulation simulation = std::move(builder).Build();
        RecordingObserver observer;
        simulation.AddObserver(&observer);
        simulation.Run();
        return observer.records;
    };

    auto first = run();
    auto second = run();
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        ASSERT_EQ(first[i].moves, second[i].moves);
        ASSERT_EQ(first[i].tags, second[i].tags);
        ASSERT_EQ(first[i].snapshot, second[i].snapshot);
    }
}

TEST(Builder, RequiresCounts) {
    {
        Simulation::Builder builder;
        builder.SetStepCount(10);
        ASSERT_THROW(std::move(builder).Build(), BuilderNotInitialized);
    }
    {
        Simulation::Builder builder;
        builder.SetPlayerCount(10);
        ASSERT_THROW(std::move(builder).Build(), BuilderNotInitialized);
    }
}

TEST(Builder, RejectsInvalidCounts) {
    {
        Simulation::Builder builder;
        builder.SetPlayerCount(0).SetStepCount(10);
        ASSERT_THROW(std::move(builder).Build(), InvalidConfiguration);
    }
    {
        Simulation::Builder builder;
        builder.SetPlayerCount(3).SetStepCount(0);
        ASSERT_THROW(std::move(builder).Build(), InvalidConfiguration);
    }
    {
        Simulation::Builder builder;
        builder.SetPlayerCount(10).SetStepCount(10).SetFieldSize(3, 3);
        ASSERT_THROW(std::move(builder).Build(), InvalidConfiguration);
    }
    {
        Simulation::Builder builder;
        ASSERT_THROW(builder.SetFieldSize(0, 3), InvalidConfiguration);
    }
}

TEST(Builder, RejectsPlayerCountWithoutDefaultField) {
    Simulation::Builder builder;
    builder.SetPlayerCount(size_t{1} << 60).SetStepCount(1);
    ASSERT_THROW(std::move(builder).Build(), InvalidConfiguration);
}

TEST(Builder, DefaultsToGridPlacement) {
    Simulation::Builder builder;
    builder.SetPlayerCount(5).SetStepCount(100);
    Simulation simulation = std::move(builder).Build();

    const auto& environment = simulation.GetEnvironment();
    ASSERT_EQ(environment.GetField().GetWidth(), 10);
    ASSERT_EQ(environment.GetNumPlayers(), 5);
    ASSERT_EQ(environment.GetIt(), 0);
    ASSERT_EQ(environment.GetPosition(1), (Position{0, 2}));
    ASSERT_EQ(simulation.GetStepCount(), 100);
}
