#include <tagsim/simulation.hpp>

#include <glog/logging.h>

Simulation::Simulation(Environment environment, StepCount step_count,
                       std::vector<std::unique_ptr<IAgentStrategy>> agents)
    : environment_(std::move(environment)),
      step_count_(step_count.Get()),
      agents_(std::move(agents)),
      tag_counts_(environment_.GetNumPlayers(), 0),
      times_it_(environment_.GetNumPlayers(), 0) {
    if (step_count_ == 0) {
        throw InvalidConfiguration("step count must be positive");
    }
    if (agents_.size() != environment_.GetNumPlayers()) {
        throw InvalidConfiguration("got " + std::to_string(agents_.size()) + " agents for " +
                                   std::to_string(environment_.GetNumPlayers()) + " players");
    }
    for (const auto& agent : agents_) {
        if (!agent) {
            throw InvalidConfiguration("agent is not set");
        }
    }
}

const StepRecord& Simulation::Step() {
    if (state_ == State::kFinished) {
        throw SimulationFinished();
    }
    state_ = State::kRunning;

    const size_t num_players = environment_.GetNumPlayers();
    StepRecord record{current_step_ + 1, {}, {}, {}};
    record.moves.reserve(num_players);
    {
        // Every agent decides on the same state, taken before any move of this step.
        const EnvironmentView view = environment_.View();
        for (PlayerIndex player = 0; player < num_players; ++player) {
            record.moves.push_back(agents_[player]->Decide(view, player));
        }
    }

    for (PlayerIndex player = 0; player < num_players; ++player) {
        environment_.ApplyMove(player, record.moves[player]);
    }

    record.tags = environment_.ResolveTags();
    for (const auto& event : record.tags) {
        ++tag_counts_[event.tagger];
    }
    ++times_it_[environment_.GetIt()];
    record.snapshot = environment_.GetSnapshot();

    ++current_step_;
    VLOG(1) << "Step " << current_step_ << "/" << step_count_ << ": It is player "
            << environment_.GetIt() << " at " << environment_.GetPosition(environment_.GetIt())
            << ", " << record.tags.size() << " tags";
    if (current_step_ == step_count_) {
        state_ = State::kFinished;
    }

    last_record_ = std::move(record);
    for (auto* observer : observers_) {
        observer->OnStep(*last_record_);
    }
    return *last_record_;
}

void Simulation::Run() {
    LOG(INFO) << "Running " << step_count_ - current_step_ << " steps with "
              << environment_.GetNumPlayers() << " players on a "
              << environment_.GetField().GetWidth() << "x" << environment_.GetField().GetHeight()
              << " field";
    while (state_ != State::kFinished) {
        Step();
    }
    LOG(INFO) << "Finished after " << current_step_ << " steps, It is player "
              << environment_.GetIt();
}

const StepRecord& Simulation::GetLastRecord() const {
    if (!last_record_) {
        throw SimulationNotStarted();
    }
    return *last_record_;
}

size_t Simulation::GetTagCount(PlayerIndex player) const {
    if (player >= tag_counts_.size()) {
        throw UnknownPlayer(player, tag_counts_.size());
    }
    return tag_counts_[player];
}

size_t Simulation::GetTimesIt(PlayerIndex player) const {
    if (player >= times_it_.size()) {
        throw UnknownPlayer(player, times_it_.size());
    }
    return times_it_[player];
}

using Builder = Simulation::Builder;

Builder& Builder::SetPlayerCount(size_t val) {
    player_count_ = PlayerCount(val);
    return *this;
}

Builder& Builder::SetStepCount(size_t val) {
    step_count_ = StepCount(val);
    return *this;
}

Builder& Builder::SetFieldSize(Coord width, Coord height) {
    field_ = Field{FieldWidth{width}, FieldHeight{height}};
    return *this;
}

Builder& Builder::SetPlacement(std::shared_ptr<const IPlacement> placement) {
    placement_ = std::move(placement);
    return *this;
}

Builder& Builder::SetAgentFactory(AgentFactory factory) {
    agent_factory_ = std::move(factory);
    return *this;
}

Simulation Builder::Build() && {
    const PlayerCount num_players = player_count_.Value();
    const StepCount num_steps = step_count_.Value();

    const Field field = field_ ? *field_ : DefaultFieldFor(num_players);
    if (!placement_) {
        placement_ = std::make_shared<GridPlacement>();
    }
    if (!agent_factory_) {
        throw InvalidConfiguration("agent factory is not set");
    }

    Environment environment{field, MakeInitialPlayers(placement_->Place(field, num_players))};
    std::vector<std::unique_ptr<IAgentStrategy>> agents;
    agents.reserve(num_players.Get());
    for (PlayerIndex player = 0; player < num_players.Get(); ++player) {
        agents.push_back(agent_factory_(player));
    }
    return Simulation{std::move(environment), num_steps, std::move(agents)};
}
