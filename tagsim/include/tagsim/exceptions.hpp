#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>

template <class>
class BuilderOption;

class BuilderNotInitialized : public std::exception {
    template <class>
    friend class BuilderOption;

private:
    inline BuilderNotInitialized(std::string_view param_name) {
        constexpr std::string_view is_not_set = " is not set";
        err_msg_.append(param_name);
        err_msg_.append(is_not_set);
    }

public:
    inline const char* what() const noexcept override {
        return err_msg_.c_str();
    }

private:
    std::string err_msg_ = "BuilderNotInitialized: ";
};

class UnknownPlayer : public std::exception {
public:
    inline UnknownPlayer(std::size_t player, std::size_t num_players)
        : player_(player),
          err_msg_("UnknownPlayer: index " + std::to_string(player) + " is out of range [0, " +
                   std::to_string(num_players) + ")") {
    }

    inline std::size_t GetPlayer() const noexcept {
        return player_;
    }

    inline const char* what() const noexcept override {
        return err_msg_.c_str();
    }

private:
    std::size_t player_;
    std::string err_msg_;
};

class InvalidConfiguration : public std::exception {
public:
    inline explicit InvalidConfiguration(std::string_view reason) {
        err_msg_.append(reason);
    }

    inline const char* what() const noexcept override {
        return err_msg_.c_str();
    }

private:
    std::string err_msg_ = "InvalidConfiguration: ";
};

class SimulationFinished final : public std::exception {
public:
    const char* what() const noexcept override {
        return "Simulation has already finished, illegal action";
    }
};

class SimulationNotStarted final : public std::exception {
public:
    const char* what() const noexcept override {
        return "Simulation has not made a step yet, illegal action";
    }
};
