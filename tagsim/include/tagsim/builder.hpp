#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "exceptions.hpp"

/**
 * Optional builder parameter that knows its name and, optionally, what a valid value looks
 * like. Reading an unset option throws BuilderNotInitialized, reading a value that fails the
 * check throws InvalidConfiguration.
 */
template <class ValueType>
class BuilderOption : private std::optional<ValueType> {
    using BaseT = std::optional<ValueType>;
    using CheckT = bool (*)(const ValueType&);

public:
    BuilderOption(const char* param_name) noexcept : param_name_(param_name) {
    }

    BuilderOption(const char* param_name, CheckT check, const char* requirement) noexcept
        : param_name_(param_name), check_(check), requirement_(requirement) {
    }

    using BaseT::operator=;
    using BaseT::operator bool;

    const ValueType& Value() const {
        if (!*this) {
            throw BuilderNotInitialized(param_name_);
        }
        if (check_ && !check_(**this)) {
            throw InvalidConfiguration(std::string(param_name_) + " " +
                                       std::string(requirement_));
        }
        return **this;
    }

private:
    std::string_view param_name_;
    CheckT check_{nullptr};
    std::string_view requirement_;
};
