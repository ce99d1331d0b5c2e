#include <tagsim/geometry.hpp>
#include <tagsim/exceptions.hpp>

#include <algorithm>
#include <ostream>
#include <glog/logging.h>

std::ostream& operator<<(std::ostream& stream, const Position& pos) {
    stream << "(" << pos.x << "," << pos.y << ")";
    return stream;
}

Position ApplyDelta(Position from, Move move) {
    switch (move) {
        case Move::kUp:
            return {from.x, from.y - 1};
        case Move::kDown:
            return {from.x, from.y + 1};
        case Move::kLeft:
            return {from.x - 1, from.y};
        case Move::kRight:
            return {from.x + 1, from.y};
        case Move::kStay:
            return from;
    }
    LOG(FATAL) << "Unknown move " << static_cast<int>(move);
    return from;
}

const char* ToString(Move move) {
    switch (move) {
        case Move::kUp:
            return "Up";
        case Move::kDown:
            return "Down";
        case Move::kLeft:
            return "Left";
        case Move::kRight:
            return "Right";
        case Move::kStay:
            return "Stay";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& stream, Move move) {
    return stream << ToString(move);
}

const char* ToString(Role role) {
    return role == Role::kIt ? "It" : "Runner";
}

std::ostream& operator<<(std::ostream& stream, Role role) {
    return stream << ToString(role);
}

Field::Field(FieldWidth width, FieldHeight height) : width_(width), height_(height) {
    if (width_ <= 0 || height_ <= 0) {
        throw InvalidConfiguration("field must have positive width and height, got " +
                                   std::to_string(width_) + "x" + std::to_string(height_));
    }
}

bool Field::Contains(Position pos) const {
    return pos.x >= 0 && pos.x < width_ && pos.y >= 0 && pos.y < height_;
}

Position Field::Clamp(Position pos) const {
    return {std::clamp(pos.x, 0, width_ - 1), std::clamp(pos.y, 0, height_ - 1)};
}
