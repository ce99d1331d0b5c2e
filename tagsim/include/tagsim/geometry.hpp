#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>

#include "types.hpp"

struct Position {
    Coord x{0};
    Coord y{0};
};

inline bool operator==(const Position& lhs, const Position& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y;
}

inline bool operator!=(const Position& lhs, const Position& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& stream, const Position& pos);

// y grows downwards, so Up decreases it.
enum class Move { kUp, kDown, kLeft, kRight, kStay };

// Canonical order, also used to break ties between equally good moves.
inline constexpr std::array<Move, 5> kAllMoves = {Move::kUp, Move::kDown, Move::kLeft,
                                                  Move::kRight, Move::kStay};

Position ApplyDelta(Position from, Move move);

const char* ToString(Move move);

std::ostream& operator<<(std::ostream& stream, Move move);

enum class Role { kIt, kRunner };

const char* ToString(Role role);

std::ostream& operator<<(std::ostream& stream, Role role);

// Squared euclidean distance, exact on the integer grid.
inline int64_t SquaredDistance(Position lhs, Position rhs) {
    int64_t dx = static_cast<int64_t>(lhs.x) - rhs.x;
    int64_t dy = static_cast<int64_t>(lhs.y) - rhs.y;
    return dx * dx + dy * dy;
}

class Field {
public:
    Field(FieldWidth width, FieldHeight height);

    inline Coord GetWidth() const {
        return width_;
    }

    inline Coord GetHeight() const {
        return height_;
    }

    inline int64_t GetNumCells() const {
        return static_cast<int64_t>(width_) * height_;
    }

    bool Contains(Position pos) const;

    Position Clamp(Position pos) const;

private:
    Coord width_;
    Coord height_;
};
