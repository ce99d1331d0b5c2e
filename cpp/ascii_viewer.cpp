#include <tag_game/ascii_viewer.hpp>

#include <algorithm>
#include <ostream>
#include <string_view>
#include <vector>

namespace {
// Ordered by importance.
enum class DrawCell { kNone = 0, kRunner = 1, kIt = 2, kYoureIt = 3 };

constexpr std::string_view kYoureItBanner = "*-You're It!";

std::string_view Glyph(DrawCell cell) {
    switch (cell) {
        case DrawCell::kNone:
            return " ";
        case DrawCell::kRunner:
            return ".";
        case DrawCell::kIt:
            return "*";
        case DrawCell::kYoureIt:
            return kYoureItBanner;
    }
    return " ";
}
}  // namespace

std::string AsciiViewer::RenderFrame(const Field& field, const StepRecord& record) {
    const Coord width = field.GetWidth();
    std::vector<std::vector<DrawCell>> grid(field.GetHeight(),
                                            std::vector<DrawCell>(width, DrawCell::kNone));
    auto set = [&](Position pos, DrawCell cell) {
        auto& existing = grid[pos.y][pos.x];
        if (cell > existing) {
            existing = cell;
        }
    };

    for (const auto& player : record.snapshot) {
        set(player.position, player.role == Role::kIt ? DrawCell::kIt : DrawCell::kRunner);
    }
    for (const auto& event : record.tags) {
        set(record.snapshot.at(event.tagged).position, DrawCell::kYoureIt);
    }

    std::string frame(std::max<Coord>(width, 1), '=');
    frame += '\n';
    for (const auto& row : grid) {
        Coord x = 0;
        while (x < width) {
            std::string_view chars = Glyph(row[x]);
            chars = chars.substr(0, width - x);
            frame.append(chars);
            x += static_cast<Coord>(chars.size());
        }
        frame += '\n';
    }
    return frame;
}

void AsciiViewer::OnStep(const StepRecord& record) {
    *stream_ << RenderFrame(field_, record);
}
