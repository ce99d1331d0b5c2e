#pragma once

#include <tagsim/simulation.hpp>

#include <iosfwd>
#include <string>

/**
 * Draws a step as ascii art: '*' for the It, '.' for runners, and a "*-You're It!" banner
 * starting at the cell where a tag happened. When players share a cell the more important
 * glyph wins.
 */
class AsciiViewer final : public IStepObserver {
public:
    AsciiViewer(std::ostream* stream, Field field) : stream_(stream), field_(field) {
    }

    void OnStep(const StepRecord& record) override;

    static std::string RenderFrame(const Field& field, const StepRecord& record);

private:
    std::ostream* stream_;
    Field field_;
};
