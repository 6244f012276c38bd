#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/failure.hpp"
#include "pipeline/graph.hpp"

namespace muslforge::pipeline {

using StepFunction = std::function<Outcome(std::size_t node)>;

struct ScheduleReport {
    Outcome outcome;
    std::vector<std::string> completed;
    std::vector<std::string> failed;
    std::vector<std::string> skipped;
};

// Runs every node after all of its requirements succeeded, using up to
// `jobs` workers. After the first failure no further node is started.
ScheduleReport runGraph(
    const DependencyGraph &graph,
    std::size_t jobs,
    const StepFunction &step,
    const muslforge::Context &ctx
);

} // namespace muslforge::pipeline
