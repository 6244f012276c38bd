#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "model/specs.hpp"

namespace muslforge::pipeline {

// Dependencies of one run as a DAG over their `depends` edges.
class DependencyGraph {
public:
    struct Node {
        std::string name;
        int position = 0;
        std::vector<std::size_t> depends;
        std::vector<std::size_t> dependents;
    };

    // Fails on duplicate names, unknown requirements and cycles.
    static std::optional<DependencyGraph> build(const model::Pipeline &pipeline, std::string &error);

    const std::vector<Node> &nodes() const { return nodes_; }
    std::size_t size() const { return nodes_.size(); }
    std::optional<std::size_t> find(const std::string &name) const;

    // Topological order, ties broken by pipeline position.
    const std::vector<std::size_t> &order() const { return order_; }

private:
    std::vector<Node> nodes_;
    std::vector<std::size_t> order_;
};

} // namespace muslforge::pipeline
