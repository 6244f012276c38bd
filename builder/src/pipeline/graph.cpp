#include "pipeline/graph.hpp"

#include <queue>
#include <unordered_map>

namespace muslforge::pipeline
{

    std::optional<DependencyGraph> DependencyGraph::build(const model::Pipeline &pipeline, std::string &error)
    {
        DependencyGraph graph;
        std::unordered_map<std::string, std::size_t> index;

        for (const auto &spec : pipeline)
        {
            if (!index.emplace(spec.name, graph.nodes_.size()).second)
            {
                error = "duplicate dependency: " + spec.name;
                return std::nullopt;
            }
            Node node;
            node.name = spec.name;
            node.position = spec.position;
            graph.nodes_.push_back(node);
        }

        for (std::size_t i = 0; i < pipeline.size(); ++i)
        {
            for (const auto &dep : pipeline[i].depends)
            {
                auto it = index.find(dep);
                if (it == index.end())
                {
                    error = pipeline[i].name + " requires " + dep + ", which is not part of this run";
                    return std::nullopt;
                }
                if (it->second == i)
                {
                    error = pipeline[i].name + " requires itself";
                    return std::nullopt;
                }
                graph.nodes_[i].depends.push_back(it->second);
                graph.nodes_[it->second].dependents.push_back(i);
            }
        }

        // Kahn's algorithm; the min-heap keeps pipeline order among ready nodes.
        std::vector<std::size_t> inDegree(graph.nodes_.size(), 0);
        for (std::size_t i = 0; i < graph.nodes_.size(); ++i)
        {
            inDegree[i] = graph.nodes_[i].depends.size();
        }

        auto later = [&](std::size_t a, std::size_t b)
        {
            return graph.nodes_[a].position > graph.nodes_[b].position;
        };
        std::priority_queue<std::size_t, std::vector<std::size_t>, decltype(later)> ready(later);
        for (std::size_t i = 0; i < inDegree.size(); ++i)
        {
            if (inDegree[i] == 0)
            {
                ready.push(i);
            }
        }

        while (!ready.empty())
        {
            const std::size_t current = ready.top();
            ready.pop();
            graph.order_.push_back(current);
            for (std::size_t next : graph.nodes_[current].dependents)
            {
                if (--inDegree[next] == 0)
                {
                    ready.push(next);
                }
            }
        }

        if (graph.order_.size() != graph.nodes_.size())
        {
            for (std::size_t i = 0; i < inDegree.size(); ++i)
            {
                if (inDegree[i] != 0)
                {
                    error = "dependency cycle through " + graph.nodes_[i].name;
                    break;
                }
            }
            return std::nullopt;
        }

        return graph;
    }

    std::optional<std::size_t> DependencyGraph::find(const std::string &name) const
    {
        for (std::size_t i = 0; i < nodes_.size(); ++i)
        {
            if (nodes_[i].name == name)
            {
                return i;
            }
        }
        return std::nullopt;
    }

} // namespace muslforge::pipeline
