#include "pipeline/scheduler.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <thread>

namespace muslforge::pipeline
{

    ScheduleReport runGraph(
        const DependencyGraph &graph,
        std::size_t jobs,
        const StepFunction &step,
        const muslforge::Context &ctx)
    {
        ScheduleReport report;
        const auto &nodes = graph.nodes();
        if (nodes.empty())
        {
            return report;
        }

        std::vector<std::size_t> inDegree(nodes.size(), 0);
        std::vector<bool> started(nodes.size(), false);
        for (std::size_t i = 0; i < nodes.size(); ++i)
        {
            inDegree[i] = nodes[i].depends.size();
        }

        auto later = [&](std::size_t a, std::size_t b)
        {
            return nodes[a].position > nodes[b].position;
        };
        std::priority_queue<std::size_t, std::vector<std::size_t>, decltype(later)> ready(later);
        for (std::size_t i = 0; i < nodes.size(); ++i)
        {
            if (inDegree[i] == 0)
            {
                ready.push(i);
            }
        }

        std::mutex mtx;
        std::condition_variable cvReady;
        std::size_t active = 0;
        bool stop = false;

        auto worker = [&]()
        {
            while (true)
            {
                std::size_t nodeIdx = 0;
                {
                    std::unique_lock<std::mutex> lock(mtx);
                    cvReady.wait(lock, [&]
                                 { return stop || !ready.empty() || active == 0; });

                    if (stop || ready.empty())
                    {
                        cvReady.notify_all();
                        return;
                    }

                    nodeIdx = ready.top();
                    ready.pop();
                    started[nodeIdx] = true;
                    ++active;
                }

                Outcome result;
                try
                {
                    result = step(nodeIdx);
                }
                catch (const std::exception &e)
                {
                    result = Outcome::failure(
                        FailureKind::Install,
                        "unexpected error while building " + nodes[nodeIdx].name + ": " + e.what());
                }

                {
                    std::lock_guard<std::mutex> lock(mtx);
                    --active;

                    if (!result.ok())
                    {
                        report.failed.push_back(nodes[nodeIdx].name);
                        if (report.outcome.ok())
                        {
                            report.outcome = result;
                        }
                        stop = true;
                    }
                    else
                    {
                        report.completed.push_back(nodes[nodeIdx].name);
                        for (std::size_t next : nodes[nodeIdx].dependents)
                        {
                            if (--inDegree[next] == 0)
                            {
                                ready.push(next);
                            }
                        }
                    }
                    cvReady.notify_all();
                }
            }
        };

        const std::size_t threadCount = std::max<std::size_t>(1, std::min(jobs, nodes.size()));
        ctx.debug("Scheduling ", nodes.size(), " dependencies on ", threadCount, " worker(s)");

        std::vector<std::thread> pool;
        pool.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i)
        {
            pool.emplace_back(worker);
        }
        for (auto &thread : pool)
        {
            thread.join();
        }

        for (std::size_t idx : graph.order())
        {
            if (!started[idx])
            {
                report.skipped.push_back(nodes[idx].name);
            }
        }

        if (report.outcome.ok() && report.completed.size() != nodes.size())
        {
            report.outcome = Outcome::failure(FailureKind::Configure, "dependency graph stalled with pending nodes");
        }
        return report;
    }

} // namespace muslforge::pipeline
