#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "model/loader.hpp"
#include "pipeline/graph.hpp"

using muslforge::model::DependencySpec;
using muslforge::model::Pipeline;
using muslforge::pipeline::DependencyGraph;

namespace
{

    DependencySpec makeSpec(const std::string &name, std::vector<std::string> depends = {})
    {
        DependencySpec spec;
        spec.name = name;
        spec.version = "1.0";
        spec.url = "https://example.invalid/" + name + ".tar.gz";
        spec.depends = std::move(depends);
        return spec;
    }

    Pipeline numbered(Pipeline pipeline)
    {
        for (std::size_t i = 0; i < pipeline.size(); ++i)
        {
            pipeline[i].position = static_cast<int>(i);
        }
        return pipeline;
    }

    std::vector<std::string> orderNames(const DependencyGraph &graph)
    {
        std::vector<std::string> out;
        for (std::size_t idx : graph.order())
        {
            out.push_back(graph.nodes()[idx].name);
        }
        return out;
    }

} // namespace

TEST(DependencyGraph, DefaultPipelineOrderIsPipelineOrder)
{
    std::string error;
    auto graph = DependencyGraph::build(muslforge::model::defaultPipeline(), error);
    ASSERT_TRUE(graph.has_value()) << error;
    EXPECT_EQ(orderNames(graph.value()),
              (std::vector<std::string>{"zlib", "openssl", "libvpx", "ffmpeg", "rlottie", "opencv"}));

    const auto ffmpeg = graph->find("ffmpeg");
    ASSERT_TRUE(ffmpeg.has_value());
    EXPECT_EQ(graph->nodes()[ffmpeg.value()].depends.size(), 2u);
}

TEST(DependencyGraph, RequirementListedLaterStillRunsFirst)
{
    std::string error;
    auto graph = DependencyGraph::build(numbered({makeSpec("app", {"lib"}), makeSpec("lib")}), error);
    ASSERT_TRUE(graph.has_value()) << error;
    EXPECT_EQ(orderNames(graph.value()), (std::vector<std::string>{"lib", "app"}));
}

TEST(DependencyGraph, UnknownRequirementIsRejected)
{
    std::string error;
    auto graph = DependencyGraph::build(numbered({makeSpec("ffmpeg", {"libvpx"})}), error);
    EXPECT_FALSE(graph.has_value());
    EXPECT_NE(error.find("libvpx"), std::string::npos);
}

TEST(DependencyGraph, CycleIsRejected)
{
    std::string error;
    auto graph = DependencyGraph::build(
        numbered({makeSpec("a", {"c"}), makeSpec("b", {"a"}), makeSpec("c", {"b"})}),
        error);
    EXPECT_FALSE(graph.has_value());
    EXPECT_NE(error.find("cycle"), std::string::npos);
}

TEST(DependencyGraph, DuplicateAndSelfRequirementAreRejected)
{
    std::string error;
    EXPECT_FALSE(DependencyGraph::build(numbered({makeSpec("a"), makeSpec("a")}), error).has_value());
    EXPECT_FALSE(DependencyGraph::build(numbered({makeSpec("a", {"a"})}), error).has_value());
}
