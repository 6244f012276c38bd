#include "pipeline/recipe.hpp"

namespace fs = std::filesystem;

namespace muslforge::pipeline
{
    namespace
    {

        model::TemplateValues toolchainValues(const toolchain::ToolchainConfig &config)
        {
            model::TemplateValues values;
            values["prefix"] = config.prefix().string();
            values["cc"] = config.cc();
            values["cxx"] = config.cxx();
            values["ar"] = config.ar();
            values["ranlib"] = config.ranlib();
            values["cflags"] = toolchain::joinFlags(config.cflags());
            values["ldflags"] = toolchain::joinFlags(config.ldflags());
            return values;
        }

        // spec.args then the arguments of the target architecture, placeholders expanded.
        std::vector<std::string> specArgs(const model::DependencySpec &spec, const toolchain::ToolchainConfig &config)
        {
            const auto values = toolchainValues(config);
            std::vector<std::string> out;
            for (const auto &arg : spec.args)
            {
                out.push_back(model::expandTemplate(arg, spec, values));
            }
            auto it = spec.archArgs.find(model::archName(config.arch()));
            if (it != spec.archArgs.end())
            {
                for (const auto &arg : it->second)
                {
                    out.push_back(model::expandTemplate(arg, spec, values));
                }
            }
            return out;
        }

        void planConfigureSystem(
            const model::DependencySpec &spec,
            const toolchain::ToolchainConfig &config,
            const StepPaths &paths,
            const model::Tools &tools,
            StepPlan &plan)
        {
            const toolchain::Environment env = config.environment();

            Command configure;
            configure.program = "./" + spec.configureScript;
            configure.cwd = paths.sourceDir;
            configure.env = env;
            configure.args.push_back("--prefix=" + config.prefix().string());
            const auto extra = specArgs(spec, config);
            configure.args.insert(configure.args.end(), extra.begin(), extra.end());
            plan.configure.push_back(configure);

            Command compile;
            compile.program = tools.make;
            compile.cwd = paths.sourceDir;
            compile.env = env;
            compile.args.push_back("-j" + std::to_string(config.makeJobs()));
            plan.compile.push_back(compile);

            Command install;
            install.program = tools.make;
            install.cwd = paths.sourceDir;
            install.env = env;
            install.args.push_back(spec.installTarget);
            install.args.push_back("DESTDIR=" + paths.stageDir.string());
            plan.install.push_back(install);
        }

        void planCMakeSystem(
            const model::DependencySpec &spec,
            const toolchain::ToolchainConfig &config,
            const StepPaths &paths,
            const model::Tools &tools,
            StepPlan &plan)
        {
            const toolchain::Environment env = config.environment();
            const std::string cflags = toolchain::joinFlags(config.cflags());
            const std::string ldflags = toolchain::joinFlags(config.ldflags());

            Command configure;
            configure.program = tools.cmake;
            configure.cwd = paths.sourceDir;
            configure.env = env;
            configure.args = {
                "-S", paths.sourceDir.string(),
                "-B", paths.buildDir.string(),
                "-DCMAKE_BUILD_TYPE=Release",
                "-DCMAKE_INSTALL_PREFIX=" + config.prefix().string(),
                "-DCMAKE_PREFIX_PATH=" + config.prefix().string(),
                "-DBUILD_SHARED_LIBS=OFF",
                "-DCMAKE_POSITION_INDEPENDENT_CODE=ON",
                "-DCMAKE_C_COMPILER=" + config.cc(),
                "-DCMAKE_CXX_COMPILER=" + config.cxx(),
                "-DCMAKE_AR=" + config.ar(),
                "-DCMAKE_RANLIB=" + config.ranlib(),
                "-DCMAKE_C_FLAGS=" + cflags,
                "-DCMAKE_CXX_FLAGS=" + cflags,
                "-DCMAKE_EXE_LINKER_FLAGS=" + ldflags,
            };
            const auto extra = specArgs(spec, config);
            configure.args.insert(configure.args.end(), extra.begin(), extra.end());
            plan.configure.push_back(configure);

            Command compile;
            compile.program = tools.cmake;
            compile.cwd = paths.sourceDir;
            compile.env = env;
            compile.args = {"--build", paths.buildDir.string(), "-j", std::to_string(config.makeJobs())};
            plan.compile.push_back(compile);

            Command install;
            install.program = tools.cmake;
            install.cwd = paths.sourceDir;
            install.env = env;
            install.env["DESTDIR"] = paths.stageDir.string();
            install.args = {"--install", paths.buildDir.string()};
            plan.install.push_back(install);
        }

    } // namespace

    fs::path StepPaths::stagedPrefix(const fs::path &prefix) const
    {
        return stageDir / prefix.relative_path();
    }

    StepPaths stepPaths(const fs::path &workDir, const model::DependencySpec &spec)
    {
        StepPaths paths;
        paths.downloads = workDir / "downloads";
        paths.archive = paths.downloads / model::resolvedArchive(spec);
        paths.extractRoot = workDir / "src" / spec.name;
        paths.sourceDir = paths.extractRoot / model::resolvedSourceDir(spec);
        paths.buildDir = paths.sourceDir / "_muslforge";
        paths.stageDir = workDir / "stage" / spec.name;
        paths.logFile = workDir / "logs" / (spec.name + ".log");
        return paths;
    }

    StepPlan planStep(
        const model::DependencySpec &spec,
        const toolchain::ToolchainConfig &config,
        const StepPaths &paths,
        const model::Tools &tools)
    {
        StepPlan plan;
        if (spec.system == model::BuildSystem::CMake)
        {
            planCMakeSystem(spec, config, paths, tools, plan);
        }
        else
        {
            planConfigureSystem(spec, config, paths, tools, plan);
        }
        return plan;
    }

} // namespace muslforge::pipeline
