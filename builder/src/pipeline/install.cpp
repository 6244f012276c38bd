#include "pipeline/install.hpp"

#include <system_error>

#include "io/fs_utils.hpp"
#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace muslforge::pipeline
{
    namespace
    {

        bool hasSuffix(const std::string &value, const std::string &suffix)
        {
            return value.size() >= suffix.size() &&
                   value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        bool isSharedObject(const std::string &name)
        {
            return hasSuffix(name, ".so") || name.find(".so.") != std::string::npos || hasSuffix(name, ".dylib");
        }

        bool hasRedundantLibPrefix(const std::string &name)
        {
            return name.rfind("liblib", 0) == 0 && hasSuffix(name, ".a") && name.size() > 8;
        }

    } // namespace

    fs::path installRecordPath(const fs::path &prefix, const std::string &name)
    {
        return prefix / "share" / "muslforge" / (name + ".json");
    }

    std::optional<InstallRecord> readInstallRecord(const fs::path &prefix, const std::string &name)
    {
        const fs::path path = installRecordPath(prefix, name);
        std::error_code ec;
        if (!fs::exists(path, ec))
        {
            return std::nullopt;
        }

        try
        {
            json data = io::loadJsonFile(path);
            InstallRecord record;
            record.name = data.value("name", "");
            record.version = data.value("version", "");
            record.arch = data.value("arch", "");
            record.files = data.value("files", std::vector<std::string>{});
            if (record.name != name)
            {
                return std::nullopt;
            }
            return record;
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

    bool writeInstallRecord(const fs::path &prefix, const InstallRecord &record)
    {
        json data;
        data["name"] = record.name;
        data["version"] = record.version;
        data["arch"] = record.arch;
        data["files"] = record.files;

        return io::writeJsonFile(installRecordPath(prefix, record.name), data);
    }

    Outcome applyLinkPatch(const fs::path &sourceDir, const model::LinkPatch &patch)
    {
        const fs::path file = sourceDir / patch.file;
        auto content = io::readTextFile(file);
        if (!content.has_value())
        {
            return Outcome::failure(FailureKind::Configure, "link directive file not found: " + file.string());
        }

        const std::string patched = patch.token + patch.append;
        std::string &text = content.value();
        std::string out;
        out.reserve(text.size() + patch.append.size() * 2);

        bool found = false;
        std::size_t pos = 0;
        while (true)
        {
            const auto hit = text.find(patch.token, pos);
            if (hit == std::string::npos)
            {
                out.append(text, pos, std::string::npos);
                break;
            }
            found = true;
            out.append(text, pos, hit - pos);
            out += patch.token;
            pos = hit + patch.token.size();
            if (text.compare(hit, patched.size(), patched) != 0)
            {
                out += patch.append;
            }
        }

        if (!found)
        {
            return Outcome::failure(
                FailureKind::Configure,
                "token '" + patch.token + "' not found in " + file.string());
        }
        if (out != text && !io::writeTextFile(file, out))
        {
            return Outcome::failure(FailureKind::Configure, "cannot rewrite " + file.string());
        }
        return Outcome::success();
    }

    Outcome checkLinkPatchInstalled(const fs::path &installedPrefix, const model::LinkPatch &patch)
    {
        if (patch.installed.empty())
        {
            return Outcome::success();
        }
        const fs::path file = installedPrefix / patch.installed;
        auto content = io::readTextFile(file);
        if (!content.has_value())
        {
            return Outcome::failure(FailureKind::Install, "patched link directive not installed: " + file.string());
        }
        if (content->find(patch.token + patch.append) == std::string::npos)
        {
            return Outcome::failure(
                FailureKind::Install,
                file.string() + " lacks '" + patch.token + patch.append + "'");
        }
        return Outcome::success();
    }

    std::vector<fs::path> findRedundantLibPrefix(const fs::path &root)
    {
        std::vector<fs::path> out;
        for (const auto &rel : io::listFilesRecursive(root))
        {
            if (hasRedundantLibPrefix(rel.filename().string()))
            {
                out.push_back(rel);
            }
        }
        return out;
    }

    std::vector<fs::path> stripRedundantLibPrefix(const fs::path &root, std::string &error)
    {
        std::vector<fs::path> renamed;
        for (const auto &rel : findRedundantLibPrefix(root))
        {
            const fs::path from = root / rel;
            const fs::path to = from.parent_path() / ("lib" + from.filename().string().substr(6));

            std::error_code ec;
            if (fs::exists(to, ec))
            {
                error = "cannot rename " + from.string() + ", " + to.filename().string() + " already exists";
                return renamed;
            }
            fs::rename(from, to, ec);
            if (ec)
            {
                error = "cannot rename " + from.string() + ": " + ec.message();
                return renamed;
            }
            renamed.push_back(to);
        }
        return renamed;
    }

    std::vector<fs::path> findSharedObjects(const fs::path &root)
    {
        std::vector<fs::path> out;
        for (const auto &rel : io::listFilesRecursive(root))
        {
            if (isSharedObject(rel.filename().string()))
            {
                out.push_back(rel);
            }
        }
        return out;
    }

    std::vector<std::string> missingDiscoveryMetadata(const fs::path &prefix, const model::DependencySpec &spec)
    {
        std::vector<std::string> missing;
        for (const auto &name : spec.pkgConfig)
        {
            std::error_code ec;
            if (!fs::is_regular_file(prefix / "lib" / "pkgconfig" / (name + ".pc"), ec))
            {
                missing.push_back(name + ".pc");
            }
        }
        return missing;
    }

    Outcome promoteStage(const fs::path &stagedPrefix, const fs::path &prefix, std::vector<std::string> &files)
    {
        files.clear();
        std::error_code ec;
        if (!fs::is_directory(stagedPrefix, ec))
        {
            return Outcome::failure(FailureKind::Install, "nothing was installed into " + stagedPrefix.string());
        }

        const auto staged = io::listFilesRecursive(stagedPrefix);
        if (staged.empty())
        {
            return Outcome::failure(FailureKind::Install, "nothing was installed into " + stagedPrefix.string());
        }

        for (const auto &rel : staged)
        {
            if (!io::replaceFileAtomically(stagedPrefix / rel, prefix / rel, ec))
            {
                return Outcome::failure(
                    FailureKind::Install,
                    "cannot promote " + rel.string() + " into " + prefix.string() + ": " + ec.message());
            }
            files.push_back(rel.generic_string());
        }
        return Outcome::success();
    }

    Outcome verifyPrefix(const fs::path &prefix, const model::Pipeline &pipeline, model::Arch arch)
    {
        for (const auto &spec : pipeline)
        {
            auto record = readInstallRecord(prefix, spec.name);
            if (!record.has_value())
            {
                return Outcome::failure(FailureKind::Install, "prefix has no install record for " + spec.name);
            }
            if (record->version != spec.version || record->arch != model::archName(arch))
            {
                return Outcome::failure(
                    FailureKind::Install,
                    "prefix holds " + spec.name + " " + record->version + " (" + record->arch + "), expected " +
                        spec.version + " (" + model::archName(arch) + ")");
            }
            const auto missing = missingDiscoveryMetadata(prefix, spec);
            if (!missing.empty())
            {
                return Outcome::failure(FailureKind::Install, "prefix lacks " + missing.front() + " of " + spec.name);
            }
        }
        return Outcome::success();
    }

} // namespace muslforge::pipeline
