#include "io/fs_utils.hpp"

#include <algorithm>
#include <deque>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace muslforge::io
{

    bool ensureDir(const fs::path &path)
    {
        std::error_code ec;
        if (fs::exists(path, ec))
        {
            return fs::is_directory(path, ec);
        }
        return fs::create_directories(path, ec) && !ec;
    }

    bool removePath(const fs::path &path, bool dryRun, const muslforge::Context &ctx)
    {
        std::error_code ec;
        if (!fs::exists(path, ec))
        {
            return false;
        }

        if (dryRun)
        {
            ctx.log("Would remove: ", path.string());
            return true;
        }

        ctx.log("Remove: ", path.string());
        if (fs::is_directory(path, ec))
        {
            fs::remove_all(path, ec);
            if (ec)
            {
                ctx.error("Failed remove ", path.string(), " : ", ec.message());
                return false;
            }
            return true;
        }

        bool ok = fs::remove(path, ec);
        if (!ok || ec)
        {
            ctx.error("Failed remove ", path.string(), " : ", ec.message());
            return false;
        }
        return true;
    }

    std::optional<std::string> readTextFile(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        std::ostringstream out;
        out << in.rdbuf();
        return out.str();
    }

    bool writeTextFile(const fs::path &path, const std::string &content)
    {
        if (path.has_parent_path() && !ensureDir(path.parent_path()))
        {
            return false;
        }
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            return false;
        }
        out << content;
        return static_cast<bool>(out);
    }

    std::vector<fs::path> listFilesRecursive(const fs::path &root)
    {
        std::vector<fs::path> out;
        std::error_code ec;
        if (!fs::is_directory(root, ec))
        {
            return out;
        }

        for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
        {
            const auto status = it->symlink_status(ec);
            if (ec)
            {
                break;
            }
            if (fs::is_regular_file(status) || fs::is_symlink(status))
            {
                out.push_back(it->path().lexically_relative(root));
            }
        }

        std::sort(out.begin(), out.end());
        return out;
    }

    bool replaceFileAtomically(const fs::path &source, const fs::path &destination, std::error_code &ec)
    {
        fs::create_directories(destination.parent_path(), ec);
        if (ec)
        {
            return false;
        }

        const fs::path temp = destination.parent_path() /
                              ("." + destination.filename().string() + ".tmp" + std::to_string(getpid()));
        fs::remove(temp, ec);
        ec.clear();

        if (fs::is_symlink(fs::symlink_status(source, ec)))
        {
            fs::copy_symlink(source, temp, ec);
        }
        else
        {
            fs::copy_file(source, temp, fs::copy_options::overwrite_existing, ec);
        }
        if (ec)
        {
            return false;
        }

        fs::rename(temp, destination, ec);
        if (ec)
        {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return false;
        }
        return true;
    }

    std::vector<std::string> tailLines(const fs::path &path, std::size_t count)
    {
        std::deque<std::string> window;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line))
        {
            window.push_back(line);
            if (window.size() > count)
            {
                window.pop_front();
            }
        }
        return std::vector<std::string>(window.begin(), window.end());
    }

} // namespace muslforge::io
