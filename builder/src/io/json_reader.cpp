#include "io/json_reader.hpp"

#include <sstream>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

#include "io/fs_utils.hpp"

namespace muslforge::io
{

    nlohmann::json parseJsonObject(const std::string &text, const std::string &origin)
    {
        nlohmann::json data;
        try
        {
            data = nlohmann::json::parse(text);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::runtime_error(origin + ": " + e.what());
        }
        if (!data.is_object())
        {
            throw std::runtime_error("JSON root is not object: " + origin);
        }
        return data;
    }

    nlohmann::json loadJsonFile(const std::filesystem::path &path)
    {
        auto text = readTextFile(path);
        if (!text.has_value())
        {
            throw std::runtime_error("Could not open JSON file: " + path.string());
        }
        return parseJsonObject(text.value(), path.string());
    }

    bool writeJsonFile(const std::filesystem::path &path, const nlohmann::json &data)
    {
        const std::filesystem::path temp = path.string() + ".tmp" + std::to_string(getpid());
        if (!writeTextFile(temp, data.dump(2) + "\n"))
        {
            return false;
        }
        std::error_code ec;
        std::filesystem::rename(temp, path, ec);
        if (ec)
        {
            std::filesystem::remove(temp, ec);
            return false;
        }
        return true;
    }

    std::vector<std::string> splitFlags(const std::string &text)
    {
        std::vector<std::string> out;
        std::istringstream input(text);
        std::string token;
        while (input >> token)
        {
            out.push_back(token);
        }
        return out;
    }

} // namespace muslforge::io
