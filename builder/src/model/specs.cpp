#include "model/specs.hpp"

namespace muslforge::model
{

    std::string expandTemplate(const std::string &text, const DependencySpec &spec, const TemplateValues &values)
    {
        std::string out;
        out.reserve(text.size() + 16);
        for (std::size_t i = 0; i < text.size();)
        {
            if (text.compare(i, 2, "${") == 0)
            {
                const auto close = text.find('}', i + 2);
                if (close != std::string::npos)
                {
                    const std::string key = text.substr(i + 2, close - i - 2);
                    if (key == "name")
                    {
                        out += spec.name;
                        i = close + 1;
                        continue;
                    }
                    if (key == "version")
                    {
                        out += spec.version;
                        i = close + 1;
                        continue;
                    }
                    auto value = values.find(key);
                    if (value != values.end())
                    {
                        out += value->second;
                        i = close + 1;
                        continue;
                    }
                }
            }
            out.push_back(text[i]);
            ++i;
        }
        return out;
    }

    std::string archiveExtension(ArchiveFormat format)
    {
        switch (format)
        {
        case ArchiveFormat::TarGz:
            return ".tar.gz";
        case ArchiveFormat::TarXz:
            return ".tar.xz";
        case ArchiveFormat::Zip:
            return ".zip";
        }
        return ".tar.gz";
    }

} // namespace muslforge::model
