#include "image/digest.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include "io/fs_utils.hpp"
#include "io/json_reader.hpp"
#include "model/arch.hpp"

namespace fs = std::filesystem;

namespace muslforge::image
{
    namespace
    {

        constexpr const char *kDigestAlgorithm = "sha256:";
        constexpr std::size_t kDigestHexLength = 64;

    } // namespace

    bool isDigestHex(const std::string &hex)
    {
        return hex.size() == kDigestHexLength &&
               std::all_of(hex.begin(), hex.end(), [](unsigned char c)
                           { return std::isdigit(c) || (c >= 'a' && c <= 'f'); });
    }

    bool isValidDigest(const std::string &digest)
    {
        return digest.rfind(kDigestAlgorithm, 0) == 0 && isDigestHex(digestHex(digest));
    }

    std::string digestHex(const std::string &digest)
    {
        const std::string algorithm(kDigestAlgorithm);
        if (digest.rfind(algorithm, 0) == 0)
        {
            return digest.substr(algorithm.size());
        }
        return digest;
    }

    fs::path digestArtifactDir(const fs::path &digestsDir, const std::string &platform)
    {
        return digestsDir / ("digest-" + model::platformSlug(platform));
    }

    Outcome exportDigest(const fs::path &digestsDir, const ArchDigest &digest)
    {
        if (!isValidDigest(digest.digest))
        {
            return Outcome::failure(FailureKind::ImageBuild, "malformed image digest: " + digest.digest);
        }

        const fs::path dir = digestArtifactDir(digestsDir, digest.platform);
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (!io::ensureDir(dir))
        {
            return Outcome::failure(FailureKind::ImageBuild, "cannot create " + dir.string());
        }

        std::ofstream touch(dir / digestHex(digest.digest));
        if (!touch.is_open())
        {
            return Outcome::failure(FailureKind::ImageBuild, "cannot write digest artifact in " + dir.string());
        }
        return Outcome::success();
    }

    std::optional<std::string> readMetadataDigest(const fs::path &metadataFile)
    {
        try
        {
            const auto data = io::loadJsonFile(metadataFile);
            const std::string digest = data.value("containerimage.digest", "");
            if (!isValidDigest(digest))
            {
                return std::nullopt;
            }
            return digest;
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

} // namespace muslforge::image
