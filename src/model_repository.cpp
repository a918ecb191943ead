#include "longembed/model_repository.hpp"
#include "longembed/download_utils.hpp"
#include "longembed/errors.hpp"
#include "longembed/logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace longembed
{

namespace
{
    std::string replaceAll(std::string value, const std::string &from, const std::string &to)
    {
        size_t pos = 0;
        while ((pos = value.find(from, pos)) != std::string::npos)
        {
            value.replace(pos, from.size(), to);
            pos += to.size();
        }
        return value;
    }

    bool hasParentReference(const std::string &value)
    {
        for (const auto &part : std::filesystem::path(value))
        {
            if (part == "..")
            {
                return true;
            }
        }
        return false;
    }

    std::string trimTrailingSlash(std::string value)
    {
        while (!value.empty() && value.back() == '/')
        {
            value.pop_back();
        }
        return value;
    }
}

ModelRepository::ModelRepository(const std::string &modelId, const std::string &revision, const RepositoryConfig &config)
    : modelId(modelId), revision(revision), config(config), localDirectory(false)
{
    if (modelId.empty())
    {
        throw ModelLoadError("Model id cannot be empty");
    }

    if (revision.empty())
    {
        throw ModelLoadError("Model revision cannot be empty");
    }

    std::error_code ec;
    localDirectory = std::filesystem::is_directory(modelId, ec);
    if (localDirectory)
    {
        return;
    }

    if (hasParentReference(modelId) || hasParentReference(revision) || modelId.front() == '/')
    {
        throw ModelLoadError("Model id or revision is not a valid repository name: " + modelId + "@" + revision);
    }

    if (this->config.token.empty())
    {
        if (const char *token = std::getenv("HF_TOKEN"))
        {
            this->config.token = token;
        }
    }
}

std::string ModelRepository::fileUrl(const std::string &fileName) const
{
    return trimTrailingSlash(config.endpoint) + "/" + modelId + "/resolve/" + revision + "/" + fileName;
}

std::string ModelRepository::cachePath(const std::string &fileName) const
{
    if (localDirectory)
    {
        return (std::filesystem::path(modelId) / fileName).string();
    }

    std::filesystem::path path = std::filesystem::path(config.cacheDir) /
                                 replaceAll(modelId, "/", "--") /
                                 replaceAll(revision, "/", "--") /
                                 fileName;
    return path.string();
}

std::string ModelRepository::get(const std::string &fileName) const
{
    if (fileName.empty() || hasParentReference(fileName))
    {
        throw ModelLoadError("Invalid model file name: " + fileName);
    }

    const std::string localPath = cachePath(fileName);

    std::error_code ec;
    if (std::filesystem::is_regular_file(localPath, ec) && std::filesystem::file_size(localPath, ec) > 0 && !ec)
    {
        Logger::logDebug("Using cached %s", localPath.c_str());
        return localPath;
    }

    if (localDirectory)
    {
        throw ModelLoadError("File " + fileName + " not found in model directory " + modelId);
    }

    const std::string url = fileUrl(fileName);
    Logger::logInfo("Fetching %s", url.c_str());

    std::vector<std::string> headers;
    if (!config.token.empty())
    {
        headers.push_back("Authorization: Bearer " + config.token);
    }

    DownloadResult result = download_file(url, localPath, headers);
    if (!result.success)
    {
        throw ModelLoadError("Failed to fetch " + fileName + " for " + modelId + "@" + revision + ": " + result.error_message);
    }

    return result.local_path;
}

} // namespace longembed
