#pragma once

#include "export.hpp"

#include <string>

namespace longembed {

/**
 * @brief Where model files come from and where they are cached.
 */
struct RepositoryConfig {
    std::string endpoint = "https://huggingface.co";
    std::string cacheDir = "./models";
    std::string token;        // Empty: fall back to the HF_TOKEN environment variable
};

/**
 * @brief Resolves files of one (model id, revision) pair to local paths.
 *
 * If the model id names an existing directory, files are taken from it
 * directly. Otherwise they are fetched from
 * {endpoint}/{model_id}/resolve/{revision}/{file} into
 * {cacheDir}/{model_id with '/' -> "--"}/{revision}/{file}, and files already
 * present in the cache are reused without network access.
 */
class LONGEMBED_API ModelRepository {
public:
    /**
     * @throws ModelLoadError if the model id or revision is empty or unsafe as a path
     */
    ModelRepository(const std::string& modelId, const std::string& revision,
                    const RepositoryConfig& config = RepositoryConfig());

    /**
     * @brief Returns a local path for the file, downloading it if needed.
     * @throws ModelLoadError if the file is missing locally and cannot be fetched
     */
    std::string get(const std::string& fileName) const;

    std::string fileUrl(const std::string& fileName) const;
    std::string cachePath(const std::string& fileName) const;

    bool isLocalDirectory() const { return localDirectory; }

    const std::string& getModelId() const { return modelId; }
    const std::string& getRevision() const { return revision; }

private:
#pragma warning(push)
#pragma warning(disable: 4251)
    std::string modelId;
    std::string revision;
    RepositoryConfig config;
#pragma warning(pop)
    bool localDirectory;
};

} // namespace longembed
