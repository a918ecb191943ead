#include "longembed/weights_loader.hpp"
#include "longembed/model_repository.hpp"
#include "longembed/logger.hpp"

namespace longembed
{

std::string LegacyWeightsLoader::prepare(const ModelRepository &repository, LoadingParameters &params) const
{
    std::string path = repository.get(file);
    params.use_mmap = false;
    Logger::logDebug("Weights %s will be read into memory", path.c_str());
    return path;
}

std::string MappedWeightsLoader::prepare(const ModelRepository &repository, LoadingParameters &params) const
{
    std::string path = repository.get(file);
    params.use_mmap = true;
    Logger::logDebug("Weights %s will be memory-mapped", path.c_str());
    return path;
}

std::unique_ptr<WeightsLoader> makeWeightsLoader(bool usePth, const std::string &mappedFileName,
                                                 const std::string &legacyFileName)
{
    if (usePth)
    {
        return std::make_unique<LegacyWeightsLoader>(legacyFileName);
    }
    return std::make_unique<MappedWeightsLoader>(mappedFileName);
}

} // namespace longembed
