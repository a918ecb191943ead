#pragma once

#include "export.hpp"
#include "inference_interface.h"

#include <memory>
#include <string>

namespace longembed {

class ModelRepository;

enum class WeightsFormat {
    Legacy,             // read fully into memory at load
    MappedTensorStore   // memory-mapped from the file
};

/**
 * @brief Storage-loading strategy for encoder weights.
 *
 * The implementation picks the file to fetch and sets the storage-related
 * loading parameters; nothing downstream depends on which one was used.
 */
class LONGEMBED_API WeightsLoader {
public:
    virtual ~WeightsLoader() = default;

    virtual WeightsFormat format() const = 0;
    virtual const char* name() const = 0;
    virtual const std::string& fileName() const = 0;

    /**
     * @brief Fetches the weights file and configures how it is read.
     * @return Local path of the weights file
     * @throws ModelLoadError if the file cannot be fetched
     */
    virtual std::string prepare(const ModelRepository& repository, LoadingParameters& params) const = 0;
};

class LONGEMBED_API LegacyWeightsLoader : public WeightsLoader {
public:
    explicit LegacyWeightsLoader(const std::string& fileName) : file(fileName) {}

    WeightsFormat format() const override { return WeightsFormat::Legacy; }
    const char* name() const override { return "legacy"; }
    const std::string& fileName() const override { return file; }

    std::string prepare(const ModelRepository& repository, LoadingParameters& params) const override;

private:
#pragma warning(push)
#pragma warning(disable: 4251)
    std::string file;
#pragma warning(pop)
};

class LONGEMBED_API MappedWeightsLoader : public WeightsLoader {
public:
    explicit MappedWeightsLoader(const std::string& fileName) : file(fileName) {}

    WeightsFormat format() const override { return WeightsFormat::MappedTensorStore; }
    const char* name() const override { return "mapped"; }
    const std::string& fileName() const override { return file; }

    std::string prepare(const ModelRepository& repository, LoadingParameters& params) const override;

private:
#pragma warning(push)
#pragma warning(disable: 4251)
    std::string file;
#pragma warning(pop)
};

/**
 * @brief Selects the loader for the use_pth flag of model creation.
 */
LONGEMBED_API std::unique_ptr<WeightsLoader> makeWeightsLoader(bool usePth,
                                                               const std::string& mappedFileName,
                                                               const std::string& legacyFileName);

} // namespace longembed
