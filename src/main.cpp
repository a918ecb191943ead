#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <utility>
#include "longembed/embedder_config.hpp"
#include "longembed/embedding_model.hpp"
#include "longembed/embedding_response.hpp"
#include "longembed/errors.hpp"
#include "longembed/logger.hpp"

using namespace longembed;

namespace
{
    struct InputOptions
    {
        std::string text;
        std::string file;
        bool hasText = false;
    };

    // Pulls the input options out of the argument list and returns the rest.
    bool splitInputArgs(int argc, char *argv[], InputOptions &input, std::vector<std::string> &rest)
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if ((arg == "-t" || arg == "--text") && i + 1 < argc)
            {
                input.text = argv[++i];
                input.hasText = true;
            }
            else if ((arg == "-f" || arg == "--file") && i + 1 < argc)
            {
                input.file = argv[++i];
            }
            else
            {
                rest.push_back(arg);
            }
        }

        if (input.hasText && !input.file.empty())
        {
            std::cerr << "Error: --text and --file cannot be used together" << std::endl;
            return false;
        }
        return true;
    }

    bool readInput(const InputOptions &input, std::string &text)
    {
        if (input.hasText)
        {
            text = input.text;
            return true;
        }

        if (input.file.empty())
        {
            std::cerr << "Error: No input given, use --text or --file" << std::endl;
            return false;
        }

        if (input.file == "-")
        {
            text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
            return true;
        }

        std::ifstream file(input.file, std::ios::binary);
        if (!file.is_open())
        {
            std::cerr << "Error: Cannot open input file: " << input.file << std::endl;
            return false;
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        text = buffer.str();
        return true;
    }
}

int main(int argc, char *argv[])
{
    InputOptions input;
    std::vector<std::string> args;
    if (!splitInputArgs(argc, argv, input, args))
    {
        return 1;
    }

    EmbedderConfig config;
    if (!config.loadFromArgs(args))
    {
        // Help or version is a successful exit
        return config.helpOrVersionShown ? 0 : 1;
    }

    if (!config.validate() || !config.applyLogging())
    {
        return 1;
    }

    std::string text;
    if (!readInput(input, text))
    {
        return 1;
    }

    std::unique_ptr<EmbeddingModel> model;
    try
    {
        model = EmbeddingModel::create(config);
    }
    catch (const EmbedderError &e)
    {
        Logger::logError("Failed to create model: %s", e.what());
        return 2;
    }

    EmbeddingResult result;
    try
    {
        result = model->embed(text);
    }
    catch (const EmbedderError &e)
    {
        Logger::logError("Failed to embed input: %s", e.what());
        return 3;
    }

    EmbeddingResponse response;
    response.model = config.model.id;
    response.revision = config.model.revision;
    response.result = std::move(result);

    std::cout << response.dump() << std::endl;
    return 0;
}
