#include "longembed/pooling.hpp"
#include "longembed/errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace longembed
{

std::vector<float> meanPool(const HiddenStates &states)
{
    if (states.batch != 1)
    {
        throw EncodeError("Expected hidden states with batch size 1, got " + std::to_string(states.batch));
    }

    if (states.n_tokens == 0)
    {
        throw EncodeError("Cannot pool hidden states without tokens");
    }

    if (!states.isConsistent())
    {
        throw EncodeError("Hidden state buffer holds " + std::to_string(states.data.size()) +
                          " values, expected " + std::to_string(states.n_tokens * states.hidden_size));
    }

    std::vector<double> sums(states.hidden_size, 0.0);
    for (size_t t = 0; t < states.n_tokens; ++t)
    {
        for (size_t h = 0; h < states.hidden_size; ++h)
        {
            sums[h] += states.at(0, t, h);
        }
    }

    const double n_tokens = static_cast<double>(states.n_tokens);
    std::vector<float> pooled(states.hidden_size);
    for (size_t h = 0; h < states.hidden_size; ++h)
    {
        pooled[h] = static_cast<float>(sums[h] / n_tokens);
    }
    return pooled;
}

double l2Norm(const std::vector<float> &v)
{
    double sum = 0.0;
    for (float x : v)
    {
        sum += static_cast<double>(x) * static_cast<double>(x);
    }
    return std::sqrt(sum);
}

void normalizeInPlace(std::vector<float> &v)
{
    const double length = l2Norm(v);
    if (length == 0.0 || !std::isfinite(length))
    {
        throw DegenerateVectorError("Cannot normalize a vector of length " + std::to_string(length) +
                                    " (" + std::to_string(v.size()) + " dimensions)");
    }

    for (float &x : v)
    {
        x = static_cast<float>(static_cast<double>(x) / length);
    }
}

std::vector<float> normalizeVector(std::vector<float> v)
{
    normalizeInPlace(v);
    return v;
}

} // namespace longembed
