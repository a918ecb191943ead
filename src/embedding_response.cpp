#include "longembed/embedding_response.hpp"

namespace longembed
{

nlohmann::json EmbeddingResponse::to_json() const
{
    nlohmann::json j;
    j["model"] = model;
    j["revision"] = revision;
    j["dimensions"] = result.embedding.size();
    j["tokens"] = result.tokens_count;
    j["chunks"] = result.chunks_count;
    j["embedding"] = result.embedding;
    return j;
}

std::string EmbeddingResponse::dump() const
{
    return to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace longembed
