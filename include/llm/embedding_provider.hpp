#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>

namespace cg {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Configuration for an embedding provider
 */
struct EmbeddingConfig {
    std::string api_key;                    ///< API key for authentication
    std::string model;                      ///< Model name/ID
    std::string api_base_url;               ///< Base URL for API
    std::string input_type = "document";    ///< "document" or "query" (Voyage only)
    int timeout_seconds = 60;               ///< Request timeout
    int max_retries = 3;                    ///< Max attempts per request
    bool verbose = false;                   ///< Enable verbose logging
};

/**
 * @brief Response from an embedding request
 */
struct EmbeddingResponse {
    std::vector<std::vector<float>> vectors;   ///< One vector per input, in input order
    std::string model;                      ///< Model that produced the vectors
    int total_tokens = 0;                   ///< Tokens billed
    double latency_ms = 0.0;                ///< Response latency
    bool success = false;                   ///< Whether request succeeded
    std::string error_message;              ///< Error message if failed
};

// ============================================================================
// Embedding Provider Interface
// ============================================================================

/**
 * @brief Abstract base class for embedding services
 *
 * Calls are batched: a list of texts in, a list of vectors out.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Embed a batch of texts
     *
     * @param texts Input texts
     * @return Response holding one vector per text on success
     */
    virtual EmbeddingResponse embed(const std::vector<std::string>& texts) = 0;

    virtual std::string get_provider_name() const = 0;
    virtual std::string get_model() const { return config_.model; }
    virtual bool is_configured() const { return !config_.api_key.empty(); }
    virtual void set_config(const EmbeddingConfig& config) { config_ = config; }
    virtual EmbeddingConfig get_config() const { return config_; }

protected:
    EmbeddingConfig config_;

    /**
     * @brief Retry logic with exponential backoff
     */
    template<typename Func>
    EmbeddingResponse retry_call(Func&& func, const std::string& operation_name);
};

// ============================================================================
// Voyage Provider
// ============================================================================

/**
 * @brief Voyage AI embeddings API (voyage-3, ...)
 */
class VoyageEmbeddingProvider : public EmbeddingProvider {
public:
    explicit VoyageEmbeddingProvider(
        const std::string& api_key,
        const std::string& model = "voyage-3"
    );

    EmbeddingResponse embed(const std::vector<std::string>& texts) override;

    std::string get_provider_name() const override { return "Voyage"; }

private:
    std::string build_payload(const std::vector<std::string>& texts) const;
};

// ============================================================================
// OpenAI Provider
// ============================================================================

/**
 * @brief OpenAI embeddings API (text-embedding-3-small, ...)
 */
class OpenAIEmbeddingProvider : public EmbeddingProvider {
public:
    explicit OpenAIEmbeddingProvider(
        const std::string& api_key,
        const std::string& model = "text-embedding-3-small"
    );

    EmbeddingResponse embed(const std::vector<std::string>& texts) override;

    std::string get_provider_name() const override { return "OpenAI"; }

private:
    std::string build_payload(const std::vector<std::string>& texts) const;
};

// ============================================================================
// Embedding Provider Factory
// ============================================================================

class EmbeddingProviderFactory {
public:
    enum class ProviderType {
        Voyage,
        OpenAI
    };

    static std::unique_ptr<EmbeddingProvider> create(
        ProviderType type,
        const EmbeddingConfig& config
    );

    /**
     * @brief Create provider from string name ("voyage" or "openai")
     * @throws std::invalid_argument for unknown names
     */
    static std::unique_ptr<EmbeddingProvider> create(
        const std::string& provider_name,
        const EmbeddingConfig& config
    );

    /**
     * @brief Create provider from environment variables
     *
     * Looks for:
     * - CG_EMBEDDING_PROVIDER (voyage/openai, default voyage)
     * - CG_VOYAGE_API_KEY or VOYAGE_API_KEY
     * - CG_OPENAI_API_KEY or OPENAI_API_KEY
     * - CG_EMBEDDING_MODEL (optional)
     *
     * @return Provider, or nullptr if no API key is set
     */
    static std::unique_ptr<EmbeddingProvider> create_from_env();
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Parse an embeddings API response ({"data": [{"embedding", "index"}]})
 *
 * Vectors are ordered by their "index" field.
 *
 * @throws std::runtime_error if the response is not a valid embeddings payload
 */
EmbeddingResponse parse_embedding_response(const std::string& response_json);

/**
 * @brief Embed texts in consecutive batches of at most @p batch_size
 *
 * Stops at the first failed batch and returns its error.
 */
EmbeddingResponse embed_in_batches(
    EmbeddingProvider& provider,
    const std::vector<std::string>& texts,
    size_t batch_size
);

/**
 * @brief Load a value from an environment variable, empty if unset
 */
std::string get_env_value(const std::string& env_var_name);

} // namespace cg
