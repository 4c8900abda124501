#include "llm/embedding_provider.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace cg {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Make HTTP POST request with CURL
std::string http_post(
    const std::string& url,
    const std::string& json_payload,
    const std::vector<std::string>& headers,
    int timeout_seconds
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string response;
    struct curl_slist* header_list = nullptr;

    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw std::runtime_error("CURL request failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw std::runtime_error(
            "HTTP request failed with code " + std::to_string(http_code) +
            ": " + response
        );
    }

    return response;
}

EmbeddingResponse post_embeddings(
    const EmbeddingConfig& config,
    const std::string& payload
) {
    auto start_time = std::chrono::high_resolution_clock::now();

    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Authorization: Bearer " + config.api_key
    };

    std::string response_str = http_post(
        config.api_base_url + "/embeddings", payload, headers, config.timeout_seconds
    );
    EmbeddingResponse response = parse_embedding_response(response_str);

    auto end_time = std::chrono::high_resolution_clock::now();
    response.latency_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    return response;
}

} // anonymous namespace

// ============================================================================
// EmbeddingProvider Base Class
// ============================================================================

template<typename Func>
EmbeddingResponse EmbeddingProvider::retry_call(Func&& func, const std::string& operation_name) {
    int attempts = 0;
    while (attempts < config_.max_retries) {
        try {
            return func();
        } catch (const std::exception& e) {
            attempts++;
            if (attempts >= config_.max_retries) {
                EmbeddingResponse error_response;
                error_response.success = false;
                error_response.error_message = std::string("Failed after ") +
                    std::to_string(config_.max_retries) + " attempts: " + e.what();
                return error_response;
            }

            if (config_.verbose) {
                std::cerr << "Attempt " << attempts << " failed for " << operation_name
                          << ": " << e.what() << ". Retrying..." << std::endl;
            }

            // Exponential backoff
            std::this_thread::sleep_for(
                std::chrono::seconds(static_cast<int>(std::pow(2, attempts - 1)))
            );
        }
    }

    EmbeddingResponse error_response;
    error_response.success = false;
    error_response.error_message = "Max retries exceeded";
    return error_response;
}

// ============================================================================
// Voyage Provider
// ============================================================================

VoyageEmbeddingProvider::VoyageEmbeddingProvider(const std::string& api_key, const std::string& model) {
    config_.api_key = api_key;
    config_.model = model;
    config_.api_base_url = "https://api.voyageai.com/v1";
}

std::string VoyageEmbeddingProvider::build_payload(const std::vector<std::string>& texts) const {
    json j;
    j["model"] = config_.model;
    j["input"] = texts;
    if (!config_.input_type.empty()) {
        j["input_type"] = config_.input_type;
    }
    return j.dump();
}

EmbeddingResponse VoyageEmbeddingProvider::embed(const std::vector<std::string>& texts) {
    if (texts.empty()) {
        EmbeddingResponse empty;
        empty.success = true;
        empty.model = config_.model;
        return empty;
    }

    auto call_api = [&]() -> EmbeddingResponse {
        if (config_.verbose) {
            std::cout << "Voyage embeddings request: " << texts.size()
                      << " texts to " << config_.model << std::endl;
        }
        return post_embeddings(config_, build_payload(texts));
    };

    EmbeddingResponse response = retry_call(call_api, "Voyage embed");
    if (response.success && response.vectors.size() != texts.size()) {
        response.success = false;
        response.error_message = "Expected " + std::to_string(texts.size()) +
            " vectors, got " + std::to_string(response.vectors.size());
    }
    return response;
}

// ============================================================================
// OpenAI Provider
// ============================================================================

OpenAIEmbeddingProvider::OpenAIEmbeddingProvider(const std::string& api_key, const std::string& model) {
    config_.api_key = api_key;
    config_.model = model;
    config_.api_base_url = "https://api.openai.com/v1";
}

std::string OpenAIEmbeddingProvider::build_payload(const std::vector<std::string>& texts) const {
    json j;
    j["model"] = config_.model;
    j["input"] = texts;
    return j.dump();
}

EmbeddingResponse OpenAIEmbeddingProvider::embed(const std::vector<std::string>& texts) {
    if (texts.empty()) {
        EmbeddingResponse empty;
        empty.success = true;
        empty.model = config_.model;
        return empty;
    }

    auto call_api = [&]() -> EmbeddingResponse {
        if (config_.verbose) {
            std::cout << "OpenAI embeddings request: " << texts.size()
                      << " texts to " << config_.model << std::endl;
        }
        return post_embeddings(config_, build_payload(texts));
    };

    EmbeddingResponse response = retry_call(call_api, "OpenAI embed");
    if (response.success && response.vectors.size() != texts.size()) {
        response.success = false;
        response.error_message = "Expected " + std::to_string(texts.size()) +
            " vectors, got " + std::to_string(response.vectors.size());
    }
    return response;
}

// ============================================================================
// Embedding Provider Factory
// ============================================================================

std::unique_ptr<EmbeddingProvider> EmbeddingProviderFactory::create(
    ProviderType type,
    const EmbeddingConfig& config
) {
    std::unique_ptr<EmbeddingProvider> provider;

    switch (type) {
        case ProviderType::Voyage:
            provider = std::make_unique<VoyageEmbeddingProvider>(
                config.api_key, config.model.empty() ? "voyage-3" : config.model);
            break;

        case ProviderType::OpenAI:
            provider = std::make_unique<OpenAIEmbeddingProvider>(
                config.api_key, config.model.empty() ? "text-embedding-3-small" : config.model);
            break;

        default:
            throw std::invalid_argument("Unknown provider type");
    }

    // Keep the provider's base URL unless the config overrides it
    EmbeddingConfig merged = config;
    merged.model = provider->get_model();
    if (merged.api_base_url.empty()) {
        merged.api_base_url = provider->get_config().api_base_url;
    }
    provider->set_config(merged);

    return provider;
}

std::unique_ptr<EmbeddingProvider> EmbeddingProviderFactory::create(
    const std::string& provider_name,
    const EmbeddingConfig& config
) {
    std::string name_lower = provider_name;
    std::transform(name_lower.begin(), name_lower.end(), name_lower.begin(), ::tolower);

    if (name_lower == "voyage") {
        return create(ProviderType::Voyage, config);
    } else if (name_lower == "openai") {
        return create(ProviderType::OpenAI, config);
    } else {
        throw std::invalid_argument("Unknown embedding provider name: " + provider_name);
    }
}

std::unique_ptr<EmbeddingProvider> EmbeddingProviderFactory::create_from_env() {
    std::string provider = get_env_value("CG_EMBEDDING_PROVIDER");
    if (provider.empty()) {
        provider = "voyage";  // Default
    }

    EmbeddingConfig config;
    config.model = get_env_value("CG_EMBEDDING_MODEL");

    if (provider == "voyage") {
        config.api_key = get_env_value("CG_VOYAGE_API_KEY");
        if (config.api_key.empty()) {
            config.api_key = get_env_value("VOYAGE_API_KEY");
        }
    } else if (provider == "openai") {
        config.api_key = get_env_value("CG_OPENAI_API_KEY");
        if (config.api_key.empty()) {
            config.api_key = get_env_value("OPENAI_API_KEY");
        }
    }

    if (config.api_key.empty()) {
        return nullptr;
    }

    return create(provider, config);
}

// ============================================================================
// Utility Functions
// ============================================================================

EmbeddingResponse parse_embedding_response(const std::string& response_json) {
    EmbeddingResponse response;

    json j;
    try {
        j = json::parse(response_json);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse embeddings response: ") + e.what());
    }

    if (j.contains("error")) {
        const auto& error = j["error"];
        std::string message = error.is_object() ? error.value("message", error.dump()) : error.dump();
        throw std::runtime_error("Embeddings API error: " + message);
    }

    if (!j.contains("data") || !j["data"].is_array()) {
        throw std::runtime_error("Embeddings response has no data array");
    }

    std::vector<std::pair<int, std::vector<float>>> indexed;
    int position = 0;
    try {
        for (const auto& item : j["data"]) {
            int index = item.value("index", position);
            indexed.emplace_back(index, item.at("embedding").get<std::vector<float>>());
            ++position;
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed embedding entry: ") + e.what());
    }

    std::stable_sort(indexed.begin(), indexed.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    for (auto& [index, vector] : indexed) {
        response.vectors.push_back(std::move(vector));
    }

    if (j.contains("model") && j["model"].is_string()) {
        response.model = j["model"].get<std::string>();
    }
    if (j.contains("usage") && j["usage"].is_object()) {
        response.total_tokens = j["usage"].value("total_tokens", 0);
    }

    response.success = true;
    return response;
}

EmbeddingResponse embed_in_batches(
    EmbeddingProvider& provider,
    const std::vector<std::string>& texts,
    size_t batch_size
) {
    EmbeddingResponse combined;
    combined.success = true;
    combined.model = provider.get_model();

    if (batch_size == 0) {
        batch_size = texts.size();
    }

    for (size_t start = 0; start < texts.size(); start += batch_size) {
        size_t end = std::min(start + batch_size, texts.size());
        std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);

        EmbeddingResponse response = provider.embed(batch);
        if (!response.success) {
            return response;
        }
        if (response.vectors.size() != batch.size()) {
            EmbeddingResponse error_response;
            error_response.success = false;
            error_response.error_message = "Expected " + std::to_string(batch.size()) +
                " vectors, got " + std::to_string(response.vectors.size());
            return error_response;
        }

        for (auto& vector : response.vectors) {
            combined.vectors.push_back(std::move(vector));
        }
        combined.total_tokens += response.total_tokens;
        combined.latency_ms += response.latency_ms;
    }

    return combined;
}

std::string get_env_value(const std::string& env_var_name) {
    const char* value = std::getenv(env_var_name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace cg
