#pragma once

#include "graph/authority.hpp"
#include "graph/context_graph.hpp"
#include "llm/embedding_provider.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cg {

// ============================================================================
// Retrieval Results
// ============================================================================

/**
 * @brief One retrieved artifact
 */
struct RetrievalMatch {
    std::string id;
    nlohmann::json data;                ///< Serialized record
    double similarity = 0.0;
    std::string superseded_by;          ///< Overriding decision id (chunks only)

    bool is_superseded() const { return !superseded_by.empty(); }

    nlohmann::json to_json() const;
};

/**
 * @brief Matches grouped by authority category
 *
 * Every category is present (possibly empty); iteration over by_category
 * runs from decisions down to pending questions.
 */
struct AuthorityResults {
    std::map<AuthorityCategory, std::vector<RetrievalMatch>> by_category;

    AuthorityResults();

    const std::vector<RetrievalMatch>& get(AuthorityCategory category) const;

    size_t total() const;
    bool empty() const { return total() == 0; }

    /**
     * @brief {"decisions": [...], ..., "pending_questions": [...]} in authority order
     */
    nlohmann::ordered_json to_json() const;
};

// ============================================================================
// Matchers
// ============================================================================

/**
 * @brief Query-time scoring strategy
 *
 * prepare() is called once per query, then score() once per node.
 */
class Matcher {
public:
    virtual ~Matcher() = default;

    virtual void prepare(const std::string& query) = 0;

    /**
     * @brief Similarity of a node to the prepared query, std::nullopt if it does not match
     */
    virtual std::optional<double> score(const GraphNode& node, AuthorityCategory category) const = 0;

    virtual std::string get_name() const = 0;
};

/**
 * @brief Case-insensitive containment of the query in the serialized record
 *
 * Similarities are fixed per category; an empty query matches everything.
 */
class KeywordMatcher : public Matcher {
public:
    void prepare(const std::string& query) override;
    std::optional<double> score(const GraphNode& node, AuthorityCategory category) const override;
    std::string get_name() const override { return "keyword"; }

    static double category_similarity(AuthorityCategory category);

private:
    std::string query_lower_;
};

/**
 * @brief Cosine similarity between the query embedding and node embeddings
 *
 * Nodes without an embedding (questions, assessments, gaps, or chunks
 * synced without vectors) fall back to keyword matching.
 */
class EmbeddingMatcher : public Matcher {
public:
    EmbeddingMatcher(EmbeddingProvider& provider, double min_similarity = 0.5);

    /**
     * @throws std::runtime_error if the query cannot be embedded
     */
    void prepare(const std::string& query) override;
    std::optional<double> score(const GraphNode& node, AuthorityCategory category) const override;
    std::string get_name() const override { return "embedding"; }

private:
    EmbeddingProvider& provider_;
    double min_similarity_;
    std::vector<float> query_vector_;
    KeywordMatcher fallback_;
};

/**
 * @brief True if @p mode (case-insensitive) needs an embedding provider
 */
bool mode_uses_embeddings(const std::string& mode);

/**
 * @brief Matcher for a retrieval mode ("keyword" or "embedding")
 *
 * @param provider Required for "embedding" mode, must outlive the matcher
 * @throws std::invalid_argument for unknown modes or a missing provider
 */
std::unique_ptr<Matcher> create_matcher(
    const std::string& mode,
    EmbeddingProvider* provider = nullptr,
    double min_similarity = 0.5
);

// ============================================================================
// Retrieval
// ============================================================================

/**
 * @brief Retrieve matching artifacts grouped and ordered by authority
 *
 * Each category is sorted by descending similarity and capped at @p top_k.
 * Chunks overridden by a decision carry its id in superseded_by.
 */
AuthorityResults retrieve_with_authority(
    const std::string& query,
    const ContextGraph& graph,
    Matcher& matcher,
    size_t top_k = 20
);

/**
 * @brief Keyword retrieval
 */
AuthorityResults retrieve_with_authority(
    const std::string& query,
    const ContextGraph& graph,
    size_t top_k = 20
);

/**
 * @brief Flatten results into a markdown brief, highest authority first
 */
std::string format_context_with_authority(const AuthorityResults& results);

} // namespace cg
