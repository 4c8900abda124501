#include "retrieval/authority_retrieval.hpp"
#include "util/text_utils.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace cg {

namespace {

std::string value_or(const nlohmann::json& data, const std::string& key, const std::string& fallback) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return fallback;
    std::string value = it->is_string() ? it->get<std::string>() : it->dump();
    return value.empty() ? fallback : value;
}

// Entries shown per section of the brief
size_t section_limit(AuthorityCategory category) {
    switch (category) {
        case AuthorityCategory::Decisions:
        case AuthorityCategory::AnsweredQuestions:
        case AuthorityCategory::Assessments:
            return 5;
        default:
            return 10;
    }
}

} // anonymous namespace

// ============================================================================
// Retrieval Results
// ============================================================================

nlohmann::json RetrievalMatch::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["data"] = data;
    j["similarity"] = similarity;
    if (is_superseded()) {
        j["superseded_by"] = superseded_by;
    }
    return j;
}

AuthorityResults::AuthorityResults() {
    for (AuthorityCategory category : all_categories()) {
        by_category[category];
    }
}

const std::vector<RetrievalMatch>& AuthorityResults::get(AuthorityCategory category) const {
    static const std::vector<RetrievalMatch> empty;
    auto it = by_category.find(category);
    return it == by_category.end() ? empty : it->second;
}

size_t AuthorityResults::total() const {
    size_t count = 0;
    for (const auto& [category, matches] : by_category) {
        count += matches.size();
    }
    return count;
}

nlohmann::ordered_json AuthorityResults::to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (AuthorityCategory category : all_categories()) {
        nlohmann::ordered_json entries = nlohmann::ordered_json::array();
        for (const auto& match : get(category)) {
            entries.push_back(nlohmann::ordered_json(match.to_json()));
        }
        j[category_key(category)] = std::move(entries);
    }
    return j;
}

// ============================================================================
// Matchers
// ============================================================================

double KeywordMatcher::category_similarity(AuthorityCategory category) {
    switch (category) {
        case AuthorityCategory::Decisions: return 0.9;
        case AuthorityCategory::AnsweredQuestions: return 0.8;
        case AuthorityCategory::Assessments: return 0.8;
        case AuthorityCategory::RoadmapItems: return 0.7;
        case AuthorityCategory::Gaps: return 0.7;
        case AuthorityCategory::Chunks: return 0.6;
        case AuthorityCategory::PendingQuestions: return 0.7;
    }
    return 0.0;
}

void KeywordMatcher::prepare(const std::string& query) {
    query_lower_ = to_lower(query);
}

std::optional<double> KeywordMatcher::score(const GraphNode& node, AuthorityCategory category) const {
    if (!query_lower_.empty() &&
        to_lower(record_text(node.record)).find(query_lower_) == std::string::npos) {
        return std::nullopt;
    }
    return category_similarity(category);
}

EmbeddingMatcher::EmbeddingMatcher(EmbeddingProvider& provider, double min_similarity)
    : provider_(provider), min_similarity_(min_similarity) {}

void EmbeddingMatcher::prepare(const std::string& query) {
    fallback_.prepare(query);
    query_vector_.clear();

    // Voyage embeds queries and documents asymmetrically
    EmbeddingConfig document_config = provider_.get_config();
    EmbeddingConfig query_config = document_config;
    query_config.input_type = "query";
    provider_.set_config(query_config);
    EmbeddingResponse response = provider_.embed({query});
    provider_.set_config(document_config);

    if (!response.success) {
        throw std::runtime_error("Failed to embed query: " + response.error_message);
    }
    if (response.vectors.size() != 1 || response.vectors[0].empty()) {
        throw std::runtime_error("Failed to embed query: empty embedding returned");
    }
    query_vector_ = std::move(response.vectors[0]);
}

std::optional<double> EmbeddingMatcher::score(const GraphNode& node, AuthorityCategory category) const {
    if (!node.has_embedding() || node.embedding.size() != query_vector_.size()) {
        return fallback_.score(node, category);
    }

    double similarity = ContextGraph::cosine_similarity(query_vector_, node.embedding);
    if (similarity < min_similarity_) {
        return std::nullopt;
    }
    return similarity;
}

bool mode_uses_embeddings(const std::string& mode) {
    return to_lower(mode) == "embedding";
}

std::unique_ptr<Matcher> create_matcher(
    const std::string& mode,
    EmbeddingProvider* provider,
    double min_similarity
) {
    std::string mode_lower = to_lower(mode);

    if (mode_lower == "keyword") {
        return std::make_unique<KeywordMatcher>();
    } else if (mode_uses_embeddings(mode)) {
        if (!provider) {
            throw std::invalid_argument("Embedding retrieval requires an embedding provider");
        }
        return std::make_unique<EmbeddingMatcher>(*provider, min_similarity);
    } else {
        throw std::invalid_argument("Unknown retrieval mode: " + mode);
    }
}

// ============================================================================
// Retrieval
// ============================================================================

AuthorityResults retrieve_with_authority(
    const std::string& query,
    const ContextGraph& graph,
    Matcher& matcher,
    size_t top_k
) {
    AuthorityResults results;
    matcher.prepare(query);

    for (NodeType type : all_node_types()) {
        for (const auto& id : graph.ids_of_type(type)) {
            const GraphNode* node = graph.get_node(id);
            if (!node) continue;

            AuthorityCategory category = authority_category(node->record);
            auto similarity = matcher.score(*node, category);
            if (!similarity) continue;

            RetrievalMatch match;
            match.id = id;
            match.data = record_to_json(node->record);
            match.similarity = *similarity;

            if (type == NodeType::Chunk) {
                if (auto decision = graph.get_superseding_decision(id)) {
                    match.superseded_by = decision->id;
                }
            }

            results.by_category[category].push_back(std::move(match));
        }
    }

    for (auto& [category, matches] : results.by_category) {
        std::stable_sort(matches.begin(), matches.end(),
            [](const RetrievalMatch& a, const RetrievalMatch& b) {
                return a.similarity > b.similarity;
            });
        if (matches.size() > top_k) {
            matches.resize(top_k);
        }
    }

    return results;
}

AuthorityResults retrieve_with_authority(
    const std::string& query,
    const ContextGraph& graph,
    size_t top_k
) {
    KeywordMatcher matcher;
    return retrieve_with_authority(query, graph, matcher, top_k);
}

std::string format_context_with_authority(const AuthorityResults& results) {
    std::vector<std::string> sections;

    for (AuthorityCategory category : all_categories()) {
        const auto& matches = results.get(category);
        if (matches.empty()) continue;

        size_t limit = std::min(matches.size(), section_limit(category));

        switch (category) {
            case AuthorityCategory::Decisions:
                sections.push_back("## " + category_title(category) + " (Highest Authority)");
                sections.push_back("These decisions override conflicting content.\n");
                for (size_t i = 0; i < limit; ++i) {
                    const auto& d = matches[i].data;
                    sections.push_back("### " + value_or(d, "id", "Decision"));
                    sections.push_back("**Decision:** " + value_or(d, "decision", "N/A"));
                    sections.push_back("**Rationale:** " + value_or(d, "rationale", "N/A") + "\n");
                }
                break;

            case AuthorityCategory::AnsweredQuestions:
                sections.push_back("## " + category_title(category));
                for (size_t i = 0; i < limit; ++i) {
                    const auto& q = matches[i].data;
                    sections.push_back("- " + value_or(q, "question", "N/A") + " (Answered)\n");
                }
                break;

            case AuthorityCategory::Assessments:
                sections.push_back("## " + category_title(category));
                for (size_t i = 0; i < limit; ++i) {
                    const auto& a = matches[i].data;
                    sections.push_back("- " + value_or(a, "type", "Assessment") + ": " +
                                       utf8_prefix(value_or(a, "summary", "N/A"), 200) + "\n");
                }
                break;

            case AuthorityCategory::RoadmapItems:
                sections.push_back("## " + category_title(category));
                for (size_t i = 0; i < limit; ++i) {
                    const auto& ri = matches[i].data;
                    sections.push_back("- **" + value_or(ri, "name", "Item") + "** (" +
                                       value_or(ri, "horizon", "future") + "): " +
                                       utf8_prefix(value_or(ri, "description", "N/A"), 150) + "\n");
                }
                break;

            case AuthorityCategory::Gaps:
                sections.push_back("## " + category_title(category));
                for (size_t i = 0; i < limit; ++i) {
                    const auto& g = matches[i].data;
                    sections.push_back("- [" + value_or(g, "severity", "N/A") + "] " +
                                       utf8_prefix(value_or(g, "description", "N/A"), 150) + "\n");
                }
                break;

            case AuthorityCategory::Chunks:
                sections.push_back("## " + category_title(category));
                sections.push_back("Excerpts marked SUPERSEDED conflict with a resolved decision.\n");
                for (size_t i = 0; i < limit; ++i) {
                    const auto& c = matches[i].data;
                    std::string line = "- [" + value_or(c, "lens", "unknown") + "] " +
                                       value_or(c, "source_name", "source") + ": " +
                                       utf8_prefix(value_or(c, "content", ""), 200);
                    if (matches[i].is_superseded()) {
                        line += " (SUPERSEDED by " + matches[i].superseded_by + ")";
                    }
                    sections.push_back(line + "\n");
                }
                break;

            case AuthorityCategory::PendingQuestions:
                sections.push_back("## " + category_title(category));
                for (size_t i = 0; i < limit; ++i) {
                    const auto& q = matches[i].data;
                    sections.push_back("- [" + value_or(q, "priority", "N/A") + "] " +
                                       value_or(q, "question", "N/A") + "\n");
                }
                break;
        }
    }

    std::ostringstream out;
    for (size_t i = 0; i < sections.size(); ++i) {
        if (i > 0) out << "\n";
        out << sections[i];
    }
    return out.str();
}

} // namespace cg
