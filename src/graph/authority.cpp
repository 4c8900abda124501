#include "graph/authority.hpp"

namespace cg {

int authority_rank(AuthorityCategory category) {
    return static_cast<int>(category);
}

AuthorityCategory authority_category(const EntityRecord& record) {
    switch (node_type_of(record)) {
        case NodeType::Decision:
            return AuthorityCategory::Decisions;
        case NodeType::Question: {
            const Question* question = record_as<Question>(record);
            return question && question->is_answered()
                ? AuthorityCategory::AnsweredQuestions
                : AuthorityCategory::PendingQuestions;
        }
        case NodeType::Assessment:
            return AuthorityCategory::Assessments;
        case NodeType::RoadmapItem:
            return AuthorityCategory::RoadmapItems;
        case NodeType::Gap:
            return AuthorityCategory::Gaps;
        case NodeType::Chunk:
            return AuthorityCategory::Chunks;
    }
    return AuthorityCategory::Chunks;
}

std::string category_key(AuthorityCategory category) {
    switch (category) {
        case AuthorityCategory::Decisions: return "decisions";
        case AuthorityCategory::AnsweredQuestions: return "answered_questions";
        case AuthorityCategory::Assessments: return "assessments";
        case AuthorityCategory::RoadmapItems: return "roadmap_items";
        case AuthorityCategory::Gaps: return "gaps";
        case AuthorityCategory::Chunks: return "chunks";
        case AuthorityCategory::PendingQuestions: return "pending_questions";
    }
    return "unknown";
}

std::string category_title(AuthorityCategory category) {
    switch (category) {
        case AuthorityCategory::Decisions: return "RESOLVED DECISIONS";
        case AuthorityCategory::AnsweredQuestions: return "ANSWERED QUESTIONS";
        case AuthorityCategory::Assessments: return "ASSESSMENTS";
        case AuthorityCategory::RoadmapItems: return "ROADMAP ITEMS";
        case AuthorityCategory::Gaps: return "IDENTIFIED GAPS";
        case AuthorityCategory::Chunks: return "SOURCE EXCERPTS";
        case AuthorityCategory::PendingQuestions: return "OPEN QUESTIONS";
    }
    return "UNKNOWN";
}

const std::vector<AuthorityCategory>& all_categories() {
    static const std::vector<AuthorityCategory> categories = {
        AuthorityCategory::Decisions,
        AuthorityCategory::AnsweredQuestions,
        AuthorityCategory::Assessments,
        AuthorityCategory::RoadmapItems,
        AuthorityCategory::Gaps,
        AuthorityCategory::Chunks,
        AuthorityCategory::PendingQuestions
    };
    return categories;
}

bool outranks(AuthorityCategory a, AuthorityCategory b) {
    return authority_rank(a) < authority_rank(b);
}

} // namespace cg
