#pragma once

#include "graph/context_graph.hpp"
#include <string>
#include <vector>

namespace cg {

/**
 * @brief Authority categories, valued by rank (1 = highest authority)
 *
 * Higher-authority artifacts override lower ones when they conflict. Nothing
 * is deleted: a decision annotates the chunks it supersedes and consumers
 * flag them.
 */
enum class AuthorityCategory {
    Decisions = 1,
    AnsweredQuestions = 2,
    Assessments = 3,
    RoadmapItems = 4,
    Gaps = 5,
    Chunks = 6,
    PendingQuestions = 7
};

int authority_rank(AuthorityCategory category);

/**
 * @brief Category of a record; questions split on their status
 */
AuthorityCategory authority_category(const EntityRecord& record);

/**
 * @brief Result map key ("decisions", "answered_questions", ...)
 */
std::string category_key(AuthorityCategory category);

/**
 * @brief Section heading used in reports ("RESOLVED DECISIONS", ...)
 */
std::string category_title(AuthorityCategory category);

/**
 * @brief All categories, highest authority first
 */
const std::vector<AuthorityCategory>& all_categories();

/**
 * @brief True if @p a has strictly higher authority than @p b
 */
bool outranks(AuthorityCategory a, AuthorityCategory b);

} // namespace cg
