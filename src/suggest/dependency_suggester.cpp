/**
 * @file dependency_suggester.cpp
 * @brief apply_suggestions implementation.
 * @author Dimitris Kafetzis
 */

#include "suggest/dependency_suggester.hpp"

namespace dynamic_scheduler {

SuggestionOutcome apply_suggestions(DependencyGraph& graph,
                                    const std::vector<Suggestion>& suggestions) {
    SuggestionOutcome outcome;
    for (const auto& suggestion : suggestions) {
        auto added = graph.add_dependency(suggestion.dependent, suggestion.dependency);
        if (added) {
            outcome.accepted.push_back(suggestion);
        } else {
            outcome.rejected.emplace_back(suggestion, added.error());
        }
    }
    return outcome;
}

}  // namespace dynamic_scheduler
