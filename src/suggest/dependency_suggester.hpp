/**
 * @file dependency_suggester.hpp
 * @brief Interface for heuristics that infer dependency edges from text.
 * @author Dimitris Kafetzis
 *
 * Suggestions are advisory. apply_suggestions() routes every one of them
 * through DependencyGraph::add_dependency, so a suggested edge is accepted or
 * rejected exactly like an explicit one.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/dependency_graph.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dynamic_scheduler {

/// A task the suggester may link to.
struct KnownTask {
    TaskId id;
    std::string description;
};

/**
 * @brief Proposed edge: `dependent` waits on `dependency`.
 */
struct Suggestion {
    TaskId dependent;
    TaskId dependency;
    double score = 0.0;     ///< (0.0, 1.0], 1.0 for an exact id match
    std::string pattern;    ///< Phrase that produced it, e.g. "depends on"
};

struct SuggestionOutcome {
    std::vector<Suggestion> accepted;
    std::vector<std::pair<Suggestion, Error>> rejected;
};

/**
 * @brief Abstract interface for dependency suggesters (runtime polymorphism).
 */
class IDependencySuggester {
public:
    virtual ~IDependencySuggester() = default;

    /// Edges implied by `description` of task `task_id`. `known` lists the
    /// other tasks in the graph.
    [[nodiscard]] virtual std::vector<Suggestion> suggest(
        const TaskId& task_id,
        std::string_view description,
        const std::vector<KnownTask>& known) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Add every suggested edge to `graph`, collecting the ones it refuses.
 */
SuggestionOutcome apply_suggestions(DependencyGraph& graph,
                                    const std::vector<Suggestion>& suggestions);

}  // namespace dynamic_scheduler
