/**
 * @file pattern_suggester.hpp
 * @brief Keyword/regex dependency suggester.
 * @author Dimitris Kafetzis
 *
 * Recognized phrases (case-insensitive):
 *   "depends on X", "requires X", "needs X", "after X", "once X (is done)",
 *   "wait for X", "prerequisite: X"    → the task waits on X
 *   "before X", "prior to X", "then X", "followed by X"  → X waits on the task
 *
 * The phrase X is resolved against known tasks:
 *   exact id (first word or whole phrase)         → score 1.0
 *   otherwise |words(X) ∩ words(desc)| / |words(X)|, +0.5 when the
 *   description contains X verbatim, capped at 1.0
 * Only the best-scoring task per phrase is kept, and only if its score
 * reaches the similarity threshold.
 */

#pragma once

#include "suggest/dependency_suggester.hpp"

#include <regex>
#include <string>
#include <vector>

namespace dynamic_scheduler {

class PatternSuggester final : public IDependencySuggester {
public:
    explicit PatternSuggester(double similarity_threshold = 0.3);

    [[nodiscard]] std::vector<Suggestion> suggest(
        const TaskId& task_id,
        std::string_view description,
        const std::vector<KnownTask>& known) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "pattern"; }

    [[nodiscard]] double threshold() const noexcept { return threshold_; }

    /// Similarity of a captured phrase to a task description, in [0, 1].
    [[nodiscard]] static double similarity(std::string_view phrase, std::string_view description);

private:
    struct Rule {
        std::string label;
        std::regex expression;
        bool reversed;          ///< true: the matched task waits on the described one
    };

    double threshold_;
    std::vector<Rule> rules_;
};

}  // namespace dynamic_scheduler
