/**
 * @file pattern_suggester.cpp
 * @brief PatternSuggester implementation.
 * @author Dimitris Kafetzis
 */

#include "suggest/pattern_suggester.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <string_view>

namespace dynamic_scheduler {

namespace {

// Characters that close the clause following a trigger.
constexpr const char* CLAUSE_END = ",;!?\n";

const std::set<std::string> STOP_WORDS = {
    "a", "an", "the", "is", "are", "be", "been", "done", "finished", "complete",
    "completed", "task", "step", "of", "to", "and", "with", "for", "has", "have", "it"
};

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim_phrase(std::string_view text) {
    auto is_trailing = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) || c == '.';
    };
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_trailing(text.back())) {
        text.remove_suffix(1);
    }
    return std::string(text);
}

std::set<std::string> content_words(std::string_view text) {
    std::set<std::string> words;
    std::string current;
    auto flush = [&] {
        if (!current.empty() && !STOP_WORDS.contains(current)) words.insert(current);
        current.clear();
    };
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else {
            flush();
        }
    }
    flush();
    return words;
}

std::string first_word(const std::string& phrase) {
    std::istringstream in(phrase);
    std::string word;
    in >> word;
    while (!word.empty() && word.back() == '.') word.pop_back();
    return word;
}

}  // anonymous namespace

PatternSuggester::PatternSuggester(double similarity_threshold)
    : threshold_(similarity_threshold) {
    auto rule = [](std::string label, const std::string& trigger, bool reversed) {
        return Rule{std::move(label),
                    std::regex(trigger, std::regex::ECMAScript | std::regex::icase),
                    reversed};
    };

    // Triggers only; the clause after each match is cut out in suggest().
    rules_.push_back(rule("depends on", R"(\bdepends?\s{1,8}on\b)", false));
    rules_.push_back(rule("requires", R"(\brequires?\b)", false));
    rules_.push_back(rule("needs", R"(\bneeds?\b)", false));
    rules_.push_back(rule("after", R"(\bafter\b)", false));
    rules_.push_back(rule("once", R"(\bonce\b)", false));
    rules_.push_back(rule("wait for", R"(\bwaits?\s{1,8}for\b)", false));
    rules_.push_back(rule("prerequisite", R"(\bprerequisites?\s{0,8}:)", false));
    rules_.push_back(rule("before", R"(\bbefore\b)", true));
    rules_.push_back(rule("prior to", R"(\bprior\s{1,8}to\b)", true));
    rules_.push_back(rule("then", R"(\bthen\b)", true));
    rules_.push_back(rule("followed by", R"(\bfollowed\s{1,8}by\b)", true));
}

double PatternSuggester::similarity(std::string_view phrase, std::string_view description) {
    auto phrase_words = content_words(phrase);
    if (phrase_words.empty()) return 0.0;

    auto desc_words = content_words(description);
    size_t overlap = 0;
    for (const auto& word : phrase_words) {
        if (desc_words.contains(word)) ++overlap;
    }

    double score = static_cast<double>(overlap) / static_cast<double>(phrase_words.size());

    auto needle = lowercase(trim_phrase(phrase));
    if (!needle.empty() && lowercase(description).find(needle) != std::string::npos) {
        score += 0.5;
    }
    return std::min(score, 1.0);
}

std::vector<Suggestion> PatternSuggester::suggest(const TaskId& task_id,
                                                  std::string_view description,
                                                  const std::vector<KnownTask>& known) const {
    std::vector<Suggestion> suggestions;
    const std::string text(description);

    auto record = [&](Suggestion candidate) {
        auto same_edge = [&candidate](const Suggestion& s) {
            return s.dependent == candidate.dependent && s.dependency == candidate.dependency;
        };
        auto it = std::find_if(suggestions.begin(), suggestions.end(), same_edge);
        if (it == suggestions.end()) {
            suggestions.push_back(std::move(candidate));
        } else if (candidate.score > it->score) {
            *it = std::move(candidate);
        }
    };

    for (const auto& rule : rules_) {
        for (std::sregex_iterator it(text.begin(), text.end(), rule.expression), end;
             it != end; ++it) {
            auto from = static_cast<size_t>(it->position() + it->length());
            auto to = text.find_first_of(CLAUSE_END, from);
            auto clause = std::string_view(text).substr(from, to == std::string::npos
                                                                  ? std::string_view::npos
                                                                  : to - from);
            auto phrase = trim_phrase(clause);
            if (phrase.empty()) continue;

            auto head = first_word(phrase);
            const KnownTask* best = nullptr;
            double best_score = 0.0;

            for (const auto& candidate : known) {
                if (candidate.id == task_id) continue;

                if (candidate.id == head || candidate.id == phrase) {
                    best = &candidate;
                    best_score = 1.0;
                    break;
                }
                double score = similarity(phrase, candidate.description);
                if (score > best_score) {
                    best_score = score;
                    best = &candidate;
                }
            }

            if (!best || best_score < threshold_) continue;

            Suggestion suggestion{
                .dependent = rule.reversed ? best->id : task_id,
                .dependency = rule.reversed ? task_id : best->id,
                .score = best_score,
                .pattern = rule.label
            };
            record(std::move(suggestion));
        }
    }
    return suggestions;
}

}  // namespace dynamic_scheduler
