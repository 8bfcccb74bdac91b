#include "description_vocabulary.hpp"
#include <stdexcept>

namespace scenereel {

DescriptionVocabulary::DescriptionVocabulary(std::vector<std::string> phrases,
                                             std::set<size_t> action_indices)
    : phrases_(std::move(phrases)), action_indices_(std::move(action_indices)) {
    if (phrases_.empty()) {
        throw std::invalid_argument("Vocabulary needs at least one phrase");
    }
    for (const auto& phrase : phrases_) {
        if (phrase.empty()) {
            throw std::invalid_argument("Vocabulary phrases must not be empty");
        }
    }
    if (action_indices_.empty()) {
        throw std::invalid_argument("Vocabulary needs at least one action phrase");
    }
    if (*action_indices_.rbegin() >= phrases_.size()) {
        throw std::invalid_argument("Action index " + std::to_string(*action_indices_.rbegin()) +
                                    " is out of range for " + std::to_string(phrases_.size()) + " phrases");
    }

    for (size_t i = 0; i < phrases_.size(); ++i) {
        if (!is_action(i)) {
            context_indices_.push_back(i);
        }
    }
    if (context_indices_.empty()) {
        throw std::invalid_argument("Vocabulary needs at least one context phrase");
    }
}

DescriptionVocabulary DescriptionVocabulary::with_leading_actions(std::vector<std::string> phrases,
                                                                  size_t action_count) {
    std::set<size_t> indices;
    for (size_t i = 0; i < action_count && i < phrases.size(); ++i) {
        indices.insert(i);
    }
    return DescriptionVocabulary(std::move(phrases), std::move(indices));
}

DescriptionVocabulary DescriptionVocabulary::from_config(const VocabularyConfig& config) {
    return DescriptionVocabulary(config.phrases,
                                 std::set<size_t>(config.action_indices.begin(), config.action_indices.end()));
}

} // namespace scenereel
