#pragma once

#include "config.hpp"
#include <set>
#include <string>
#include <vector>

namespace scenereel {

// Ordered text phrases split into an action set and its complement, the
// context set. Both sets are non-empty.
class DescriptionVocabulary {
public:
    // Throws std::invalid_argument on an empty phrase list, an out-of-range
    // index, or a partition that leaves either set empty.
    DescriptionVocabulary(std::vector<std::string> phrases, std::set<size_t> action_indices);

    // The first `action_count` phrases are actions
    static DescriptionVocabulary with_leading_actions(std::vector<std::string> phrases,
                                                      size_t action_count = 10);

    static DescriptionVocabulary from_config(const VocabularyConfig& config);

    size_t size() const { return phrases_.size(); }
    const std::vector<std::string>& phrases() const { return phrases_; }
    const std::string& phrase(size_t index) const { return phrases_.at(index); }
    const std::set<size_t>& action_indices() const { return action_indices_; }
    const std::vector<size_t>& context_indices() const { return context_indices_; }
    bool is_action(size_t index) const { return action_indices_.count(index) > 0; }

private:
    std::vector<std::string> phrases_;
    std::set<size_t> action_indices_;
    std::vector<size_t> context_indices_;
};

} // namespace scenereel
