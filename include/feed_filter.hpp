#pragma once
#include "interest_ranker.hpp"
#include "utils/config.hpp"

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

struct FeedFilter {
    enum class Mode {
        Hide,   // hide every post scoring >= threshold
        Show,   // hide everything outside the top_k
    };

    std::string query;
    Mode mode = Mode::Hide;
    int top_k = 20;
    float threshold = 0.5f;

    // mean embedding of `query`, filled in by parse_filter_command
    Eigen::RowVectorXf query_vector;
};

// "hide crypto", "remove politics"      -> Hide, threshold = config.filter_threshold
// "show top 10 rust posts", "only cats" -> Show, top_k from "top N" or config.default_top_k
// "please only show cats"               -> Show
// anything else                         -> Hide on the whole text
// Returns nullopt for a blank command. Throws EmptyInputError if the query part is empty
// after stripping the keywords (e.g. "show top 5"). A "top N" past INT_MAX is clamped.
std::optional<FeedFilter> parse_filter_command(const std::string& command, const InterestRanker& ranker);

// hidden[i] is true if any filter hides posts[i]. Posts with no words score 0.
std::vector<bool> apply_filters(const InterestRanker& ranker, const std::vector<std::string>& posts,
                                const std::vector<FeedFilter>& filters);
