#include "interest_ranker.hpp"
#include "interest_updater.hpp"
#include "scorer.hpp"
#include "utils/errors.hpp"
#include "utils/tensor_utils.hpp"

#include <algorithm>
#include <mutex>

namespace {
    // runs before any member is built, so a bad config never allocates a table
    const RankerConfig& validated(const RankerConfig& config) {
        config.validate();
        return config;
    }
}

InterestRanker::InterestRanker(const RankerConfig& config, EmbeddingInitializer init)
    : _config(validated(config)),
      _tokenizer(config.vocab_size),
      _table(config.vocab_size, config.embed_dim,
             init ? init : gaussian_initializer(config.init_scale, config.seed)),
      _attention(config.embed_dim) {
    // different stream from the table so the query isn't just row 0
    _query = tensor_utils::random_1d(config.embed_dim, config.init_scale, config.seed + 1);
}

void InterestRanker::update_interests(const std::vector<std::string>& interest_texts) {
    // only reads the (immutable) table, no lock needed until the swap
    Eigen::RowVectorXf next = build_query_vector(_tokenizer, _table, interest_texts);

    std::unique_lock lock(_query_mutex);
    _query = std::move(next);
}

Eigen::RowVectorXf InterestRanker::query_vector() const {
    std::shared_lock lock(_query_mutex);
    return _query;
}

void InterestRanker::set_query_vector(const Eigen::RowVectorXf& query) {
    tensor_utils::assert_vector_shape(query, _config.embed_dim, "query vector");

    std::unique_lock lock(_query_mutex);
    _query = query;
}

ScoredContent InterestRanker::score_tokens(const std::vector<int>& tokens, const Eigen::RowVectorXf& query) const {
    AttentionResult attn = _attention.compute_attention(_table.lookup(tokens), query);
    float score = cosine_similarity(attn.context, query, _config.epsilon);
    return ScoredContent{score, std::move(attn.weights)};
}

ScoredContent InterestRanker::score_with_query(const std::string& text, const Eigen::RowVectorXf& query) const {
    std::vector<int> tokens = _tokenizer.tokenize(text);
    if (tokens.empty()) {
        throw EmptyInputError("score_content: text has no words");
    }
    return score_tokens(tokens, query);
}

ScoredContent InterestRanker::score_content(const std::string& text) const {
    return score_with_query(text, query_vector());
}

std::vector<RankedPost> InterestRanker::score_all(const std::vector<std::string>& documents) const {
    // one snapshot for the whole batch
    const Eigen::RowVectorXf query = query_vector();

    std::vector<RankedPost> scored;
    scored.reserve(documents.size());
    for (const auto& doc : documents) {
        std::vector<int> tokens = _tokenizer.tokenize(doc);
        if (tokens.empty()) continue;

        ScoredContent sc = score_tokens(tokens, query);
        scored.push_back(RankedPost{doc, sc.score, std::move(sc.attention_weights)});
    }
    return scored;
}

std::vector<RankedPost> InterestRanker::rank_posts(const std::vector<std::string>& documents, float threshold) const {
    std::vector<RankedPost> scored = score_all(documents);

    scored.erase(std::remove_if(scored.begin(), scored.end(),
                                [threshold](const RankedPost& p) { return !(p.score >= threshold); }),
                 scored.end());

    std::stable_sort(scored.begin(), scored.end(),
                     [](const RankedPost& a, const RankedPost& b) { return a.score > b.score; });
    return scored;
}

std::vector<RankedPost> InterestRanker::top_k(const std::vector<std::string>& documents, int k) const {
    std::vector<RankedPost> scored = score_all(documents);

    std::stable_sort(scored.begin(), scored.end(),
                     [](const RankedPost& a, const RankedPost& b) { return a.score > b.score; });

    if (k < 0) k = 0;
    if (scored.size() > static_cast<size_t>(k)) scored.resize(k);
    return scored;
}
