#pragma once
#include "attention.hpp"
#include "embedding_table.hpp"
#include "tokenizer.hpp"
#include "utils/config.hpp"

#include <Eigen/Dense>
#include <shared_mutex>
#include <string>
#include <vector>

struct ScoredContent {
    float score;
    Eigen::RowVectorXf attention_weights;  // one per word of the text
};

struct RankedPost {
    std::string text;
    float score;
    Eigen::RowVectorXf attention_weights;
};

// Owns the whole pipeline: tokenizer -> embedding table -> attention -> cosine score.
//
// The query vector is the only mutable state. update_interests() swaps it under an
// exclusive lock; every scoring call grabs a copy under a shared lock first, so one
// ranking pass always sees one consistent query even if an update lands mid-way.
class InterestRanker {
public:
    // Empty initializer -> gaussian_initializer(config.init_scale, config.seed).
    // Throws InvalidDimensionError before allocating anything if the config is bad.
    explicit InterestRanker(const RankerConfig& config, EmbeddingInitializer init = {});

    // Replaces the query with the mean of per-text mean embeddings.
    // On EmptyInputError the old query is left as it was.
    void update_interests(const std::vector<std::string>& interest_texts);

    // Throws EmptyInputError if the text has no words.
    ScoredContent score_content(const std::string& text) const;
    ScoredContent score_with_query(const std::string& text, const Eigen::RowVectorXf& query) const;

    // Keeps documents with score >= threshold, best first; ties keep input order.
    // Documents with no words can't be scored and are left out, so the result can be
    // shorter than the input even with threshold = -inf.
    std::vector<RankedPost> rank_posts(const std::vector<std::string>& documents, float threshold = 0.0f) const;

    // The k best documents regardless of score.
    std::vector<RankedPost> top_k(const std::vector<std::string>& documents, int k) const;

    Eigen::RowVectorXf query_vector() const;
    void set_query_vector(const Eigen::RowVectorXf& query);

    const RankerConfig& config() const { return _config; }
    const HashTokenizer& tokenizer() const { return _tokenizer; }
    const EmbeddingTable& embeddings() const { return _table; }
    const AttentionEngine& attention() const { return _attention; }

private:
    RankerConfig _config;
    HashTokenizer _tokenizer;
    EmbeddingTable _table;
    AttentionEngine _attention;

    Eigen::RowVectorXf _query;   // [embed_dim]
    mutable std::shared_mutex _query_mutex;

    ScoredContent score_tokens(const std::vector<int>& tokens, const Eigen::RowVectorXf& query) const;
    std::vector<RankedPost> score_all(const std::vector<std::string>& documents) const;
};
