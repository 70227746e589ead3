#pragma once
#include "embedding_table.hpp"
#include "tokenizer.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

// Mean of the token embeddings of one text. Throws EmptyInputError if the text has no words.
Eigen::RowVectorXf mean_embedding(const HashTokenizer& tokenizer, const EmbeddingTable& table, const std::string& text);

// New query = mean over texts of each text's mean embedding (mean of means, so a long
// interest doesn't outweigh a short one). Texts with no words are skipped; if nothing
// is left, throws EmptyInputError.
Eigen::RowVectorXf build_query_vector(const HashTokenizer& tokenizer, const EmbeddingTable& table,
                                      const std::vector<std::string>& interest_texts);
