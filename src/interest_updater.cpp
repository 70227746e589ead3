#include "interest_updater.hpp"
#include "utils/errors.hpp"

Eigen::RowVectorXf mean_embedding(const HashTokenizer& tokenizer, const EmbeddingTable& table, const std::string& text) {
    std::vector<int> tokens = tokenizer.tokenize(text);
    if (tokens.empty()) {
        throw EmptyInputError("mean_embedding: text has no words");
    }
    return table.lookup(tokens).colwise().mean();
}

Eigen::RowVectorXf build_query_vector(const HashTokenizer& tokenizer, const EmbeddingTable& table,
                                      const std::vector<std::string>& interest_texts) {
    Eigen::RowVectorXf acc = Eigen::RowVectorXf::Zero(table.embed_dim());
    int used = 0;

    for (const auto& text : interest_texts) {
        std::vector<int> tokens = tokenizer.tokenize(text);
        if (tokens.empty()) continue;

        acc += table.lookup(tokens).colwise().mean();
        ++used;
    }

    if (used == 0) {
        throw EmptyInputError("update_interests: no interest text contains any words");
    }
    return acc / static_cast<float>(used);
}
