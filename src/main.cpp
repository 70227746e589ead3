#include "interest_ranker.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

void print_attention(const std::string& post, const RankedPost& ranked, const HashTokenizer& tokenizer) {
    std::vector<std::string> words = tokenizer.split_words(post);
    // only meaningful if every word got exactly one weight
    if (static_cast<Eigen::Index>(words.size()) != ranked.attention_weights.size()) return;

    std::cout << "   Attention: {";
    for (size_t i = 0; i < words.size(); ++i) {
        std::cout << words[i] << ": " << std::setprecision(3) << ranked.attention_weights[i];
        if (i + 1 < words.size()) std::cout << ", ";
    }
    std::cout << "}\n\n";
}

int main(int argc, char** argv) {
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [threshold] [embeddings.npy]\n";
        return 1;
    }

    try {
        RankerConfig config;
        float threshold = argc >= 2 ? std::stof(argv[1]) : 0.3f;

        EmbeddingInitializer init;
        if (argc == 3) {
            std::cout << "Loading embeddings from: " << argv[2] << std::endl;
            init = npy_initializer(argv[2]);
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        InterestRanker ranker(config, init);

        ranker.update_interests({
            "machine learning research",
            "AI safety alignment",
            "deep learning papers"
        });

        std::vector<std::string> posts = {
            "New paper on transformer attention mechanisms",
            "Check out this cute cat video!",
            "Breakthrough in reinforcement learning from human feedback",
            "My lunch today was amazing"
        };

        std::vector<RankedPost> ranked = ranker.rank_posts(posts, threshold);

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

        std::cout << "Ranked Posts (by relevance):\n\n";
        for (size_t i = 0; i < ranked.size(); ++i) {
            std::cout << i + 1 << ". [" << std::fixed << std::setprecision(3) << ranked[i].score << "] "
                      << ranked[i].text << "\n";
            std::cout.unsetf(std::ios::fixed);
            print_attention(ranked[i].text, ranked[i], ranker.tokenizer());
        }
        if (ranked.empty()) std::cout << "(nothing scored >= " << threshold << ")\n";

        std::cout << "Ranked " << posts.size() << " posts in " << duration.count() << "us\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
