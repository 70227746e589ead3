#include "feed_filter.hpp"
#include "interest_updater.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <numeric>
#include <regex>

namespace {
    std::string trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    }

    std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    bool starts_with(const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    // pulls "top N" out of a show query, returns the leftover text
    std::string extract_top_k(const std::string& query, int& top_k) {
        static const std::regex top_re(R"(\btop\s+(\d+))", std::regex::icase);
        std::smatch m;
        if (!std::regex_search(query, m, top_re)) return query;

        // a count past INT_MAX already means "keep every post", so clamp instead of failing
        const std::string digits = m[1].str();
        long long n = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
        if (ec == std::errc::result_out_of_range || n > std::numeric_limits<int>::max()) {
            top_k = std::numeric_limits<int>::max();
        } else {
            top_k = static_cast<int>(n);
        }
        return trim(m.prefix().str() + m.suffix().str());
    }

    float score_or_zero(const InterestRanker& ranker, const std::string& post, const Eigen::RowVectorXf& query) {
        if (ranker.tokenizer().tokenize(post).empty()) return 0.0f;
        return ranker.score_with_query(post, query).score;
    }
}

std::optional<FeedFilter> parse_filter_command(const std::string& command, const InterestRanker& ranker) {
    const std::string text = trim(command);
    if (text.empty()) return std::nullopt;

    const std::string low = lower(text);

    FeedFilter filter;
    filter.mode = FeedFilter::Mode::Hide;
    filter.query = text;
    filter.top_k = ranker.config().default_top_k;
    filter.threshold = ranker.config().filter_threshold;

    if (starts_with(low, "hide ")) {
        filter.query = trim(text.substr(5));
    } else if (starts_with(low, "remove ")) {
        filter.query = trim(text.substr(7));
    } else if (starts_with(low, "only show ")) {
        filter.mode = FeedFilter::Mode::Show;
        filter.query = extract_top_k(trim(text.substr(10)), filter.top_k);
    } else if (starts_with(low, "show ") || starts_with(low, "only ")) {
        filter.mode = FeedFilter::Mode::Show;
        filter.query = extract_top_k(trim(text.substr(5)), filter.top_k);
    } else if (auto pos = low.find("only show "); pos != std::string::npos) {
        filter.mode = FeedFilter::Mode::Show;
        filter.query = extract_top_k(trim(text.substr(pos + 10)), filter.top_k);
    }

    filter.query_vector = mean_embedding(ranker.tokenizer(), ranker.embeddings(), filter.query);
    return filter;
}

std::vector<bool> apply_filters(const InterestRanker& ranker, const std::vector<std::string>& posts,
                                const std::vector<FeedFilter>& filters) {
    std::vector<bool> hidden(posts.size(), false);

    for (const auto& filter : filters) {
        std::vector<float> scores(posts.size());
        for (size_t i = 0; i < posts.size(); ++i) {
            scores[i] = score_or_zero(ranker, posts[i], filter.query_vector);
        }

        if (filter.mode == FeedFilter::Mode::Hide) {
            for (size_t i = 0; i < posts.size(); ++i) {
                if (scores[i] >= filter.threshold) hidden[i] = true;
            }
            continue;
        }

        // Show: everything past the top_k best goes
        std::vector<size_t> order(posts.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&scores](size_t a, size_t b) { return scores[a] > scores[b]; });

        size_t keep = static_cast<size_t>(std::max(filter.top_k, 0));
        for (size_t rank = keep; rank < order.size(); ++rank) hidden[order[rank]] = true;
    }

    return hidden;
}
