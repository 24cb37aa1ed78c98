#include "rarity/parse/fields.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace rarity::parse {
    namespace {
        const std::regex& rank_matcher() {
            static const std::regex re(R"(Rank\s([0-9]+)\s/\s([0-9]+))");
            return re;
        }

        const std::regex& rarity_score_matcher() {
            static const std::regex re(R"(Rarity\sScore:\s([0-9.]+))");
            return re;
        }

        const std::regex& trait_matcher() {
            static const std::regex re(R"(([\w\s_-]+):\s([\w\s_-]+))");
            return re;
        }

        [[nodiscard]] bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        [[nodiscard]] bool parse_i64(const std::string& s, i64* out) noexcept {
            errno = 0;
            char* end = nullptr;
            const long long v = std::strtoll(s.c_str(), &end, 10);
            if (end == s.c_str() || *end != '\0' || errno != 0) {
                return false;
            }
            *out = static_cast<i64>(v);
            return true;
        }

        [[nodiscard]] bool parse_f64(const std::string& s, double* out) noexcept {
            if (s.empty()) {
                return false;
            }
            errno = 0;
            char* end = nullptr;
            const double v = std::strtod(s.c_str(), &end);
            if (end == s.c_str() || *end != '\0' || errno != 0) {
                return false;
            }
            *out = v;
            return true;
        }

        // First match of re in text. A regex engine failure (complexity/stack limits on
        // hostile input) is treated as no match.
        [[nodiscard]] bool search(std::string_view text, const std::regex& re, std::match_results<std::string_view::const_iterator>* m) noexcept {
            try {
                return std::regex_search(text.begin(), text.end(), *m, re);
            } catch (const std::regex_error&) {
                return false;
            }
        }
    } // namespace

    std::string_view trim(std::string_view text) noexcept {
        size_t b = 0;
        size_t e = text.size();
        while (b < e && is_space(text[b])) {
            ++b;
        }
        while (e > b && is_space(text[e - 1])) {
            --e;
        }
        return text.substr(b, e - b);
    }

    RankInfo parse_rank(std::string_view text) noexcept {
        RankInfo out{};
        std::match_results<std::string_view::const_iterator> m;
        if (!search(trim(text), rank_matcher(), &m)) {
            return out;
        }

        i64 rank = 0;
        i64 total = 0;
        // Digit-only groups; overflow is the only way these fail.
        if (!parse_i64(m[1].str(), &rank) || !parse_i64(m[2].str(), &total)) {
            return out;
        }
        out.rank = rank;
        out.total = total;
        return out;
    }

    double parse_rarity_score(std::string_view text) noexcept {
        std::match_results<std::string_view::const_iterator> m;
        if (!search(trim(text), rarity_score_matcher(), &m)) {
            return rarity::core::kMissingScore;
        }

        double score = 0.0;
        if (!parse_f64(m[1].str(), &score) || !std::isfinite(score)) {
            return rarity::core::kMissingScore;
        }
        return score;
    }

    TraitEntry parse_trait_entry(std::string_view text) noexcept {
        std::match_results<std::string_view::const_iterator> m;
        if (!search(trim(text), trait_matcher(), &m)) {
            return TraitEntry{};
        }
        return TraitEntry{m[1].str(), m[2].str()};
    }

    rarity::core::Status parse_percentage(std::string_view text, double* out) noexcept {
        if (out == nullptr) {
            return rarity::core::make_status(rarity::core::StatusDomain::Parse, rarity::core::StatusCode::Invalid);
        }

        std::string stripped;
        stripped.reserve(text.size());
        for (char c : text) {
            if (c != '%') {
                stripped.push_back(c);
            }
        }

        double v = 0.0;
        if (!parse_f64(std::string(trim(stripped)), &v) || !std::isfinite(v) || v < 0.0) {
            return rarity::core::make_status(rarity::core::StatusDomain::Parse, rarity::core::StatusCode::Malformed);
        }
        *out = v;
        return rarity::core::ok_status();
    }

} // namespace rarity::parse
