#ifndef ARGROUTE_TOKEN_STREAM_HPP
#define ARGROUTE_TOKEN_STREAM_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace argroute {

// Ordered sequence of raw argument tokens for one invocation.
//
// Notes:
// - Tokens are never reordered. Stages may split, insert, erase or mark tokens consumed.
// - The stream is move-only: each stage takes ownership and hands it back through Staged<T, E>.
class TokenStream {
public:
    static constexpr std::string_view kEndOfOptions = "--";

    TokenStream() = default;
    explicit TokenStream(std::vector<std::string> tokens) {
        tokens_.reserve(tokens.size());
        for (auto& t : tokens) tokens_.push_back(Token{std::move(t), false});
    }

    // Skips argv[0] (the program name).
    static TokenStream fromArgv(int argc, char** argv) {
        std::vector<std::string> tokens;
        for (int i = 1; i < argc; ++i) tokens.emplace_back(argv[i]);
        return TokenStream(std::move(tokens));
    }

    TokenStream(const TokenStream&) = delete;
    TokenStream& operator=(const TokenStream&) = delete;
    TokenStream(TokenStream&&) noexcept = default;
    TokenStream& operator=(TokenStream&&) noexcept = default;

    // `-x`, `--name`, `--` look like options; `-` alone and `x` do not.
    static bool looksLikeOption(std::string_view token) { return token.size() >= 2 && token[0] == '-'; }

    [[nodiscard]] std::size_t size() const { return tokens_.size(); }

    [[nodiscard]] const std::string& at(std::size_t i) const { return tokens_.at(i).text; }
    [[nodiscard]] bool consumed(std::size_t i) const { return tokens_.at(i).consumed; }

    void consume(std::size_t i) { tokens_.at(i).consumed = true; }

    // Index of the first unconsumed token at or after `from`.
    [[nodiscard]] std::optional<std::size_t> next(std::size_t from = 0) const {
        for (std::size_t i = from; i < tokens_.size(); ++i) {
            if (!tokens_[i].consumed) return i;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool exhausted() const { return !next().has_value(); }

    [[nodiscard]] const std::string* peek() const {
        const auto i = next();
        if (!i) return nullptr;
        return &tokens_[*i].text;
    }

    // Removes the first unconsumed token and returns it.
    std::string pop() {
        const auto i = next();
        if (!i) throw std::out_of_range("pop on exhausted token stream");
        std::string out = std::move(tokens_[*i].text);
        tokens_.erase(tokens_.begin() + static_cast<std::ptrdiff_t>(*i));
        return out;
    }

    // Replaces token `i` with `parts`, in order. The parts inherit the consumed mark.
    void replace(std::size_t i, std::vector<std::string> parts) {
        const bool wasConsumed = tokens_.at(i).consumed;
        tokens_.erase(tokens_.begin() + static_cast<std::ptrdiff_t>(i));
        std::vector<Token> inserted;
        inserted.reserve(parts.size());
        for (auto& p : parts) inserted.push_back(Token{std::move(p), wasConsumed});
        tokens_.insert(tokens_.begin() + static_cast<std::ptrdiff_t>(i), inserted.begin(), inserted.end());
    }

    void insert(std::size_t i, std::string token) {
        if (i > tokens_.size()) throw std::out_of_range("insert position past end of token stream");
        tokens_.insert(tokens_.begin() + static_cast<std::ptrdiff_t>(i), Token{std::move(token), false});
    }

    void erase(std::size_t i) {
        if (i >= tokens_.size()) throw std::out_of_range("erase position past end of token stream");
        tokens_.erase(tokens_.begin() + static_cast<std::ptrdiff_t>(i));
    }

    [[nodiscard]] std::size_t unconsumedCount() const {
        std::size_t n = 0;
        for (const auto& t : tokens_) {
            if (!t.consumed) ++n;
        }
        return n;
    }

    [[nodiscard]] std::vector<std::string> unconsumed() const {
        std::vector<std::string> out;
        out.reserve(tokens_.size());
        for (const auto& t : tokens_) {
            if (!t.consumed) out.push_back(t.text);
        }
        return out;
    }

    [[nodiscard]] std::vector<std::string> tokens() const {
        std::vector<std::string> out;
        out.reserve(tokens_.size());
        for (const auto& t : tokens_) out.push_back(t.text);
        return out;
    }

private:
    struct Token {
        std::string text;
        bool consumed{false};
    };

    std::vector<Token> tokens_;
};

// What a pipeline stage hands back: the (possibly rewritten) stream plus either
// the stage's value or its typed failure.
template <typename T, typename E>
struct Staged {
    TokenStream stream;
    std::variant<T, E> outcome;

    [[nodiscard]] bool ok() const { return outcome.index() == 0; }

    T& value() { return std::get<0>(outcome); }
    const T& value() const { return std::get<0>(outcome); }
    E& error() { return std::get<1>(outcome); }
    const E& error() const { return std::get<1>(outcome); }
};

} // namespace argroute

#endif // ARGROUTE_TOKEN_STREAM_HPP
