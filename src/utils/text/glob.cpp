#include "glob.hpp"
#include "../../core/errors/errors.hpp"

namespace Trawl {
namespace Utils {
namespace Text {

using Trawl::Core::ConfigurationError;

bool Glob::Token::accepts(char c) const {
    switch (kind) {
        case TokenKind::Literal:
            return c == literal;
        case TokenKind::AnyChar:
            return true;
        case TokenKind::Class: {
            bool hit = false;
            for (const auto& [lo, hi] : ranges) {
                if (c >= lo && c <= hi) {
                    hit = true;
                    break;
                }
            }
            return hit != negated;
        }
        case TokenKind::Star:
            break;
    }
    return false;
}

Glob::Glob(const std::string& pattern) : pattern_(pattern) {
    compile();
}

void Glob::compile() {
    if (pattern_.empty())
        throw ConfigurationError("Malformed URL pattern: empty pattern");

    for (size_t i = 0; i < pattern_.size(); ++i) {
        Token token;
        switch (pattern_[i]) {
            case '*':
                // Consecutive stars collapse into one
                if (!tokens_.empty() && tokens_.back().kind == TokenKind::Star)
                    continue;
                token.kind = TokenKind::Star;
                break;
            case '?':
                token.kind = TokenKind::AnyChar;
                break;
            case '[':
                i = compile_class(i + 1);
                continue;
            default:
                token.literal = pattern_[i];
        }
        tokens_.push_back(std::move(token));
    }
}

// Parses the body of a [...] class starting just after '['. Returns the index
// of the closing ']'.
size_t Glob::compile_class(size_t pos) {
    Token token;
    token.kind = TokenKind::Class;

    size_t i = pos;
    if (i < pattern_.size() && (pattern_[i] == '!' || pattern_[i] == '^')) {
        token.negated = true;
        ++i;
    }

    size_t end = pattern_.find(']', i < pattern_.size() && pattern_[i] == ']' ? i + 1 : i);
    if (end == std::string::npos)
        throw ConfigurationError("Malformed URL pattern (unterminated '['): " + pattern_);

    while (i < end) {
        char lo = pattern_[i];
        if (i + 2 < end && pattern_[i + 1] == '-') {
            char hi = pattern_[i + 2];
            if (lo > hi)
                throw ConfigurationError("Malformed URL pattern (reversed range): " + pattern_);
            token.ranges.emplace_back(lo, hi);
            i += 3;
        }
        else {
            token.ranges.emplace_back(lo, lo);
            ++i;
        }
    }

    tokens_.push_back(std::move(token));
    return end;
}

bool Glob::matches(const std::string& input) const {
    const size_t npos = std::string::npos;

    size_t t         = 0;
    size_t i         = 0;
    size_t star      = npos;
    size_t star_from = 0;

    while (i < input.size()) {
        if (t < tokens_.size() && tokens_[t].kind == TokenKind::Star) {
            star      = t++;
            star_from = i;
        }
        else if (t < tokens_.size() && tokens_[t].accepts(input[i])) {
            ++t;
            ++i;
        }
        else if (star != npos) {
            // Let the last star swallow one more character and retry
            t = star + 1;
            i = ++star_from;
        }
        else {
            return false;
        }
    }

    while (t < tokens_.size() && tokens_[t].kind == TokenKind::Star)
        ++t;
    return t == tokens_.size();
}

}  // namespace Text
}  // namespace Utils
}  // namespace Trawl
