#pragma once
#include <string>
#include <utility>
#include <vector>

namespace Trawl {
namespace Utils {
namespace Text {

// Shell-style URL pattern, anchored against the whole input and case-sensitive.
//   *      any run of characters, '/' included
//   ?      exactly one character
//   [abc]  one character from the set, [!abc] negates, ranges like [a-z] allowed
// Every other character matches itself. Throws ConfigurationError on an
// empty pattern, an unterminated character class or a reversed range.
//
// Matching is iterative and runs in O(input * pattern) time with constant
// stack, so arbitrarily long URLs are safe.
class Glob {
public:
    explicit Glob(const std::string& pattern);

    bool               matches(const std::string& input) const;
    const std::string& pattern() const {
        return pattern_;
    }

private:
    enum class TokenKind { Literal, AnyChar, Star, Class };

    struct Token {
        TokenKind                          kind    = TokenKind::Literal;
        char                               literal = 0;
        bool                               negated = false;
        std::vector<std::pair<char, char>> ranges;

        bool accepts(char c) const;
    };

    std::string        pattern_;
    std::vector<Token> tokens_;

    void compile();
    size_t compile_class(size_t pos);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Trawl
