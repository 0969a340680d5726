#pragma once
#include <map>
#include <string>
#include <vector>

namespace Trawl {
namespace Utils {
namespace Text {

struct ExtractedPage {
    std::vector<std::string>           links;  // href values, document order, duplicates kept
    std::map<std::string, std::string> anchor_texts;  // href -> text of its first anchor
    std::string                        text;          // Visible text, whitespace collapsed
};

class Converter {
public:
    static ExtractedPage             extract(const std::string& html);
    static std::vector<std::string> extract_links(const std::string& html);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Trawl
