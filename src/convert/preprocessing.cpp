#include "sqlport/convert/preprocessing.hpp"

#include <regex>
#include <vector>

namespace sqlport::convert {

std::string normalize_source_text(std::string_view text)
{
    constexpr std::string_view kBom = "\xEF\xBB\xBF";
    if (text.substr(0, kBom.size()) == kBom) {
        text.remove_prefix(kBom.size());
    }

    std::string normalized;
    normalized.reserve(text.size());
    for (std::size_t index = 0; index < text.size(); ++index) {
        const auto ch = text[index];
        if (ch == '\r') {
            normalized.push_back('\n');
            if (index + 1U < text.size() && text[index + 1U] == '\n') {
                ++index;
            }
        } else {
            normalized.push_back(ch);
        }
    }
    return normalized;
}

std::string strip_procedural_blocks(std::string_view text)
{
    static const std::regex kBegin(R"(^\s*BEGIN\b)", std::regex::ECMAScript | std::regex::icase);
    static const std::regex kEnd(R"(^\s*END\s*;?\s*$)", std::regex::ECMAScript | std::regex::icase);

    std::vector<std::string> kept;
    std::size_t depth = 0U;
    std::size_t start = 0U;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        const std::string line{text.substr(start, end - start)};

        if (std::regex_search(line, kBegin)) {
            ++depth;
        } else if (depth > 0U && std::regex_search(line, kEnd)) {
            --depth;
        } else if (depth == 0U) {
            kept.push_back(line);
        }

        if (end == text.size()) {
            break;
        }
        start = end + 1U;
    }

    std::string result;
    for (std::size_t index = 0; index < kept.size(); ++index) {
        if (index != 0U) {
            result.push_back('\n');
        }
        result += kept[index];
    }
    return result;
}

}  // namespace sqlport::convert
