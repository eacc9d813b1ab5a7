#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace revscan {
namespace data {

// Minimal, permissive extraction over raw page markup. Selectors are
// "tag.class1.class2" style; matching is by tag name plus a class subset.
class HtmlScraper {
public:
    // Tolerates thousands separators, currency and percent signs.
    // Anything else unparsable yields empty, never zero.
    static std::optional<double> parseNumber(const std::string& text);

    // Tags removed, common entities decoded, whitespace collapsed and trimmed
    static std::string textContent(const std::string& html);

    // Inner markup of every element matching the selector, document order.
    // Nested matches are reported too.
    static std::vector<std::string> select(const std::string& html, const std::string& selector);

    static std::optional<std::string> selectFirstText(const std::string& html, const std::string& selector);

    // First value of `attribute="..."` anywhere in the markup
    static std::optional<std::string> firstAttribute(const std::string& html, const std::string& attribute);

    static std::optional<std::string> title(const std::string& html);

    // Label/value pairs from `div.gyFHrc` rows (first and last inner div) and
    // `table tr` rows (first and last td). Keys are lower-cased; later rows
    // overwrite earlier ones.
    static std::map<std::string, std::string> keyValuePairs(const std::string& html);

    // Bodies of every <script> element
    static std::vector<std::string> scriptBodies(const std::string& html);

private:
    struct Element {
        size_t open_begin;   // position of '<'
        size_t inner_begin;  // just past the opening tag's '>'
        size_t inner_end;    // position of the closing tag's '<' (or end of input)
        std::string attributes;
    };

    static std::vector<Element> findElements(const std::string& html, const std::string& tag);
    static bool hasClasses(const std::string& attributes, const std::vector<std::string>& classes);
    static std::string decodeEntities(const std::string& text);
};

} // namespace data
} // namespace revscan
