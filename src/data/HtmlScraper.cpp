#include "data/HtmlScraper.h"
#include "common/StringUtils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace revscan {
namespace data {

namespace {
const std::string kRupeeSign = "\xE2\x82\xB9";

bool isTagNameEnd(char c) {
    return c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c));
}

// Position of the next "<tag" whose name ends right after, or npos
size_t findOpenTag(const std::string& lower, size_t from, const std::string& tag) {
    const std::string needle = "<" + tag;
    size_t pos = lower.find(needle, from);
    while (pos != std::string::npos) {
        const size_t after = pos + needle.size();
        if (after < lower.size() && isTagNameEnd(lower[after])) {
            return pos;
        }
        pos = lower.find(needle, pos + 1);
    }
    return std::string::npos;
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream iss(text);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

// Value of the first quoted `name=` attribute in `markup`, scanning
// linearly. The name must start the markup or follow '<' or whitespace.
std::optional<std::string> attributeValue(const std::string& markup, const std::string& name) {
    const std::string lower = utils::toLower(markup);
    const std::string needle = utils::toLower(name);
    size_t pos = lower.find(needle);
    while (pos != std::string::npos) {
        const bool starts_name = pos == 0 || lower[pos - 1] == '<' ||
                                 std::isspace(static_cast<unsigned char>(lower[pos - 1]));
        size_t cursor = pos + needle.size();
        while (cursor < markup.size() && std::isspace(static_cast<unsigned char>(markup[cursor]))) {
            ++cursor;
        }
        if (starts_name && cursor < markup.size() && markup[cursor] == '=') {
            ++cursor;
            while (cursor < markup.size() && std::isspace(static_cast<unsigned char>(markup[cursor]))) {
                ++cursor;
            }
            if (cursor < markup.size() && (markup[cursor] == '"' || markup[cursor] == '\'')) {
                const char quote = markup[cursor];
                const size_t close = markup.find(quote, cursor + 1);
                if (close != std::string::npos) {
                    return markup.substr(cursor + 1, close - cursor - 1);
                }
            }
        }
        pos = lower.find(needle, pos + 1);
    }
    return std::nullopt;
}

struct SimpleSelector {
    std::string tag;
    std::vector<std::string> classes;
};

SimpleSelector parseSimpleSelector(const std::string& text) {
    SimpleSelector sel;
    size_t dot = text.find('.');
    sel.tag = utils::toLower(text.substr(0, dot));
    while (dot != std::string::npos) {
        size_t next = text.find('.', dot + 1);
        std::string cls = text.substr(dot + 1, next == std::string::npos ? std::string::npos : next - dot - 1);
        if (!cls.empty()) {
            sel.classes.push_back(cls);
        }
        dot = next;
    }
    return sel;
}
}

std::optional<double> HtmlScraper::parseNumber(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text.compare(i, kRupeeSign.size(), kRupeeSign) == 0) {
            i += kRupeeSign.size() - 1;
            continue;
        }
        const char c = text[i];
        if (c == ',' || c == '$' || c == '%') {
            continue;
        }
        cleaned.push_back(c);
    }
    cleaned = utils::trim(cleaned);
    if (cleaned.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    const double value = std::strtod(cleaned.c_str(), &end);
    if (end != cleaned.c_str() + cleaned.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string HtmlScraper::decodeEntities(const std::string& text) {
    static const std::pair<const char*, const char*> kEntities[] = {
        {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""},
        {"&#39;", "'"}, {"&#x27;", "'"}, {"&apos;", "'"}, {"&nbsp;", " "},
        {"&#8377;", "\xE2\x82\xB9"},
    };

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& [entity, replacement] : kEntities) {
                const size_t len = std::char_traits<char>::length(entity);
                if (text.compare(i, len, entity) == 0) {
                    out += replacement;
                    i += len;
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            out.push_back(text[i]);
            ++i;
        }
    }
    return out;
}

std::string HtmlScraper::textContent(const std::string& html) {
    std::string stripped;
    stripped.reserve(html.size());
    bool in_tag = false;
    for (char c : html) {
        if (c == '<') {
            in_tag = true;
            stripped.push_back(' ');
        } else if (c == '>' && in_tag) {
            in_tag = false;
        } else if (!in_tag) {
            stripped.push_back(c);
        }
    }

    const std::string decoded = decodeEntities(stripped);
    std::string collapsed;
    collapsed.reserve(decoded.size());
    bool pending_space = false;
    for (char c : decoded) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !collapsed.empty();
            continue;
        }
        if (pending_space) {
            collapsed.push_back(' ');
            pending_space = false;
        }
        collapsed.push_back(c);
    }
    return collapsed;
}

std::vector<HtmlScraper::Element> HtmlScraper::findElements(const std::string& html, const std::string& tag) {
    std::vector<Element> elements;
    const std::string lower = utils::toLower(html);
    const std::string close_needle = "</" + tag;

    size_t pos = findOpenTag(lower, 0, tag);
    while (pos != std::string::npos) {
        const size_t tag_end = lower.find('>', pos);
        if (tag_end == std::string::npos) {
            break;
        }

        Element el;
        el.open_begin = pos;
        el.inner_begin = tag_end + 1;
        el.attributes = html.substr(pos + 1 + tag.size(), tag_end - pos - 1 - tag.size());

        if (tag_end > pos && lower[tag_end - 1] == '/') {
            el.inner_end = el.inner_begin;
        } else {
            int depth = 1;
            size_t cursor = el.inner_begin;
            el.inner_end = html.size();
            while (depth > 0) {
                const size_t next_open = findOpenTag(lower, cursor, tag);
                const size_t next_close = lower.find(close_needle, cursor);
                if (next_close == std::string::npos) {
                    break;
                }
                if (next_open != std::string::npos && next_open < next_close) {
                    ++depth;
                    cursor = next_open + 1;
                } else {
                    --depth;
                    if (depth == 0) {
                        el.inner_end = next_close;
                    }
                    cursor = next_close + 1;
                }
            }
        }

        elements.push_back(std::move(el));
        pos = findOpenTag(lower, tag_end + 1, tag);
    }
    return elements;
}

bool HtmlScraper::hasClasses(const std::string& attributes, const std::vector<std::string>& classes) {
    if (classes.empty()) {
        return true;
    }
    const auto value = attributeValue(attributes, "class");
    if (!value) {
        return false;
    }
    const auto present = splitWhitespace(*value);
    for (const auto& cls : classes) {
        if (std::find(present.begin(), present.end(), cls) == present.end()) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> HtmlScraper::select(const std::string& html, const std::string& selector) {
    const auto parts = splitWhitespace(selector);
    if (parts.empty()) {
        return {};
    }

    std::vector<std::string> scopes{html};
    for (const auto& part : parts) {
        const SimpleSelector sel = parseSimpleSelector(part);
        std::vector<std::string> next;
        for (const auto& scope : scopes) {
            for (const auto& el : findElements(scope, sel.tag)) {
                if (hasClasses(el.attributes, sel.classes)) {
                    next.push_back(scope.substr(el.inner_begin, el.inner_end - el.inner_begin));
                }
            }
        }
        scopes = std::move(next);
    }
    return scopes;
}

std::optional<std::string> HtmlScraper::selectFirstText(const std::string& html, const std::string& selector) {
    const auto matches = select(html, selector);
    if (matches.empty()) {
        return std::nullopt;
    }
    return textContent(matches.front());
}

std::optional<std::string> HtmlScraper::firstAttribute(const std::string& html, const std::string& attribute) {
    const auto value = attributeValue(html, attribute);
    if (!value) {
        return std::nullopt;
    }
    return decodeEntities(*value);
}

std::optional<std::string> HtmlScraper::title(const std::string& html) {
    return selectFirstText(html, "title");
}

std::map<std::string, std::string> HtmlScraper::keyValuePairs(const std::string& html) {
    std::map<std::string, std::string> kv;

    for (const auto& row : select(html, "div.gyFHrc")) {
        const auto cols = select(row, "div");
        if (cols.size() >= 2) {
            kv[utils::toLower(textContent(cols.front()))] = textContent(cols.back());
        }
    }

    for (const auto& row : select(html, "table tr")) {
        const auto cells = select(row, "td");
        if (cells.size() >= 2) {
            kv[utils::toLower(textContent(cells.front()))] = textContent(cells.back());
        }
    }
    return kv;
}

std::vector<std::string> HtmlScraper::scriptBodies(const std::string& html) {
    std::vector<std::string> bodies;
    for (const auto& el : findElements(html, "script")) {
        bodies.push_back(html.substr(el.inner_begin, el.inner_end - el.inner_begin));
    }
    return bodies;
}

} // namespace data
} // namespace revscan
