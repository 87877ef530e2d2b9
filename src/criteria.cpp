#include "criteria.hpp"
#include "errors.hpp"
#include "font_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <unicode/utf8.h>

namespace FontGrep {

namespace {

constexpr uint32_t kMaxCodepoint = 0x10FFFF;

bool isSurrogate(uint32_t codepoint) {
    return codepoint >= 0xD800 && codepoint <= 0xDFFF;
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        items.push_back(trim(item));
    }
    // getline drops a trailing empty field
    if (!text.empty() && text.back() == ',') {
        items.emplace_back();
    }
    return items;
}

void sortUnique(std::vector<uint32_t>& values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

// Decodes UTF-8, returning false on malformed input
bool decodeUtf8(const std::string& text, std::vector<uint32_t>& out) {
    const auto* data = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = static_cast<int32_t>(text.size());
    int32_t index = 0;
    while (index < length) {
        UChar32 c;
        U8_NEXT(data, index, length, c);
        if (c < 0) return false;
        out.push_back(static_cast<uint32_t>(c));
    }
    return true;
}

uint32_t parseHexValue(const std::string& item, const std::string& list) {
    std::string digits = item;
    bool prefixed = digits.size() >= 2 && (digits[0] == 'U' || digits[0] == 'u') && digits[1] == '+';
    if (prefixed) {
        digits = digits.substr(2);
    }

    size_t minDigits = prefixed ? 1 : 2;
    if (digits.size() < minDigits || digits.size() > 8 ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        throw InvalidCriteriaError("invalid codepoint '" + item + "' in '" + list + "'");
    }

    unsigned long value = std::stoul(digits, nullptr, 16);
    if (value > kMaxCodepoint) {
        throw InvalidCriteriaError("codepoint '" + item + "' is beyond U+10FFFF");
    }
    return static_cast<uint32_t>(value);
}

template <typename T>
void appendUnique(std::vector<T>& values, T value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(std::move(value));
    }
}

} // anonymous namespace

const char* categoryName(TagCategory category) {
    switch (category) {
        case TagCategory::Axis: return "axis";
        case TagCategory::Feature: return "feature";
        case TagCategory::Script: return "script";
        case TagCategory::Table: return "table";
    }
    return "unknown";
}

std::string parseTag(const std::string& text, TagCategory category) {
    if (text.empty() || text.size() > 4) {
        throw InvalidCriteriaError(std::string("invalid ") + categoryName(category) +
                                   " tag '" + text + "': must be 1 to 4 characters");
    }
    for (unsigned char c : text) {
        if (c < 0x20 || c > 0x7E) {
            throw InvalidCriteriaError(std::string("invalid ") + categoryName(category) +
                                       " tag '" + text + "': only printable ASCII is allowed");
        }
    }

    std::string tag = text;
    tag.resize(4, ' ');

    if (category == TagCategory::Table && !isAllowListedTable(tag)) {
        throw InvalidCriteriaError("unsupported table tag '" + text + "'");
    }
    return tag;
}

std::vector<uint32_t> parseCodepoints(const std::string& text) {
    std::vector<uint32_t> result;

    for (const auto& item : splitList(text)) {
        if (item.empty()) {
            throw InvalidCriteriaError("empty codepoint item in '" + text + "'");
        }

        // A lone character stands for itself, "A" and "-" included
        std::vector<uint32_t> literal;
        if (decodeUtf8(item, literal) && literal.size() == 1) {
            result.push_back(literal.front());
            continue;
        }

        auto dash = item.find('-', 1);
        if (dash == std::string::npos) {
            uint32_t value = parseHexValue(item, text);
            if (isSurrogate(value)) {
                throw InvalidCriteriaError("surrogate codepoint '" + item + "' is not a character");
            }
            result.push_back(value);
            continue;
        }

        uint32_t first = parseHexValue(trim(item.substr(0, dash)), text);
        uint32_t last = parseHexValue(trim(item.substr(dash + 1)), text);
        if (first > last) {
            throw InvalidCriteriaError("range '" + item + "' has start after end");
        }
        for (uint32_t cp = first; cp <= last; ++cp) {
            if (!isSurrogate(cp)) {
                result.push_back(cp);
            }
        }
    }

    sortUnique(result);
    return result;
}

std::vector<uint32_t> textCodepoints(const std::string& text) {
    std::vector<uint32_t> result;
    if (!decodeUtf8(text, result)) {
        throw InvalidCriteriaError("text '" + text + "' is not valid UTF-8");
    }
    sortUnique(result);
    return result;
}

void CriteriaSet::addTags(TagCategory category, const std::string& commaList) {
    std::vector<std::string>* target = nullptr;
    switch (category) {
        case TagCategory::Axis: target = &axes; break;
        case TagCategory::Feature: target = &features; break;
        case TagCategory::Script: target = &scripts; break;
        case TagCategory::Table: target = &tables; break;
    }

    for (const auto& item : splitList(commaList)) {
        appendUnique(*target, parseTag(item, category));
    }
}

void CriteriaSet::addCodepointRanges(const std::string& ranges) {
    auto codepoints = parseCodepoints(ranges);
    if (!codepoints.empty()) {
        codepointSets.push_back(std::move(codepoints));
    }
}

void CriteriaSet::addText(const std::string& text) {
    auto codepoints = textCodepoints(text);
    if (!codepoints.empty()) {
        codepointSets.push_back(std::move(codepoints));
    }
}

void CriteriaSet::addNamePattern(const std::string& pattern) {
    try {
        NamePattern compiled;
        compiled.source = pattern;
        compiled.regex = std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
        namePatterns.push_back(std::move(compiled));
    } catch (const std::regex_error& e) {
        throw InvalidCriteriaError("invalid name pattern '" + pattern + "': " + e.what());
    }
}

const std::vector<std::string>& CriteriaSet::tags(TagCategory category) const {
    switch (category) {
        case TagCategory::Axis: return axes;
        case TagCategory::Feature: return features;
        case TagCategory::Script: return scripts;
        case TagCategory::Table: return tables;
    }
    return axes;
}

bool CriteriaSet::isEmpty() const {
    return axes.empty() && features.empty() && scripts.empty() && tables.empty() &&
           codepointSets.empty() && namePatterns.empty() && !variableOnly;
}

bool CriteriaSet::matchesNames(const std::set<std::string>& names) const {
    for (const auto& pattern : namePatterns) {
        bool found = std::any_of(names.begin(), names.end(), [&](const std::string& name) {
            return std::regex_search(name, pattern.regex);
        });
        if (!found) return false;
    }
    return true;
}

} // namespace FontGrep
