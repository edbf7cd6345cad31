#include "domain/PageRangeSelector.hpp"
#include <algorithm>
#include <cctype>
#include <optional>

namespace submitkit::domain {

namespace {
    void Trim(std::string& s) {
        s.erase(0, s.find_first_not_of(" \t\r\n"));
        s.erase(s.find_last_not_of(" \t\r\n") + 1);
    }

    // Leading-integer parse: "  7" and "7pages" give 7, "x7" gives nothing.
    std::optional<int> ParseLeadingInt(std::string text) {
        Trim(text);
        size_t i = 0;
        if (i < text.size() && text[i] == '+') ++i;
        long long value = 0;
        size_t digits = 0;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            value = value * 10 + (text[i] - '0');
            if (value > 1000000000LL) return std::nullopt;
            ++i;
            ++digits;
        }
        if (digits == 0) return std::nullopt;
        return static_cast<int>(value);
    }
}

std::vector<int> PageRangeSelector::Parse(const std::string& text, int pageCount, RangeMode mode) {
    std::vector<int> pages;
    if (pageCount <= 0) return pages;

    auto inBounds = [pageCount](int page) { return page >= 1 && page <= pageCount; };

    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string token = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        start = (comma == std::string::npos) ? text.size() + 1 : comma + 1;

        size_t dash = token.find('-');
        if (dash == std::string::npos) {
            auto page = ParseLeadingInt(token);
            if (page && inBounds(*page)) pages.push_back(*page);
            continue;
        }

        std::string rest = token.substr(dash + 1);
        size_t secondDash = rest.find('-');
        if (secondDash != std::string::npos) rest = rest.substr(0, secondDash);

        auto first = ParseLeadingInt(token.substr(0, dash));
        auto last = ParseLeadingInt(rest);
        if (!first || !last) continue;
        if (*first > *last) continue;

        int lo = std::max(*first, 1);
        int hi = std::min(*last, pageCount);
        for (int page = lo; page <= hi; ++page) {
            pages.push_back(page);
        }
    }

    if (mode == RangeMode::Selection) {
        std::sort(pages.begin(), pages.end());
        pages.erase(std::unique(pages.begin(), pages.end()), pages.end());
    }
    return pages;
}

std::vector<int> PageRangeSelector::ToZeroBased(const std::vector<int>& pages) {
    std::vector<int> indices;
    indices.reserve(pages.size());
    for (int page : pages) {
        indices.push_back(page - 1);
    }
    return indices;
}

} // namespace submitkit::domain
