/**
 * @file PageRangeSelector.hpp
 * @brief Turns user-typed page specifications ("1-3, 5") into page numbers.
 */

#pragma once
#include <string>
#include <vector>

namespace submitkit::domain {

/**
 * @enum RangeMode
 * @brief How resolved pages are arranged.
 */
enum class RangeMode {
    Selection, ///< Sorted ascending, duplicates removed (split).
    Reorder    ///< Exact input order, duplicates kept (organise).
};

/**
 * @brief Stateless parser for page range specifications.
 *
 * Forgiving by construction: tokens that do not parse, reversed ranges and
 * pages outside [1, pageCount] are dropped, never reported.
 */
class PageRangeSelector {
public:
    /**
     * @brief Resolves a comma-separated list of pages and start-end ranges.
     * @param text Raw text, e.g. "2,4,6-8".
     * @param pageCount Number of pages in the target document.
     * @param mode Selection or Reorder semantics.
     * @return 1-based page numbers; empty when nothing resolves.
     */
    static std::vector<int> Parse(const std::string& text, int pageCount, RangeMode mode);

    /** @brief Converts 1-based page numbers to the 0-based indices used by the document model. */
    static std::vector<int> ToZeroBased(const std::vector<int>& pages);
};

} // namespace submitkit::domain
