#include <cassert>
#include <iostream>
#include <vector>

#include "domain/PageRangeSelector.hpp"

using namespace submitkit::domain;

namespace {
std::vector<int> Pages(std::initializer_list<int> values) { return std::vector<int>(values); }
}

int main() {
    std::cout << "[Test] Starting PageRangeSelector Test..." << std::endl;

    // Selection: sorted, unique, clamped to the document.
    assert(PageRangeSelector::Parse("2,4,6-8", 10, RangeMode::Selection) == Pages({2, 4, 6, 7, 8}));
    assert(PageRangeSelector::Parse("5,1-3,2", 10, RangeMode::Selection) == Pages({1, 2, 3, 5}));
    assert(PageRangeSelector::Parse(" 1 - 3 , 9 ", 10, RangeMode::Selection) == Pages({1, 2, 3, 9}));
    assert(PageRangeSelector::Parse("8-12", 10, RangeMode::Selection) == Pages({8, 9, 10}));
    std::cout << "[PASS] Selection mode sorts, de-duplicates and clamps." << std::endl;

    // Reorder keeps input order and duplicates.
    assert(PageRangeSelector::Parse("3,1,2", 3, RangeMode::Reorder) == Pages({3, 1, 2}));
    assert(PageRangeSelector::Parse("2,2,1", 3, RangeMode::Reorder) == Pages({2, 2, 1}));
    assert(PageRangeSelector::Parse("3-4,1", 5, RangeMode::Reorder) == Pages({3, 4, 1}));
    std::cout << "[PASS] Reorder mode keeps exact order." << std::endl;

    // Reversed ranges, junk and out-of-range pages are dropped silently.
    assert(PageRangeSelector::Parse("5-3", 10, RangeMode::Selection).empty());
    assert(PageRangeSelector::Parse("abc,,0,11", 10, RangeMode::Selection).empty());
    assert(PageRangeSelector::Parse("", 10, RangeMode::Reorder).empty());
    assert(PageRangeSelector::Parse("x,4", 10, RangeMode::Selection) == Pages({4}));
    assert(PageRangeSelector::Parse("1-3", 0, RangeMode::Selection).empty());
    assert(PageRangeSelector::Parse("99999999999", 10, RangeMode::Selection).empty());
    std::cout << "[PASS] Invalid tokens are dropped." << std::endl;

    // Leading-integer parse of each side of a range.
    assert(PageRangeSelector::Parse("2pages", 10, RangeMode::Selection) == Pages({2}));
    assert(PageRangeSelector::Parse("1-2-5", 10, RangeMode::Selection) == Pages({1, 2}));
    std::cout << "[PASS] Lenient number parsing." << std::endl;

    assert(PageRangeSelector::ToZeroBased(Pages({1, 3, 3})) == Pages({0, 2, 2}));
    std::cout << "[PASS] Zero-based conversion." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
