#include "visualizer.hpp"

#include <algorithm>
#include <cstddef>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

int cell_weight(size_t most_requests_in_second, int columns) {
    if (columns < 1) {
        throw std::invalid_argument("columns must be positive");
    }
    double weight = std::nearbyint(static_cast<double>(most_requests_in_second) / columns);
    return std::max(1, static_cast<int>(weight));
}

std::string visualize_requests(const LoadResult& samples, int columns, bool color) {
    std::map<long long, std::vector<bool>> requests_per_second;
    if (!samples.empty()) {
        auto test_start = samples.front().start;
        for (const auto& sample : samples) {
            double offset = std::chrono::duration<double>(sample.start - test_start).count();
            requests_per_second[static_cast<long long>(std::floor(offset))].push_back(sample.success);
        }
    }

    size_t most_requests_in_second = 0;
    for (const auto& second : requests_per_second) {
        most_requests_in_second = std::max(most_requests_in_second, second.second.size());
    }
    int weight = cell_weight(most_requests_in_second, columns);

    std::ostringstream out;
    out << "\nThis chart is a visualization of the requests made, each row represents a second,\n"
        << "and each cell represents up to " << weight << " requests.\n"
        << "If a cell is solid, it means that at least half of its requests passed.\n";

    for (const auto& second : requests_per_second) {
        const std::vector<bool>& results = second.second;
        size_t ok = static_cast<size_t>(std::count(results.begin(), results.end(), true));
        size_t nok = results.size() - ok;

        std::string row;
        for (size_t begin = 0; begin < results.size(); begin += weight) {
            size_t end = std::min(results.size(), begin + static_cast<size_t>(weight));
            auto first = results.begin() + static_cast<std::ptrdiff_t>(begin);
            auto last = results.begin() + static_cast<std::ptrdiff_t>(end);
            size_t passed = static_cast<size_t>(std::count(first, last, true));
            bool solid = passed * 2 >= end - begin;
            if (color) row += solid ? "\033[32m" : "\033[31m";
            row += solid ? kSolidCell : kShadedCell;
            if (color) row += "\033[0m";
        }

        out << "t+" << std::left << std::setw(2) << second.first << " "
            << std::right << std::setw(4) << ok << " ok " << std::setw(4) << nok << " fail "
            << row << "\n";
    }
    return out.str();
}
