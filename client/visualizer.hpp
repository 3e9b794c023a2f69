#pragma once

#include <string>

#include "load_generator.hpp"

constexpr const char* kSolidCell = "█";
constexpr const char* kShadedCell = "░";

/**
 * @brief Requests a single chart cell stands for: round(most / columns),
 * at least 1. Ties round to even.
 */
int cell_weight(size_t most_requests_in_second, int columns);

/**
 * @brief Renders a per-second pass/fail chart of a run.
 *
 * Samples are grouped by whole seconds since the first sample. Each row
 * splits its second into chunks of cell_weight() requests; a chunk where at
 * least half passed is drawn solid, otherwise shaded.
 *
 * @param samples Samples ordered by start time.
 * @param columns Cells the busiest second should roughly fill.
 * @param color   Wrap cells in ANSI green/red.
 */
std::string visualize_requests(const LoadResult& samples, int columns = 10, bool color = false);
