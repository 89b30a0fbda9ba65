/**
 * @file summarizer.hpp
 * @brief Ranked read-only summary of a Stats value
 */

#pragma once

#include "tkgstats/core/types.hpp"
#include <cstddef>

namespace tkgstats {

class Summarizer {
public:
  Summarizer() = delete;  // Static class, no instances

  /**
   * Derive a Summary from `stats`
   *
   * Cardinalities of the identifier sets, the `top_n` most frequent keys of
   * every counter (descending, ties in first-seen order), totals and
   * date/year ranges copied verbatim. `stats` is not modified.
   *
   * @param stats Per-file or aggregate statistics
   * @param top_n Length of every ranking (0 gives empty rankings)
   */
  static Summary summarize(const Stats &stats, size_t top_n);
};

} // namespace tkgstats
