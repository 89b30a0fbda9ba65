/**
 * @file stats_merger.hpp
 * @brief Order-independent combination of Stats values
 *
 * Merging is associative and commutative over the content of a Stats
 * value, so per-file results can be folded into a dataset aggregate in any
 * order. Only the first-seen order of frequency keys (used to break ranking
 * ties) follows the operand order: left keys first, then new right keys.
 */

#pragma once

#include "tkgstats/core/types.hpp"
#include <optional>
#include <vector>

namespace tkgstats {

class StatsMerger {
public:
  StatsMerger() = delete;  // Static class, no instances

  /**
   * Combine two Stats values into a new one
   *
   * - triples and temporal_records are summed
   * - subject/object/relation sets are united
   * - frequency counters are summed key by key
   * - each range bound is combined with merge_min / merge_max
   */
  static Stats merge(const Stats &left, const Stats &right);

  /// Same as merge(), reusing the storage of an expiring left operand
  static Stats merge(Stats &&left, const Stats &right);

  /// Left fold of merge() over `parts` (empty input gives an empty Stats)
  static Stats merge_all(const std::vector<Stats> &parts);

  /**
   * Optional-aware minimum
   *
   * An absent side adopts the other side unconditionally; two present
   * values give the smaller one.
   */
  template <typename T>
  static std::optional<T> merge_min(const std::optional<T> &a,
                                    const std::optional<T> &b) {
    if (!a) return b;
    if (!b) return a;
    return (*b < *a) ? b : a;
  }

  /// Optional-aware maximum (see merge_min)
  template <typename T>
  static std::optional<T> merge_max(const std::optional<T> &a,
                                    const std::optional<T> &b) {
    if (!a) return b;
    if (!b) return a;
    return (*a < *b) ? b : a;
  }

private:
  /// Fold `right` into `acc` in place (acc is a private copy)
  static void accumulate(Stats &acc, const Stats &right);

  template <typename Key>
  static void add_counter(FrequencyCounter<Key> &acc,
                          const FrequencyCounter<Key> &other) {
    for (const auto &entry : other.entries()) {
      acc.add(entry.first, entry.second);
    }
  }
};

} // namespace tkgstats
