/**
 * @file stats_merger.cpp
 * @brief Implementation of the Stats combinator
 */

#include "tkgstats/statistics/stats_merger.hpp"
#include <utility>

namespace tkgstats {

Stats StatsMerger::merge(const Stats &left, const Stats &right) {
  Stats result = left;
  accumulate(result, right);
  return result;
}

Stats StatsMerger::merge(Stats &&left, const Stats &right) {
  Stats result = std::move(left);
  accumulate(result, right);
  return result;
}

Stats StatsMerger::merge_all(const std::vector<Stats> &parts) {
  Stats result;
  for (const auto &part : parts) {
    result = merge(std::move(result), part);
  }
  return result;
}

void StatsMerger::accumulate(Stats &acc, const Stats &right) {
  acc.triples += right.triples;
  acc.temporal_records += right.temporal_records;

  acc.subjects.insert(right.subjects.begin(), right.subjects.end());
  acc.objects.insert(right.objects.begin(), right.objects.end());
  acc.relations.insert(right.relations.begin(), right.relations.end());

  add_counter(acc.subject_freq, right.subject_freq);
  add_counter(acc.object_freq, right.object_freq);
  add_counter(acc.entity_freq, right.entity_freq);
  add_counter(acc.relation_freq, right.relation_freq);
  add_counter(acc.year_freq, right.year_freq);
  add_counter(acc.marker_freq, right.marker_freq);

  // Every bound independently: an empty side never blocks adoption of the
  // other side's min AND max
  acc.min_date = merge_min(acc.min_date, right.min_date);
  acc.max_date = merge_max(acc.max_date, right.max_date);
  acc.min_year = merge_min(acc.min_year, right.min_year);
  acc.max_year = merge_max(acc.max_year, right.max_year);
}

} // namespace tkgstats
