#include "tkgstats/processing/triple_stats_accumulator.hpp"
#include "tkgstats/statistics/summarizer.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace {

using tkgstats::DatasetType;
using tkgstats::Date;
using tkgstats::Ranking;
using tkgstats::Stats;
using tkgstats::Summarizer;
using tkgstats::Summary;

void check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << '\n';
    std::exit(1);
  }
}

void test_ties_keep_first_seen_order() {
  Stats stats;
  stats.relation_freq.add("a", 5);
  stats.relation_freq.add("b", 5);
  stats.relation_freq.add("c", 1);

  const Summary summary = Summarizer::summarize(stats, 2);
  const Ranking<std::string> expected = {{"a", 5}, {"b", 5}};
  check(summary.top_relations == expected, "tie broken by first insertion");

  Stats reversed;
  reversed.relation_freq.add("b", 5);
  reversed.relation_freq.add("a", 5);
  reversed.relation_freq.add("c", 1);
  const Ranking<std::string> expected_reversed = {{"b", 5}, {"a", 5}};
  check(Summarizer::summarize(reversed, 2).top_relations == expected_reversed,
        "insertion order decides, not key order");
}

void test_descending_counts() {
  Stats stats;
  stats.year_freq.add(1999, 1);
  stats.year_freq.add(2003, 7);
  stats.year_freq.add(2001, 3);

  const Summary summary = Summarizer::summarize(stats, 5);
  const Ranking<int64_t> expected = {{2003, 7}, {2001, 3}, {1999, 1}};
  check(summary.top_years == expected, "years ranked by count");
  check(summary.top_entities.empty(), "empty counter gives empty ranking");
}

void test_cardinalities_and_ranges() {
  tkgstats::TripleStatsAccumulator acc(DatasetType::EVENT_CALENDAR);
  acc.add_line("A\tr1\tB\t2014-05-01");
  acc.add_line("A\tr2\tC\t2014-01-15");
  acc.add_line("D\tr1\tA\t2014-12-31");
  const Stats stats = acc.finish();

  const Summary summary = Summarizer::summarize(stats, 5);
  check(summary.triples == 3, "triples copied");
  check(summary.unique_subjects == 2, "subject cardinality");
  check(summary.unique_objects == 3, "object cardinality");
  check(summary.unique_relations == 2, "relation cardinality");
  check(!summary.top_entities.empty() && summary.top_entities.front() == std::make_pair(std::string("A"), uint64_t{3}),
        "most frequent entity first");
  check(summary.min_date == Date(2014, 1, 15) && summary.max_date == Date(2014, 12, 31), "date range copied");
  check(summary.min_year == 2014 && summary.max_year == 2014, "year range copied");
  check(summary.temporal_markers.empty() && summary.temporal_records == 0, "no markers");
}

void test_does_not_mutate_input() {
  Stats stats;
  stats.entity_freq.add("x", 2);
  stats.entity_freq.add("y", 9);
  const Stats before = stats;

  Summarizer::summarize(stats, 1);
  check(stats == before, "summarize leaves stats unchanged");
  check(stats.entity_freq.entries().front().first == "x", "insertion order unchanged");
}

void test_zero_top_n() {
  Stats stats;
  stats.triples = 4;
  stats.subject_freq.add("s", 4);

  const Summary summary = Summarizer::summarize(stats, 0);
  check(summary.top_subjects.empty(), "top_n 0 gives empty rankings");
  check(summary.triples == 4, "totals still reported");
}

} // namespace

int main() {
  test_ties_keep_first_seen_order();
  test_descending_counts();
  test_cardinalities_and_ranges();
  test_does_not_mutate_input();
  test_zero_top_n();
  std::cout << "tkgstats summarizer tests passed\n";
  return 0;
}
