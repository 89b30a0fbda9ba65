#include "tkgstats/statistics/summarizer.hpp"

namespace tkgstats {

Summary Summarizer::summarize(const Stats &stats, size_t top_n) {
  Summary summary;

  summary.triples = stats.triples;
  summary.unique_subjects = stats.subjects.size();
  summary.unique_objects = stats.objects.size();
  summary.unique_relations = stats.relations.size();

  summary.top_entities = stats.entity_freq.most_common(top_n);
  summary.top_subjects = stats.subject_freq.most_common(top_n);
  summary.top_objects = stats.object_freq.most_common(top_n);
  summary.top_relations = stats.relation_freq.most_common(top_n);
  summary.top_years = stats.year_freq.most_common(top_n);
  summary.temporal_markers = stats.marker_freq.most_common(top_n);

  summary.temporal_records = stats.temporal_records;
  summary.min_date = stats.min_date;
  summary.max_date = stats.max_date;
  summary.min_year = stats.min_year;
  summary.max_year = stats.max_year;

  return summary;
}

} // namespace tkgstats
