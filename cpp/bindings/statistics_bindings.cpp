/**
 * @file statistics_bindings.cpp
 * @brief Python bindings for Stats, Summary and their combinators
 */

#include "tkgstats/core/types.hpp"
#include "tkgstats/data/report_writer.hpp"
#include "tkgstats/statistics/stats_merger.hpp"
#include "tkgstats/statistics/summarizer.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace tkgstats;

namespace {

/// Counter entries as a list of (key, count) in first-seen order
template <typename Key>
std::vector<std::pair<Key, uint64_t>> counter_entries(const FrequencyCounter<Key> &c) {
  return c.entries();
}

} // namespace

void bind_statistics(py::module_ &m) {
  // Stats structure
  py::class_<Stats>(m, "Stats")
      .def(py::init<>())
      .def_readonly("triples", &Stats::triples, "Number of accepted lines")
      .def_readonly("subjects", &Stats::subjects, "Unique subjects")
      .def_readonly("objects", &Stats::objects, "Unique objects")
      .def_readonly("relations", &Stats::relations, "Unique relations")
      .def_property_readonly("subject_freq", [](const Stats &s) {
        return counter_entries(s.subject_freq);
      })
      .def_property_readonly("object_freq", [](const Stats &s) {
        return counter_entries(s.object_freq);
      })
      .def_property_readonly("entity_freq", [](const Stats &s) {
        return counter_entries(s.entity_freq);
      })
      .def_property_readonly("relation_freq", [](const Stats &s) {
        return counter_entries(s.relation_freq);
      })
      .def_property_readonly("year_freq", [](const Stats &s) {
        return counter_entries(s.year_freq);
      })
      .def_property_readonly("marker_freq", [](const Stats &s) {
        return counter_entries(s.marker_freq);
      })
      .def_readonly("temporal_records", &Stats::temporal_records,
                    "Lines carrying an explicit temporal marker")
      .def_readonly("min_date", &Stats::min_date)
      .def_readonly("max_date", &Stats::max_date)
      .def_readonly("min_year", &Stats::min_year)
      .def_readonly("max_year", &Stats::max_year)
      .def("__eq__", &Stats::operator==)
      .def("__repr__", [](const Stats &s) {
        return "<Stats triples=" + std::to_string(s.triples) +
               " subjects=" + std::to_string(s.subjects.size()) +
               " objects=" + std::to_string(s.objects.size()) +
               " relations=" + std::to_string(s.relations.size()) +
               " temporal_records=" + std::to_string(s.temporal_records) + ">";
      });

  // Summary structure
  py::class_<Summary>(m, "Summary")
      .def(py::init<>())
      .def_readonly("triples", &Summary::triples)
      .def_readonly("unique_subjects", &Summary::unique_subjects)
      .def_readonly("unique_objects", &Summary::unique_objects)
      .def_readonly("unique_relations", &Summary::unique_relations)
      .def_readonly("top_entities", &Summary::top_entities)
      .def_readonly("top_subjects", &Summary::top_subjects)
      .def_readonly("top_objects", &Summary::top_objects)
      .def_readonly("top_relations", &Summary::top_relations)
      .def_readonly("top_years", &Summary::top_years)
      .def_readonly("temporal_markers", &Summary::temporal_markers)
      .def_readonly("temporal_records", &Summary::temporal_records)
      .def_readonly("min_date", &Summary::min_date)
      .def_readonly("max_date", &Summary::max_date)
      .def_readonly("min_year", &Summary::min_year)
      .def_readonly("max_year", &Summary::max_year)
      .def("__eq__", &Summary::operator==)
      .def(
          "to_json",
          [](const Summary &s) {
            return ReportWriter::dump(ReportWriter::summary_to_json(s));
          },
          "JSON object of the summary (string)");

  m.def(
      "merge_stats",
      [](const Stats &left, const Stats &right) {
        return StatsMerger::merge(left, right);
      },
      py::arg("left"), py::arg("right"),
      R"pbdoc(
            Combine two Stats values into a new one.

            Counts and frequencies are summed, identifier sets united and
            date/year ranges widened. The result does not depend on the
            operand order (apart from ranking tie order).
        )pbdoc");

  m.def("summarize", &Summarizer::summarize, py::arg("stats"),
        py::arg("top_n") = 5,
        R"pbdoc(
            Ranked summary of a Stats value.

            Args:
                stats: Per-file or aggregate statistics
                top_n: Length of every ranking (default: 5)
        )pbdoc");
}
