#include "tkgstats/core/types.hpp"
#include "tkgstats/data/dataset_type.hpp"
#include "tkgstats/data/report_writer.hpp"
#include "tkgstats/processing/temporal_extractor.hpp"
#include "tkgstats/processing/triple_stats_accumulator.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include <string>
#include <string_view>
#include <vector>

namespace py = pybind11;
using namespace tkgstats;

/// Initialize line-level Python bindings
void init_data_bindings(py::module &m) {

  // ===== DatasetType Enum =====
  py::enum_<DatasetType>(m, "DatasetType", "Temporal column conventions")
      .value("EVENT_CALENDAR", DatasetType::EVENT_CALENDAR,
             "Column 4 is a YYYY-MM-DD date")
      .value("LINKED_DATA", DatasetType::LINKED_DATA,
             "Column 4 is a marker, column 5 a year")
      .value("FACT_EXTRACTION", DatasetType::FACT_EXTRACTION,
             "Column 4 is a <marker>, column 5 a quoted date")
      .value("GENERIC", DatasetType::GENERIC, "No temporal extraction")
      .export_values();

  m.def("classify_dataset",
        [](const std::string &name) { return classify_dataset(name); },
        py::arg("dataset_name"),
        "Classify a dataset directory name (case-insensitive substring match)");

  m.def("dataset_type_name", &dataset_type_name, py::arg("type"),
        "Stable lowercase name of a DatasetType");

  // ===== Date =====
  py::class_<Date>(m, "Date", "Calendar date")
      .def(py::init<>())
      .def(py::init<int, int, int>(), py::arg("year"), py::arg("month"),
           py::arg("day"))
      .def_readonly("year", &Date::year)
      .def_readonly("month", &Date::month)
      .def_readonly("day", &Date::day)
      .def("__eq__", &Date::operator==)
      .def("__lt__", &Date::operator<)
      .def("__str__", &Date::to_string)
      .def("__repr__", [](const Date &d) {
        return "<Date " + d.to_string() + ">";
      });

  // ===== TemporalFields =====
  py::class_<TemporalFields>(m, "TemporalFields",
                             "Temporal contribution of one row")
      .def(py::init<>())
      .def_readonly("marker", &TemporalFields::marker)
      .def_readonly("year", &TemporalFields::year)
      .def_readonly("date", &TemporalFields::date)
      .def("is_temporal_record", &TemporalFields::is_temporal_record)
      .def("empty", &TemporalFields::empty);

  m.def(
      "extract_temporal_fields",
      [](const std::vector<std::string> &columns, DatasetType type) {
        std::vector<std::string_view> views(columns.begin(), columns.end());
        return TemporalExtractor::extract(views, type);
      },
      py::arg("columns"), py::arg("type"),
      R"pbdoc(
            Extract the temporal fields of a tab-split row.

            Args:
                columns: All columns of the row (subject, relation, object, ...)
                type: DatasetType of the dataset

            Returns:
                TemporalFields (marker, year and date may each be None)

            Example:
                >>> f = extract_temporal_fields(
                ...     ["A", "rel", "B", "since", "1990"], DatasetType.LINKED_DATA)
                >>> f.marker, f.year
                ('since', 1990)
        )pbdoc");

  m.def(
      "parse_date",
      [](const std::string &token) { return TemporalExtractor::parse_date(token); },
      py::arg("token"), "Parse a YYYY-MM-DD date, None when invalid");

  // ===== TripleStatsAccumulator =====
  py::class_<TripleStatsAccumulator>(m, "TripleStatsAccumulator",
                                     "Builds the Stats of one split file")
      .def(py::init<DatasetType>(), py::arg("type"))
      .def(
          "add_line",
          [](TripleStatsAccumulator &acc, const std::string &line) {
            return acc.add_line(line);
          },
          py::arg("line"),
          "Add one raw line; returns True when it was counted as a triple")
      .def_property_readonly(
          "stats", [](const TripleStatsAccumulator &acc) { return acc.stats(); },
          "Copy of the statistics gathered so far")
      .def("finish", &TripleStatsAccumulator::finish,
           "Hand over the statistics and reset the accumulator")
      .def_property_readonly("type", &TripleStatsAccumulator::type)
      .def_static("process_file", &TripleStatsAccumulator::process_file,
                  py::arg("path"), py::arg("type"),
                  "Stream a whole split file into a Stats value");

  // ===== Presentation =====
  m.def("render_summary", &ReportWriter::humanize, py::arg("name"),
        py::arg("summary"), "Labeled report lines of a Summary");
}
