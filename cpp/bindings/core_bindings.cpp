/**
 * @file core_bindings.cpp
 * @brief Python bindings for the orchestration layer
 *
 * Exposes:
 * - ConfigurationError / IoError: fatal error types
 * - AnalyzeOptions: analysis options
 * - DatasetReport: aggregate + per-file summaries
 * - Analyzer: dataset discovery, accumulation and merging
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "tkgstats/core/analyzer.hpp"
#include "tkgstats/core/errors.hpp"
#include "tkgstats/data/report_writer.hpp"

namespace py = pybind11;

namespace tkgstats {

/**
 * @brief Initialize orchestration bindings
 */
void init_core_bindings(py::module& m) {
    // ========================================================================
    // Errors
    // ========================================================================
    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_RuntimeError);
    py::register_exception<IoError>(m, "IoError", PyExc_OSError);

    // ========================================================================
    // AnalyzeOptions
    // ========================================================================
    py::class_<AnalyzeOptions>(m, "AnalyzeOptions",
        "Options of an analysis run")

        .def(py::init<>())
        .def_readwrite("base_dir", &AnalyzeOptions::base_dir,
            "Folder containing dataset subdirectories (default: TemporalKGs)")
        .def_readwrite("datasets", &AnalyzeOptions::datasets,
            "Case-insensitive dataset name filter (empty = all)")
        .def_readwrite("top_n", &AnalyzeOptions::top_n,
            "Ranking length (default: 5)")
        .def_readwrite("per_file", &AnalyzeOptions::per_file,
            "Also summarize every split file")
        .def_readwrite("extension", &AnalyzeOptions::extension,
            "Split file extension (default: .txt)")
        .def_readwrite("verbose", &AnalyzeOptions::verbose,
            "Log progress to stderr");

    // ========================================================================
    // DatasetReport
    // ========================================================================
    py::class_<DatasetReport>(m, "DatasetReport",
        "Aggregate summary of a dataset plus optional per-split summaries")

        .def(py::init<>())
        .def_readonly("aggregate", &DatasetReport::aggregate)
        .def_readonly("files", &DatasetReport::files);

    // ========================================================================
    // Analyzer
    // ========================================================================
    py::class_<Analyzer>(m, "Analyzer",
        "Runs the statistics engine over a base directory of datasets")

        .def(py::init<AnalyzeOptions>(), py::arg("options"))
        .def("run", &Analyzer::run,
            "Analyze every selected dataset -> {name: DatasetReport}")
        .def("collect_dataset_stats", &Analyzer::collect_dataset_stats,
            "Aggregate Stats of every selected dataset")
        .def_property_readonly("options", &Analyzer::options);

    // ========================================================================
    // Convenience
    // ========================================================================
    m.def("analyze",
        [](const std::filesystem::path& base_dir, size_t top_n,
           const std::vector<std::string>& datasets, bool per_file) {
            AnalyzeOptions opts;
            opts.base_dir = base_dir;
            opts.top_n = top_n;
            opts.datasets = datasets;
            opts.per_file = per_file;
            return Analyzer(opts).run();
        },
        py::arg("base_dir") = constants::DEFAULT_BASE_DIR,
        py::arg("top_n") = constants::DEFAULT_TOP_N,
        py::arg("datasets") = std::vector<std::string>(),
        py::arg("per_file") = false,
        "Analyze a base directory and return {name: DatasetReport}");

    m.def("analysis_to_json",
        [](const AnalysisResult& result) {
            return ReportWriter::dump(ReportWriter::to_json(result));
        },
        py::arg("result"),
        "Serialize an analysis result as the JSON report document");
}

} // namespace tkgstats
