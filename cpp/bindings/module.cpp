#include "tkgstats/core/version.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations for binding functions
void init_data_bindings(py::module &m);
void bind_statistics(py::module &m); // Stats, Summary, merge, summarize

// Orchestration bindings (Analyzer, options, errors)
namespace tkgstats {
void init_core_bindings(py::module &m);
}

/// Main Python module definition
PYBIND11_MODULE(tkgstats_cpp, m) {
  m.doc() = "Temporal KG statistics C++ core - dataset classification, "
            "temporal field extraction and ranked summaries";

  // Version information
  m.attr("__version__") = tkgstats::version_string();
  m.def("get_version", [] { return tkgstats::version_string(); },
        "Get library version string");

  // Errors first so the other bindings can rely on their translation
  tkgstats::init_core_bindings(m);

  // Line-level API (DatasetType, Date, extractor, accumulator)
  init_data_bindings(m);

  // Aggregation API (Stats, Summary, merge_stats, summarize)
  bind_statistics(m);
}
