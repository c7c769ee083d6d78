// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "qthought/experiments.hpp"

namespace py = pybind11;
using namespace qth;

static py::dict table_dict(const InferenceTable& t){
  py::dict d;
  for (const auto& [k, vs] : t.entries()) d[py::int_(k)] = vs;
  return d;
}

PYBIND11_MODULE(qthought_python, m){
  m.def("bell_table", [](uint64_t seed){
    auto interp = make_copenhagen();
    InferenceOptions opts; opts.seed = seed;
    return table_dict(forward_inference(bell_protocol(), interp, "Alice_memory", 1, "Bob_memory", 2, opts));
  }, py::arg("seed") = 12345);
  m.def("frauchiger_renner_tables", [](){
    auto t = derive_fr_tables(frauchiger_renner_protocol(), make_copenhagen());
    py::dict d;
    d["alice"] = table_dict(t.alice);
    d["bob"] = table_dict(t.bob_consistent);
    d["ursula"] = table_dict(t.ursula_consistent);
    return d;
  });
  m.def("run_frauchiger_renner", [](std::size_t trials, uint64_t seed){
    auto interp = make_copenhagen();
    auto tables = derive_fr_tables(frauchiger_renner_protocol(), interp);
    auto r = run_frauchiger_renner(trials, seed, interp, tables);
    return py::make_tuple(r.contradictions, r.frequency, r.exact_probability);
  }, py::arg("trials"), py::arg("seed") = 12345);
}
