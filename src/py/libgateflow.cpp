#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <stdexcept>
#include "GateFlowInclude.h"
#include "TimeNormalizer.h"
#include "Observation.h"
#include "RatingCurve.h"
#include "GateDischarge.h"

#ifdef _GFNETCDF_
const bool    __HAS_NETCDF__ = true;
#endif
#ifndef _GFNETCDF_
const bool    __HAS_NETCDF__ = false;
#endif

namespace py = pybind11;

//discharge through one gate using a temporary rating curve
double GateDischarge(double d, double lake_elev, double invert_elev, double gate_length,
                     const vector<double> &curve_d, const vector<double> &curve_C)
{
  if ((curve_d.size()==0) || (curve_d.size()!=curve_C.size())){
    throw std::invalid_argument("gate_discharge: rating curve must be non-empty with matching d and C lists");
  }
  CRatingCurve curve("python",&curve_d[0],&curve_C[0],(int)(curve_d.size()));
  string problem=CGateWeir::CheckParameters(gate_length,&curve);
  if (problem!=""){
    throw std::invalid_argument("gate_discharge: "+problem);
  }
  CGateWeir    weir ("python",invert_elev,gate_length,&curve);
  return weir.GetGateDischarge(d,lake_elev);
}

PYBIND11_MODULE(libgateflow, m) {
    m.doc() =
      R"pbdoc(A Python wrapper to the GateFlow reservoir gate log and weir flow library.)pbdoc";

    m.attr("__version__") = __GATEFLOW_VERSION__;
    m.attr("__netcdf__") = __HAS_NETCDF__;

    m.def("normalize_time", &NormalizeTimeString,
          "Normalizes a gate log time cell to H:MM:SS form", py::arg("raw"));
    m.def("parse_gate_opening", &ParseGateOpening,
          "Converts a gate opening cell in inches to feet", py::arg("cell"));
    m.def("gate_discharge", &GateDischarge,
          "Weir discharge [cfs] through a single gate",
          py::arg("d"), py::arg("lake_elev"), py::arg("invert_elev"), py::arg("gate_length"),
          py::arg("curve_d"), py::arg("curve_C"));
}
