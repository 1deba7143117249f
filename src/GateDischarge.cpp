/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/

#include "GateDischarge.h"

/////////////////////////////////////////////////////////////////
/// \brief gated weir constructor / destructor
//
CGateWeir::CGateWeir(const string name, const double invert_elev, const double gate_length, const CRatingCurve *pCurve)
{
  string problem=CheckParameters(gate_length,pCurve);
  if (problem!=""){
    string errString="CGateWeir constructor: "+problem;
    ExitGracefully(errString.c_str(),RUNTIME_ERR);
  }
  _name       =name;
  _invert_elev=invert_elev;
  _gate_length=gate_length;
  _pCurve     =pCurve;
}
CGateWeir::~CGateWeir(){}

//////////////////////////////////////////////////////////////////
/// \brief checks weir parameters before construction
/// \return empty string if usable, otherwise description of the problem
//
string CGateWeir::CheckParameters(const double gate_length, const CRatingCurve *pCurve)
{
  if (pCurve==NULL)        {return "NULL rating curve";}
  if (!(gate_length>0.0))  {return "gate length must be positive";}
  return "";
}

string CGateWeir::GetName           () const {return _name;}
double CGateWeir::GetInvertElevation() const {return _invert_elev;}
double CGateWeir::GetGateLength     () const {return _gate_length;}

/////////////////////////////////////////////////////////////////
/// \brief discharge through a single gate
/// \details Q = 2/3 sqrt(2g) C(d) L (H1^1.5 - H2^1.5), with H1 the head on the invert and
/// H2=H1-d the head on the gate lip. A closed gate (d<=0) or a gate lip above the water
/// surface (H2<0) passes no flow, and no rating curve lookup is made.
///
/// \param &d [in] gate opening [ft]
/// \param &lake_elev [in] lake elevation [ft]
/// \param &diag [in/out] lookup counters
/// \returns discharge [cfs]
//
double CGateWeir::GetGateDischarge(const double &d, const double &lake_elev, flow_diagnostics &diag) const
{
  if (d<=0.0){return 0.0;}

  double H1=lake_elev-_invert_elev;
  double H2=H1-d;
  if (H2<0.0){return 0.0;}

  bool   is_fallback;
  double d_used;
  double C=_pCurve->GetCoefficient(d,is_fallback,d_used);
  diag.nLookups++;
  if (is_fallback){diag.nFallbacks++;}

  return 2.0/3.0*sqrt(2*GRAVITY_IMPERIAL)*C*_gate_length*(pow(max(H1,0.0),1.5)-pow(max(H2,0.0),1.5));
}
/////////////////////////////////////////////////////////////////
double CGateWeir::GetGateDischarge(const double &d, const double &lake_elev) const
{
  flow_diagnostics diag;
  return GetGateDischarge(d,lake_elev,diag);
}

/////////////////////////////////////////////////////////////////
/// \brief total discharge through all gates for an observation
/// \returns sum of gate discharges [cfs], rounded to 0.01 cfs
//
double CGateWeir::GetTotalDischarge(const CObservation &obs, flow_diagnostics &diag) const
{
  double Q=0.0;
  for (int k=0;k<obs.GetNumGates();k++){
    Q+=GetGateDischarge(obs.GetGateOpening(k),obs.GetLakeElevation(),diag);
  }
  return RoundToDecimals(Q,2);
}
