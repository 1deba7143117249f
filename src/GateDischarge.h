/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  GateDischarge.h
  ------------------------------------------------------------------
  discharge through the gates of a gated spillway
  ----------------------------------------------------------------*/
#ifndef GATEDISCHARGE_H
#define GATEDISCHARGE_H

#include "GateFlowInclude.h"
#include "RatingCurve.h"
#include "Observation.h"

////////////////////////////////////////////////////////////////////
/// \brief Counters of rating curve use during discharge calculation
//
struct flow_diagnostics
{
  int nLookups;    ///< number of rating curve lookups
  int nFallbacks;  ///< number of lookups resolved by closest d value

  flow_diagnostics(){nLookups=0;nFallbacks=0;}
};

/*****************************************************************
    Class CGateWeir
------------------------------------------------------------------
    Vertical lift gates on a spillway crest, each discharging as a
    rectangular weir with coefficient from the rating curve
  ******************************************************************/
class CGateWeir
{
private:
  string              _name;           ///< reservoir name
  double              _invert_elev;    ///< spillway invert elevation [ft]
  double              _gate_length;    ///< gate length [ft]
  const CRatingCurve *_pCurve;         ///< discharge coefficient curve (not owned)

public:
  CGateWeir(const string name, const double invert_elev, const double gate_length, const CRatingCurve *pCurve);
  ~CGateWeir();

  static string CheckParameters(const double gate_length, const CRatingCurve *pCurve);

  string GetName            () const;
  double GetInvertElevation () const;
  double GetGateLength      () const;

  double GetGateDischarge   (const double &d, const double &lake_elev, flow_diagnostics &diag) const;
  double GetGateDischarge   (const double &d, const double &lake_elev) const;
  double GetTotalDischarge  (const CObservation &obs, flow_diagnostics &diag) const;
};
#endif
