/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  Observation.h
  ------------------------------------------------------------------
  gate-log observations and their construction from repaired tables
  ----------------------------------------------------------------*/
#ifndef OBSERVATION_H
#define OBSERVATION_H

#include "GateFlowInclude.h"
#include "GateLogTable.h"
#include "TimeNormalizer.h"

/*****************************************************************
   Class CObservation
------------------------------------------------------------------
   A single gate log reading: timestamp, lake elevation and gate
   openings, index-aligned with the reservoir gate list
******************************************************************/
class CObservation
{
private:/*-------------------------------------------------------*/
  time_struct    _tt;             ///< timestamp of reading
  double         _lake_elev;      ///< lake elevation [ft]
  vector<double> _aGateOpenings;  ///< gate openings [ft], >=0 [size: number of gates]
  int            _source_line;    ///< line of gate log file

public:/*-------------------------------------------------------*/
  CObservation(const time_struct &tt, const double lake_elev, const vector<double> &gates, const int line);

  const time_struct    &GetTime          () const;
  double                GetLakeElevation () const;
  int                   GetNumGates      () const;
  double                GetGateOpening   (const int i) const;
  int                   GetSourceLine    () const;
};

double ParseGateOpening(const string &cell);

/*****************************************************************
   Class CObservationBuilder
------------------------------------------------------------------
   Converts rows of a repaired gate log into observations
******************************************************************/
class CObservationBuilder
{
private:/*-------------------------------------------------------*/
  string      _name;        ///< reservoir name, for messages
  int         _iDate;       ///< index of date column
  int         _iTime;       ///< index of time column
  int         _iElev;       ///< index of lake elevation column
  vector<int> _aGateCols;   ///< indices of gate columns, in reservoir gate order
  int         _nDropped;    ///< number of rows dropped in last call to BuildObservations()

public:/*-------------------------------------------------------*/
  CObservationBuilder(const string name);

  bool SetColumns(const CGateLogTable &table, const gate_layout &layout, const vector<string> &gate_ids);

  int  GetNumGates  () const;
  int  GetNumDropped() const;

  bool BuildObservations(const CGateLogTable &table, vector<CObservation> &aObs, const bool noisy);
};

#endif
