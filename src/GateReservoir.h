/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  GateReservoir.h
  ------------------------------------------------------------------
  defines reservoir with gate-controlled spillway
  ----------------------------------------------------------------*/
#ifndef GATERESERVOIR_H
#define GATERESERVOIR_H

#include "GateFlowInclude.h"
#include "GateLogTable.h"
#include "Observation.h"
#include "RatingCurve.h"
#include "GateDischarge.h"
#include "FlowSeries.h"

/*****************************************************************
   Class CGateReservoir
------------------------------------------------------------------
   Data Abstraction for a reservoir whose outflow is recorded as
   a log of gate openings and lake elevations
******************************************************************/
class CGateReservoir
{
private:/*-------------------------------------------------------*/
  string           _name;            ///< reservoir name

  string           _gatelog_file;    ///< gate log filename
  int              _gatelog_skip;    ///< leading lines of gate log to ignore
  gate_layout      _layout;          ///< gate log column layout
  vector<string>   _aGateIDs;        ///< gate identifiers (empty: all gates of gate block)

  double           _invert_elev;     ///< spillway invert elevation [ft]
  double           _gate_length;     ///< gate length [ft]
  bool             _has_invert;      ///< true if spillway invert elevation specified
  bool             _has_length;      ///< true if gate length specified

  string           _rating_file;     ///< rating curve filename (or "" for inline curve)
  int              _rating_skip;     ///< leading lines of rating curve file to ignore
  vector<double>   _aInlineD;        ///< inline rating curve openings [ft]
  vector<double>   _aInlineC;        ///< inline rating curve coefficients [-]

  string           _parameter;       ///< measurement type of output series
  string           _version;         ///< version label of output series

  CRatingCurve    *_pCurve;          ///< rating curve (owned; NULL until initialized)
  CGateWeir       *_pWeir;           ///< gated weir (owned; NULL until initialized)
  CFlowSeries     *_pSeries;         ///< flow series (owned; NULL until processed)

  int              _nObservations;   ///< number of observations built
  int              _nDropped;        ///< number of rows dropped by observation builder
  flow_diagnostics _diag;            ///< rating curve lookup counters

  CGateReservoir(const CGateReservoir &r); //suppresses default copy constructor

public:/*-------------------------------------------------------*/
  CGateReservoir(const string name);
  ~CGateReservoir();

  //Accessors
  string                GetName            () const;
  string                GetGateLogFile     () const;
  string                GetRatingCurveFile () const;
  const gate_layout    &GetLayout          () const;
  const vector<string> &GetGateIdentifiers () const;
  double                GetInvertElevation () const;
  double                GetGateLength      () const;
  int                   GetNumInlinePoints () const;
  const CRatingCurve   *GetRatingCurve     () const;
  const CFlowSeries    *GetFlowSeries      () const;
  int                   GetNumObservations () const;
  int                   GetNumDroppedRows  () const;
  const flow_diagnostics &GetDiagnostics   () const;
  series_descriptor     GetSeriesDescriptor() const;

  //Manipulators (called by ParseMainInputFile)
  void SetGateLogFile        (const string filename);
  void SetGateLogRowsToSkip  (const int skiprows);
  void SetDateColumn         (const string header);
  void SetTimeColumn         (const string header);
  void SetLakeElevationColumn(const string header);
  void SetGateBlock          (const int first, const int last);
  void SetDropTrailingColumn (const bool drop);
  void SetGateIdentifiers    (const vector<string> &ids);
  void SetSpillwayInvert     (const double elev);
  void SetGateLength         (const double L);
  void SetRatingCurveFile    (const string filename);
  void SetRatingCurveRowsToSkip(const int skiprows);
  void AddRatingCurvePoint   (const double d, const double C);
  void SetMeasurementType    (const string parameter);
  void SetOutputVersion      (const string version);

  //Processing
  bool Initialize    (const optStruct &Options);
  bool ProcessGateLog(const CGateLogTable &raw, const optStruct &Options);
  bool Run           (const optStruct &Options);
  void WriteSummary  (const optStruct &Options) const;
};
#endif
