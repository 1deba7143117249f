/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#ifndef FLOWSERIES_H
#define FLOWSERIES_H

#include "GateFlowInclude.h"

////////////////////////////////////////////////////////////////////
/// \brief Total gate discharge at one timestamp
//
struct flow_record
{
  time_struct tt;           ///< timestamp
  long long   t_sec;        ///< timestamp as serial seconds (for ordering)
  double      flow;         ///< total discharge [cfs], rounded to 0.01 cfs
  int         source_line;  ///< line of gate log file
};

////////////////////////////////////////////////////////////////////
/// \brief Timestamp shared by more than one flow record
//
struct duplicate_entry
{
  time_struct    tt;            ///< shared timestamp
  vector<int>    aSourceLines;  ///< gate log lines of all records, in source order
  vector<double> aFlows;        ///< flows of all records [cfs], in source order
};

////////////////////////////////////////////////////////////////////
/// \brief Identifies a flow series for output
//
struct series_descriptor
{
  string location;   ///< reservoir name (pathname part B)
  string parameter;  ///< measurement type (pathname part C)
  string interval;   ///< interval (pathname part E)
  string version;    ///< version (pathname part F)
  string units;      ///< units of values
  string ts_type;    ///< INST (instantaneous) or PER-AVER (period average)

  series_descriptor(){
    location ="";
    parameter=DEFAULT_PARAMETER;
    interval ="IR-CENTURY";
    version  =DEFAULT_OUTPUT_VERSION;
    units    =FLOW_UNITS;
    ts_type  =FLOW_TS_TYPE;
  }
};

///////////////////////////////////////////////////////////////////
/// \brief Time-ordered series of total gate discharge for one reservoir
/// \details records are added in gate log order, then Assemble() orders the series by
/// time (stable, so records with equal timestamps keep their source order), reports
/// duplicate timestamps and resolves them according to the duplicate policy.
//
class CFlowSeries
{
private:/*------------------------------------------------------*/
  string                  _name;         ///< reservoir name
  vector<flow_record>     _aRecords;     ///< flow records
  vector<duplicate_entry> _aDuplicates;  ///< duplicate timestamps found by Assemble()
  bool                    _assembled;    ///< true once Assemble() is called

public:/*-------------------------------------------------------*/
  CFlowSeries(const string name);
  ~CFlowSeries();

  string                 GetName         () const;
  int                    GetNumRecords   () const;
  const flow_record     &GetRecord       (const int n) const;
  int                    GetNumDuplicates() const;
  const duplicate_entry &GetDuplicate    (const int n) const;
  bool                   IsAssembled     () const;
  bool                   IsStrictlyIncreasing() const;

  void AddRecord(const time_struct &tt, const double &flow, const int source_line);
  void Assemble (const dup_policy policy, const bool noisy);
};

string     BuildPathname    (const series_descriptor &desc);
string     DupPolicyToString(const dup_policy policy);
dup_policy StringToDupPolicy(const string &s, bool &is_valid);

#endif
