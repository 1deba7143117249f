/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  Classes CObservation, CObservationBuilder
  ----------------------------------------------------------------*/
#include "Observation.h"

//////////////////////////////////////////////////////////////////
/// \brief Constructor
//
CObservation::CObservation(const time_struct &tt, const double lake_elev, const vector<double> &gates, const int line)
{
  _tt           =tt;
  _lake_elev    =lake_elev;
  _aGateOpenings=gates;
  _source_line  =line;
}
const time_struct    &CObservation::GetTime         () const {return _tt;}
double                CObservation::GetLakeElevation() const {return _lake_elev;}
int                   CObservation::GetNumGates     () const {return (int)(_aGateOpenings.size());}
int                   CObservation::GetSourceLine   () const {return _source_line;}
double                CObservation::GetGateOpening(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=GetNumGates()),"CObservation::GetGateOpening: bad gate index",RUNTIME_ERR);
  return _aGateOpenings[i];
}

//////////////////////////////////////////////////////////////////
/// \brief converts gate opening cell [in] to opening [ft]
/// \details missing cells, and cells which are not numbers once quote characters
/// are removed, are read as a closed gate. Result is rounded to 0.01 ft and may be negative.
/// \param &cell [in] cell contents, e.g. 6" or "6"
//
double ParseGateOpening(const string &cell)
{
  string s=cell;
  SubstringReplace(s,"\"","");
  double inches;
  if (!StringToDouble(s,inches)){inches=0.0;}
  return RoundToDecimals(inches/INCHES_PER_FOOT,2);
}

//////////////////////////////////////////////////////////////////
/// \brief Constructor
//
CObservationBuilder::CObservationBuilder(const string name)
{
  _name    =name;
  _iDate   =DOESNT_EXIST;
  _iTime   =DOESNT_EXIST;
  _iElev   =DOESNT_EXIST;
  _nDropped=0;
}
int CObservationBuilder::GetNumGates  () const {return (int)(_aGateCols.size());}
int CObservationBuilder::GetNumDropped() const {return _nDropped;}

//////////////////////////////////////////////////////////////////
/// \brief locates date, time, elevation and gate columns of repaired table
/// \details gates are located by identifier if gate_ids is non-empty; otherwise the
/// gate block of the layout is used, in order
///
/// \param &table [in] repaired gate log
/// \param &layout [in] column layout
/// \param &gate_ids [in] gate identifiers (may be empty)
/// \return false if any column cannot be found (error written)
//
bool CObservationBuilder::SetColumns(const CGateLogTable &table, const gate_layout &layout, const vector<string> &gate_ids)
{
  string errString;
  _iDate=table.GetColumnIndex(layout.date_col);
  _iTime=table.GetColumnIndex(layout.time_col);
  _iElev=table.GetColumnIndex(layout.elev_col);
  if ((_iDate==DOESNT_EXIST) || (_iTime==DOESNT_EXIST) || (_iElev==DOESNT_EXIST)){
    errString=_name+": date, time or lake elevation column missing from repaired gate log";
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    return false;
  }

  _aGateCols.clear();
  if (gate_ids.size()>0)
  {
    for (size_t k=0;k<gate_ids.size();k++)
    {
      int j=table.GetColumnIndex(gate_ids[k]);
      if (j==DOESNT_EXIST){
        errString=_name+": gate \""+gate_ids[k]+"\" not found in gate log";
        ExitGracefully(errString.c_str(),BAD_DATA_WARN);
        return false;
      }
      _aGateCols.push_back(j);
    }
  }
  else
  {
    if ((layout.gate_first<0) || (layout.gate_last>table.GetNumColumns()) || (layout.gate_last<=layout.gate_first)){
      errString=_name+": gate block does not fit repaired gate log";
      ExitGracefully(errString.c_str(),BAD_DATA_WARN);
      return false;
    }
    for (int j=layout.gate_first;j<layout.gate_last;j++){_aGateCols.push_back(j);}
  }
  return true;
}

//////////////////////////////////////////////////////////////////
/// \brief builds one observation per valid row of repaired gate log, in row order
/// \details rows whose date, time or lake elevation cannot be parsed are dropped
/// (advisory written for each)
///
/// \param &table [in] repaired gate log
/// \param &aObs [out] observations (appended)
/// \param noisy [in] true if messages are echoed to screen
/// \return false if columns have not been set
//
bool CObservationBuilder::BuildObservations(const CGateLogTable &table, vector<CObservation> &aObs, const bool noisy)
{
  if (_iDate==DOESNT_EXIST){
    ExitGracefully("CObservationBuilder::BuildObservations: columns not set",RUNTIME_ERR);
    return false;
  }
  _nDropped=0;
  int yr,mon,day,hr,min,sec;
  double elev;

  for (int i=0;i<table.GetNumRows();i++)
  {
    const vector<string> &row=table.GetRow(i);
    int    line=table.GetLineNumber(i);
    string reason="";

    string stime=NormalizeTimeString(row[_iTime]);

    if      (!ParseDateString(row[_iDate],yr,mon,day)){reason="unparseable date \""+row[_iDate]+"\"";}
    else if (!ParseTimeOfDay (stime,hr,min,sec))      {reason="unparseable time \""+row[_iTime]+"\"";}
    else if (!StringToDouble (row[_iElev],elev))      {reason="unparseable lake elevation \""+row[_iElev]+"\"";}

    if (reason!=""){
      WriteAdvisory(_name+": line "+to_string(line)+" dropped ("+reason+")",noisy);
      _nDropped++;
      continue;
    }

    vector<double> gates;
    for (size_t k=0;k<_aGateCols.size();k++)
    {
      double d=ParseGateOpening(row[_aGateCols[k]]);
      if (d<0.0){
        WriteWarning(_name+": line "+to_string(line)+" negative gate opening \""+row[_aGateCols[k]]+"\" treated as closed",noisy);
        d=0.0;
      }
      gates.push_back(d);
    }
    aObs.push_back(CObservation(MakeTimeStruct(yr,mon,day,hr,min,sec),elev,gates,line));
  }
  return true;
}
