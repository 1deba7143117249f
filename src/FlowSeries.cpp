/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  Class CFlowSeries
  ----------------------------------------------------------------*/
#include "FlowSeries.h"

//////////////////////////////////////////////////////////////////
/// \brief ordering of flow records by time only
//
static bool RecordIsEarlier(const flow_record &a, const flow_record &b)
{
  return (a.t_sec<b.t_sec);
}

///////////////////////////////////////////////////////////////////
/// \brief Constructor / destructor
//
CFlowSeries::CFlowSeries(const string name)
{
  _name     =name;
  _assembled=false;
}
CFlowSeries::~CFlowSeries(){}

///////////////////////////////////////////////////////////////////
// Accessors
//
string CFlowSeries::GetName         () const {return _name;}
int    CFlowSeries::GetNumRecords   () const {return (int)(_aRecords.size());}
int    CFlowSeries::GetNumDuplicates() const {return (int)(_aDuplicates.size());}
bool   CFlowSeries::IsAssembled     () const {return _assembled;}

const flow_record &CFlowSeries::GetRecord(const int n) const
{
  ExitGracefullyIf((n<0) || (n>=GetNumRecords()),"CFlowSeries::GetRecord: bad index",RUNTIME_ERR);
  return _aRecords[n];
}
const duplicate_entry &CFlowSeries::GetDuplicate(const int n) const
{
  ExitGracefullyIf((n<0) || (n>=GetNumDuplicates()),"CFlowSeries::GetDuplicate: bad index",RUNTIME_ERR);
  return _aDuplicates[n];
}

///////////////////////////////////////////////////////////////////
/// \return true if every record is later than the one before it
//
bool CFlowSeries::IsStrictlyIncreasing() const
{
  for (int n=1;n<GetNumRecords();n++){
    if (_aRecords[n].t_sec<=_aRecords[n-1].t_sec){return false;}
  }
  return true;
}

///////////////////////////////////////////////////////////////////
/// \brief appends flow record (series must not yet be assembled)
/// \param &tt [in] timestamp
/// \param &flow [in] total discharge [cfs]
/// \param source_line [in] gate log line
//
void CFlowSeries::AddRecord(const time_struct &tt, const double &flow, const int source_line)
{
  ExitGracefullyIf(_assembled,"CFlowSeries::AddRecord: series already assembled",RUNTIME_ERR);
  flow_record rec;
  rec.tt         =tt;
  rec.t_sec      =TimeStructToSerialSeconds(tt);
  rec.flow       =flow;
  rec.source_line=source_line;
  _aRecords.push_back(rec);
}

///////////////////////////////////////////////////////////////////
/// \brief orders records by time, reports and resolves duplicate timestamps
/// \details all policies except DUPLICATES_KEEP_ALL leave a strictly increasing series
///
/// \param policy [in] treatment of records sharing a timestamp
/// \param noisy [in] true if messages are echoed to screen
//
void CFlowSeries::Assemble(const dup_policy policy, const bool noisy)
{
  stable_sort(_aRecords.begin(),_aRecords.end(),RecordIsEarlier);

  _aDuplicates.clear();
  vector<flow_record> aResolved;
  size_t i=0;
  while (i<_aRecords.size())
  {
    size_t j=i+1;
    while ((j<_aRecords.size()) && (_aRecords[j].t_sec==_aRecords[i].t_sec)){j++;}

    if (j-i==1){
      aResolved.push_back(_aRecords[i]);
    }
    else
    {
      duplicate_entry dup;
      dup.tt=_aRecords[i].tt;
      string lines="";
      for (size_t k=i;k<j;k++){
        dup.aSourceLines.push_back(_aRecords[k].source_line);
        dup.aFlows      .push_back(_aRecords[k].flow);
        if (k>i){lines+=", ";}
        lines+=to_string(_aRecords[k].source_line);
      }
      _aDuplicates.push_back(dup);
      WriteWarning(_name+": duplicate timestamp "+TimeStructToString(dup.tt)+" (gate log lines "+lines+")",noisy);

      if      (policy==DUPLICATES_KEEP_FIRST){aResolved.push_back(_aRecords[i]);}
      else if (policy==DUPLICATES_KEEP_LAST) {aResolved.push_back(_aRecords[j-1]);}
      else if (policy==DUPLICATES_AVERAGE)
      {
        flow_record rec=_aRecords[i];
        double sum=0.0;
        for (size_t k=i;k<j;k++){sum+=_aRecords[k].flow;}
        rec.flow=RoundToDecimals(sum/(double)(j-i),2);
        aResolved.push_back(rec);
      }
      else //DUPLICATES_KEEP_ALL
      {
        for (size_t k=i;k<j;k++){aResolved.push_back(_aRecords[k]);}
      }
    }
    i=j;
  }
  _aRecords =aResolved;
  _assembled=true;
}

///////////////////////////////////////////////////////////////////
/// \brief string name of duplicate policy
//
string DupPolicyToString(const dup_policy policy)
{
  switch(policy)
  {
    case(DUPLICATES_KEEP_LAST):  {return "KEEP_LAST";}
    case(DUPLICATES_KEEP_FIRST): {return "KEEP_FIRST";}
    case(DUPLICATES_AVERAGE):    {return "AVERAGE";}
    case(DUPLICATES_KEEP_ALL):   {return "KEEP_ALL";}
  }
  return "UNKNOWN";
}
///////////////////////////////////////////////////////////////////
/// \brief duplicate policy from (case-insensitive) string
/// \param &is_valid [out] false if string is not recognized (DUPLICATES_KEEP_LAST returned)
//
dup_policy StringToDupPolicy(const string &s, bool &is_valid)
{
  string u=StringToUppercase(s);
  is_valid=true;
  if      (u=="KEEP_LAST") {return DUPLICATES_KEEP_LAST;}
  else if (u=="KEEP_FIRST"){return DUPLICATES_KEEP_FIRST;}
  else if (u=="AVERAGE")   {return DUPLICATES_AVERAGE;}
  else if (u=="KEEP_ALL")  {return DUPLICATES_KEEP_ALL;}
  is_valid=false;
  return DUPLICATES_KEEP_LAST;
}

///////////////////////////////////////////////////////////////////
/// \brief DSS-style pathname of series, e.g., //LAWTONKA/RES FLOW-OUT//IR-CENTURY/Obs Gate Ops
//
string BuildPathname(const series_descriptor &desc)
{
  return "//"+StringToUppercase(desc.location)+"/"+desc.parameter+"//"+desc.interval+"/"+desc.version;
}
