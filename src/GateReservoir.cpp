/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  Class CGateReservoir
  ----------------------------------------------------------------*/
#include "GateReservoir.h"

//////////////////////////////////////////////////////////////////
/// \brief Base constructor for gate-controlled reservoir
/// \param name [in] reservoir name, e.g., LAWTONKA
//
CGateReservoir::CGateReservoir(const string name)
{
  _name         =name;
  _gatelog_file ="";
  _gatelog_skip =1;
  _invert_elev  =0.0;
  _gate_length  =0.0;
  _has_invert   =false;
  _has_length   =false;
  _rating_file  ="";
  _rating_skip  =0;
  _parameter    =DEFAULT_PARAMETER;
  _version      =DEFAULT_OUTPUT_VERSION;
  _pCurve       =NULL;
  _pWeir        =NULL;
  _pSeries      =NULL;
  _nObservations=0;
  _nDropped     =0;
}
//////////////////////////////////////////////////////////////////
/// \brief Default destructor
//
CGateReservoir::~CGateReservoir()
{
  delete _pSeries; _pSeries=NULL;
  delete _pWeir;   _pWeir  =NULL;
  delete _pCurve;  _pCurve =NULL;
}

//////////////////////////////////////////////////////////////////
// Accessors
//
string                  CGateReservoir::GetName           () const {return _name;}
string                  CGateReservoir::GetGateLogFile    () const {return _gatelog_file;}
string                  CGateReservoir::GetRatingCurveFile() const {return _rating_file;}
const gate_layout      &CGateReservoir::GetLayout         () const {return _layout;}
const vector<string>   &CGateReservoir::GetGateIdentifiers() const {return _aGateIDs;}
double                  CGateReservoir::GetInvertElevation() const {return _invert_elev;}
double                  CGateReservoir::GetGateLength     () const {return _gate_length;}
int                     CGateReservoir::GetNumInlinePoints() const {return (int)(_aInlineD.size());}
const CRatingCurve     *CGateReservoir::GetRatingCurve    () const {return _pCurve;}
const CFlowSeries      *CGateReservoir::GetFlowSeries     () const {return _pSeries;}
int                     CGateReservoir::GetNumObservations() const {return _nObservations;}
int                     CGateReservoir::GetNumDroppedRows () const {return _nDropped;}
const flow_diagnostics &CGateReservoir::GetDiagnostics    () const {return _diag;}

//////////////////////////////////////////////////////////////////
/// \returns identification of output series
//
series_descriptor CGateReservoir::GetSeriesDescriptor() const
{
  series_descriptor desc;
  desc.location =_name;
  desc.parameter=_parameter;
  desc.version  =_version;
  return desc;
}

//////////////////////////////////////////////////////////////////
// Manipulators
//
void CGateReservoir::SetGateLogFile          (const string filename) {_gatelog_file=filename;}
void CGateReservoir::SetGateLogRowsToSkip    (const int skiprows)    {_gatelog_skip=skiprows;}
void CGateReservoir::SetDateColumn           (const string header)   {_layout.date_col=header;}
void CGateReservoir::SetTimeColumn           (const string header)   {_layout.time_col=header;}
void CGateReservoir::SetLakeElevationColumn  (const string header)   {_layout.elev_col=header;}
void CGateReservoir::SetDropTrailingColumn   (const bool drop)       {_layout.drop_trailing=drop;}
void CGateReservoir::SetGateIdentifiers      (const vector<string> &ids){_aGateIDs=ids;}
void CGateReservoir::SetRatingCurveFile      (const string filename) {_rating_file=filename;}
void CGateReservoir::SetRatingCurveRowsToSkip(const int skiprows)    {_rating_skip=skiprows;}
void CGateReservoir::SetMeasurementType      (const string parameter){_parameter=parameter;}
void CGateReservoir::SetOutputVersion        (const string version)  {_version=version;}
void CGateReservoir::SetGateBlock(const int first, const int last)
{
  _layout.gate_first=first;
  _layout.gate_last =last;
}
void CGateReservoir::SetSpillwayInvert(const double elev)
{
  _invert_elev=elev;
  _has_invert =true;
}
void CGateReservoir::SetGateLength(const double L)
{
  _gate_length=L;
  _has_length =true;
}
void CGateReservoir::AddRatingCurvePoint(const double d, const double C)
{
  _aInlineD.push_back(d);
  _aInlineC.push_back(C);
}

//////////////////////////////////////////////////////////////////
/// \brief checks reservoir constants and builds rating curve and gated weir
/// \details rating curve is read from file if one is specified, otherwise the inline
/// curve is used
/// \return false if reservoir cannot be processed (error written)
//
bool CGateReservoir::Initialize(const optStruct &Options)
{
  string errString;
  if (!_has_invert){
    errString=_name+": :SpillwayInvertElevation not specified; reservoir not processed";
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    return false;
  }
  if ((!_has_length) || (_gate_length<=0.0)){
    errString=_name+": positive :GateLength not specified; reservoir not processed";
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    return false;
  }

  delete _pWeir;  _pWeir =NULL;
  delete _pCurve; _pCurve=NULL;
  if (_rating_file!=""){
    if (_aInlineD.size()>0){
      WriteWarning(_name+": both :RatingCurveFile and :RatingCurve given; inline curve ignored",Options.noisy);
    }
    _pCurve=CRatingCurve::ReadFromFile(_rating_file,_name,_rating_skip);
  }
  else {
    _pCurve=CRatingCurve::Create(_name,_aInlineD,_aInlineC);
  }
  if (_pCurve==NULL){return false;}

  _pWeir=new CGateWeir(_name,_invert_elev,_gate_length,_pCurve);
  return true;
}

//////////////////////////////////////////////////////////////////
/// \brief converts raw gate log into flow series
/// \details repairs the table header, builds observations, computes total gate
/// discharge of each observation and assembles the flow series
///
/// \param &raw [in] gate log as read
/// \param &Options [in] run options
/// \return false if the gate log cannot be processed (error written)
//
bool CGateReservoir::ProcessGateLog(const CGateLogTable &raw, const optStruct &Options)
{
  ExitGracefullyIf(_pWeir==NULL,"CGateReservoir::ProcessGateLog: reservoir not initialized",RUNTIME_ERR);

  delete _pSeries; _pSeries=NULL;
  _nObservations=0;
  _nDropped     =0;
  _diag         =flow_diagnostics();

  CGateLogTable *pTable=RepairGateLogTable(raw,_layout,Options.noisy);
  if (pTable==NULL){return false;}

  CObservationBuilder builder(_name);
  vector<CObservation> aObs;
  if ((!builder.SetColumns(*pTable,_layout,_aGateIDs)) ||
      (!builder.BuildObservations(*pTable,aObs,Options.noisy)))
  {
    delete pTable;
    return false;
  }
  delete pTable;

  _nObservations=(int)(aObs.size());
  _nDropped     =builder.GetNumDropped();

  _pSeries=new CFlowSeries(_name);
  for (size_t i=0;i<aObs.size();i++){
    double Q=_pWeir->GetTotalDischarge(aObs[i],_diag);
    _pSeries->AddRecord(aObs[i].GetTime(),Q,aObs[i].GetSourceLine());
  }
  _pSeries->Assemble(Options.duplicates,Options.noisy);
  return true;
}

//////////////////////////////////////////////////////////////////
/// \brief initializes reservoir, reads gate log and processes it
/// \return false if reservoir could not be processed (error written)
//
bool CGateReservoir::Run(const optStruct &Options)
{
  if (!Initialize(Options)){return false;}
  if (_gatelog_file==""){
    string errString=_name+": :GateLogFile not specified; reservoir not processed";
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    return false;
  }
  CGateLogTable *pRaw=CGateLogTable::ReadFromFile(_gatelog_file,_name,_gatelog_skip);
  if (pRaw==NULL){return false;}

  bool success=ProcessGateLog(*pRaw,Options);
  delete pRaw;
  return success;
}

//////////////////////////////////////////////////////////////////
/// \brief writes processing summary to screen
//
void CGateReservoir::WriteSummary(const optStruct &Options) const
{
  if (Options.silent){return;}
  cout<<"  Reservoir "<<_name<<":"<<endl;
  cout<<"    observations:          "<<_nObservations<<" ("<<_nDropped<<" rows dropped)"<<endl;
  cout<<"    rating curve lookups:  "<<_diag.nLookups<<" ("<<_diag.nFallbacks<<" closest-match)"<<endl;
  if (_pSeries!=NULL){
    cout<<"    flow records:          "<<_pSeries->GetNumRecords()<<endl;
    cout<<"    duplicate timestamps:  "<<_pSeries->GetNumDuplicates()<<" (policy "<<DupPolicyToString(Options.duplicates)<<")"<<endl;
  }
}
