/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  Flow series output routines
  ----------------------------------------------------------------*/
#include "FlowSeriesWriters.h"

//////////////////////////////////////////////////////////////////
/// \brief Adds output directory & prefix to base file name
/// \param filebase [in] base filename, with extension, no directory information
/// \param &Options [in] Global options information
//
string FilenamePrepare(const string filebase, const optStruct &Options)
{
  string fn;
  if (Options.run_name==""){fn=Options.output_dir+filebase;}
  else                     {fn=Options.output_dir+Options.run_name+"_"+filebase;}
  return fn;
}

//////////////////////////////////////////////////////////////////
/// \brief creates specified output directory, if needed
///
/// \param &Options [in] global options
//
void PrepareOutputdirectory(const optStruct &Options)
{
  if (Options.output_dir!="")
  {
#if defined(_WIN32)
    _mkdir(Options.output_dir.c_str());
#elif defined(__linux__)
    mkdir(Options.output_dir.c_str(), 0777);
#elif defined(__APPLE__)
    mkdir(Options.output_dir.c_str(),0777);
#elif defined(__unix__)
    mkdir(Options.output_dir.c_str(),S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
#endif
  }
  g_output_directory=Options.output_dir;
}

//////////////////////////////////////////////////////////////////
/// \brief creates writer for output format
/// \return new writer (caller owns)
//
CFlowSeriesWriterABC *CFlowSeriesWriterABC::Create(const output_format fmt)
{
  if (fmt==OUTPUT_NETCDF){return new CNetCDFFlowWriter();}
  return new CCSVFlowWriter();
}

// CSV WRITER
//////////////////////////////////////////////////////////////////
string CCSVFlowWriter::GetFilename(const series_descriptor &desc, const optStruct &Options) const
{
  return FilenamePrepare(desc.location+"_GateFlows.csv",Options);
}

//////////////////////////////////////////////////////////////////
/// \brief writes flow series as comma-delimited text
/// \return false if series has not been assembled
//
bool CCSVFlowWriter::WriteSeries(const CFlowSeries &series, const series_descriptor &desc, const optStruct &Options) const
{
  if (!series.IsAssembled()){
    ExitGracefully("CCSVFlowWriter::WriteSeries: flow series must be assembled before output",RUNTIME_ERR);
    return false;
  }
  string tmpFilename=GetFilename(desc,Options);
  ofstream OUT;
  OUT.open(tmpFilename.c_str());
  if (OUT.fail()){
    ExitGracefully(("CCSVFlowWriter::WriteSeries: Unable to open output file "+tmpFilename+" for writing.").c_str(),FILE_OPEN_ERR);
    return false;
  }
  OUT<<"# pathname: "<<BuildPathname(desc)<<endl;
  OUT<<"# units: "   <<desc.units          <<endl;
  OUT<<"# type: "    <<desc.ts_type        <<endl;
  OUT<<"date,hour,flow ["<<desc.units<<"]"  <<endl;
  for (int n=0;n<series.GetNumRecords();n++)
  {
    const flow_record &rec=series.GetRecord(n);
    OUT<<rec.tt.date_string<<","<<TimeOfDayToString(rec.tt)<<","<<DoubleToString(rec.flow,2)<<endl;
  }
  OUT.close();
  return true;
}

// NETCDF WRITER
//////////////////////////////////////////////////////////////////
string CNetCDFFlowWriter::GetFilename(const series_descriptor &desc, const optStruct &Options) const
{
  return FilenamePrepare(desc.location+"_GateFlows.nc",Options);
}

//////////////////////////////////////////////////////////////////
/// \brief writes flow series to netCDF file
/// \details time axis is in hours since the first record
/// \return false if series has not been assembled or program was built without netCDF
//
bool CNetCDFFlowWriter::WriteSeries(const CFlowSeries &series, const series_descriptor &desc, const optStruct &Options) const
{
  if (!series.IsAssembled()){
    ExitGracefully("CNetCDFFlowWriter::WriteSeries: flow series must be assembled before output",RUNTIME_ERR);
    return false;
  }
#ifdef _GFNETCDF_
  int    ncid,retval;
  int    time_dimid,varid_time,varid_q;
  int    dimids1[1];
  string tmpFilename=GetFilename(desc,Options);

  //"hours since YYYY-MM-DD HH:MM:SS" of first record
  time_struct t0;
  long long   t0_sec=0;
  if (series.GetNumRecords()>0){
    t0    =series.GetRecord(0).tt;
    t0_sec=series.GetRecord(0).t_sec;
  }
  else{
    t0=MakeTimeStruct(1970,1,1,0,0,0);
  }
  string starttime="hours since "+TimeStructToString(t0);

  retval = nc_create(tmpFilename.c_str(), NC_CLOBBER|NC_NETCDF4, &ncid);  HandleNetCDFErrors(retval);

  // global attributes
  string pathname=BuildPathname(desc);
  string title   ="Gate outflow of "+desc.location;
  string history ="Created by GateFlow version "+__GATEFLOW_VERSION__+" on "+GetCurrentMachineTime();
  retval = nc_put_att_text(ncid, NC_GLOBAL, "Conventions", strlen("CF-1.6"),       "CF-1.6");         HandleNetCDFErrors(retval);
  retval = nc_put_att_text(ncid, NC_GLOBAL, "featureType", strlen("timeSeries"),   "timeSeries");     HandleNetCDFErrors(retval);
  retval = nc_put_att_text(ncid, NC_GLOBAL, "title",       title.length(),         title.c_str());    HandleNetCDFErrors(retval);
  retval = nc_put_att_text(ncid, NC_GLOBAL, "history",     history.length(),       history.c_str());  HandleNetCDFErrors(retval);
  retval = nc_put_att_text(ncid, NC_GLOBAL, "pathname",    pathname.length(),      pathname.c_str()); HandleNetCDFErrors(retval);
  retval = nc_put_att_text(ncid, NC_GLOBAL, "ts_type",     desc.ts_type.length(),  desc.ts_type.c_str()); HandleNetCDFErrors(retval);

  // time
  retval = nc_def_dim(ncid, "time", NC_UNLIMITED, &time_dimid);  HandleNetCDFErrors(retval);
  dimids1[0] = time_dimid;
  retval = nc_def_var(ncid, "time", NC_DOUBLE, 1, dimids1, &varid_time); HandleNetCDFErrors(retval);
  retval = nc_put_att_text(ncid, varid_time, "units",         starttime.length(),  starttime.c_str()); HandleNetCDFErrors(retval);
  retval = nc_put_att_text(ncid, varid_time, "calendar",      strlen("gregorian"), "gregorian");       HandleNetCDFErrors(retval);
  retval = nc_put_att_text(ncid, varid_time, "standard_name", strlen("time"),      "time");            HandleNetCDFErrors(retval);

  // outflow
  static double fill_val[] = {NETCDF_BLANK_VALUE};
  string longname="total gate outflow";
  string units   ="ft**3 s**-1";
  retval = nc_def_var(ncid,"q_out",NC_DOUBLE,1,dimids1,&varid_q);                                HandleNetCDFErrors(retval);
  retval = nc_put_att_text  (ncid,varid_q,"units",units.length(),units.c_str());                 HandleNetCDFErrors(retval);
  retval = nc_put_att_text  (ncid,varid_q,"long_name",longname.length(),longname.c_str());       HandleNetCDFErrors(retval);
  retval = nc_put_att_double(ncid,varid_q,"_FillValue",NC_DOUBLE,1,fill_val);                    HandleNetCDFErrors(retval);
  retval = nc_put_att_double(ncid,varid_q,"missing_value",NC_DOUBLE,1,fill_val);                 HandleNetCDFErrors(retval);

  retval = nc_enddef(ncid); HandleNetCDFErrors(retval);

  size_t N=(size_t)(series.GetNumRecords());
  if (N>0)
  {
    double *aTime=new double [N];
    double *aQ   =new double [N];
    for (size_t n=0;n<N;n++){
      const flow_record &rec=series.GetRecord((int)(n));
      aTime[n]=(double)(rec.t_sec-t0_sec)/SEC_PER_HR;
      aQ   [n]=rec.flow;
    }
    size_t start1[1]={0};
    size_t count1[1]={N};
    retval = nc_put_vara_double(ncid,varid_time,start1,count1,aTime); HandleNetCDFErrors(retval);
    retval = nc_put_vara_double(ncid,varid_q,   start1,count1,aQ);    HandleNetCDFErrors(retval);
    delete [] aTime;
    delete [] aQ;
  }
  retval = nc_close(ncid); HandleNetCDFErrors(retval);
  return true;
#else
  ExitGracefully("CNetCDFFlowWriter::WriteSeries: GateFlow was built without netCDF support",BAD_DATA_WARN);
  return false;
#endif
}

//////////////////////////////////////////////////////////////////
/// \brief writes timestamps shared by more than one gate log row to <run_name>_<RES>_DuplicateTimestamps.csv
/// \details nothing is written if the series has no duplicate timestamps
/// \return false if file cannot be written
//
bool WriteDuplicateReport(const CFlowSeries &series, const series_descriptor &desc, const optStruct &Options)
{
  if (series.GetNumDuplicates()==0){return true;}

  string tmpFilename=FilenamePrepare(desc.location+"_DuplicateTimestamps.csv",Options);
  ofstream OUT;
  OUT.open(tmpFilename.c_str());
  if (OUT.fail()){
    ExitGracefully(("WriteDuplicateReport: Unable to open output file "+tmpFilename+" for writing.").c_str(),FILE_OPEN_ERR);
    return false;
  }
  OUT<<"timestamp,source_rows,flows ["<<desc.units<<"]"<<endl;
  for (int n=0;n<series.GetNumDuplicates();n++)
  {
    const duplicate_entry &dup=series.GetDuplicate(n);
    OUT<<TimeStructToString(dup.tt)<<",";
    for (size_t k=0;k<dup.aSourceLines.size();k++){
      if (k>0){OUT<<";";}
      OUT<<dup.aSourceLines[k];
    }
    OUT<<",";
    for (size_t k=0;k<dup.aFlows.size();k++){
      if (k>0){OUT<<";";}
      OUT<<DoubleToString(dup.aFlows[k],2);
    }
    OUT<<endl;
  }
  OUT.close();
  return true;
}
