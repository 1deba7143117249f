/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#include <time.h>
#include "GateFlowInclude.h"
#include "GateFlowMain.h"

static string GateFlowBuildDate(__DATE__);

//////////////////////////////////////////////////////////////////
//
/// \brief Primary GateFlow driver routine
//
/// \param argc [in] number of arguments to executable
/// \param argv[] [in] executable arguments; GateFlow.exe [input.gfi] [-o output_dir] [-r run_name] [-s] [-n]
/// \return Success of main method
//
int main(int argc, char* argv[])
{
  clock_t     t0, t1;          //computational time markers
  optStruct   Options;
  vector<CGateReservoir*> aReservoirs;

  ProcessExecutableArguments(argc,argv,Options);
  PrepareOutputdirectory(Options);

  if (!Options.silent){
    int year = s_to_i(GateFlowBuildDate.substr(GateFlowBuildDate.length()-4,4).c_str());
    cout <<"============================================================"<<endl;
    cout <<"                         GATEFLOW                           "<<endl;
    cout <<"   Reservoir gate operation log normalization and flows     "<<endl;
    cout <<"                        version "<<__GATEFLOW_VERSION__       <<endl;
    cout <<"     Copyright 2024-"<<year<<", the GateFlow Development Team"<<endl;
    cout <<"============================================================"<<endl;
  }

  ofstream WARNINGS((Options.main_output_dir+"GateFlow_errors.txt").c_str());
  if (WARNINGS.fail()){
    string message="Unable to open errors file ("+Options.main_output_dir+"GateFlow_errors.txt)";
    ExitGracefully(message.c_str(),GATEFLOW_OPEN_ERR);
  }
  WARNINGS.close();

  t0=clock();
  //Read input file, create reservoirs
  //------------------------------------------------------------------------------------------------
  if (!ParseMainInputFile(aReservoirs,Options))
  {
    ExitGracefully("Main::Unable to read input file(s)",BAD_DATA);
  }
  if (!Options.silent){
    cout <<"...input parsed: "<<aReservoirs.size()<<" reservoir(s)"<<endl;
  }

  //Process each reservoir in turn; failure of one does not halt the others
  //------------------------------------------------------------------------------------------------
  CFlowSeriesWriterABC *pWriter=CFlowSeriesWriterABC::Create(Options.out_format);
  int nFailed=0;
  for (int i=0;i<(int)(aReservoirs.size());i++)
  {
    CGateReservoir *pRes=aReservoirs[i];
    if (!Options.silent){cout<<"Processing reservoir "<<pRes->GetName()<<"..."<<endl;}

    if (!pRes->Run(Options)){
      nFailed++;
      WriteWarning("Main: reservoir "+pRes->GetName()+" not processed. See errors above.",Options.noisy);
      continue;
    }
    series_descriptor desc=pRes->GetSeriesDescriptor();
    if (!pWriter->WriteSeries(*(pRes->GetFlowSeries()),desc,Options)){nFailed++;}
    if (Options.write_dup_report){
      WriteDuplicateReport(*(pRes->GetFlowSeries()),desc,Options);
    }
    pRes->WriteSummary(Options);
  }
  t1=clock();

  if (!Options.silent){
    cout <<"============================================================"<<endl;
    cout <<"GateFlow run complete: "<<aReservoirs.size()-nFailed<<" of "<<aReservoirs.size()<<" reservoir(s) processed"<<endl;
    cout <<"  elapsed clock time: "<<float(t1-t0)/CLOCKS_PER_SEC<<" s"<<endl;
    if (nFailed>0){
      cout <<"  See "<<Options.output_dir<<"GateFlow_errors.txt for details"<<endl;
    }
  }

  delete pWriter;
  for (int i=0;i<(int)(aReservoirs.size());i++){delete aReservoirs[i];}
  aReservoirs.clear();

  if (nFailed>0){
    ExitGracefully("Main: one or more reservoirs could not be processed",BAD_DATA);
  }
  ExitGracefully("Successful Run",SIMULATION_DONE);
  return 0;
}

/////////////////////////////////////////////////////////////////
/// \brief Processes executable arguments, sets input filename, run name and output directory
//
/// \param argc [in] number of arguments to executable
/// \param argv[] [in] executable arguments
/// \param Options [out] global options structure
//
void ProcessExecutableArguments(int argc, char* argv[], optStruct &Options)
{
  int i=1;
  string word,argument;
  int mode=0;
  argument="";
  //initialization:
  Options.gfi_filename="";
  Options.run_name    ="";
  Options.output_dir  ="";
  Options.main_output_dir="";
  Options.silent=false;
  Options.noisy =false;

  //Parse argument list
  while (i<=argc)
  {
    if (i!=argc){
      word=string(argv[i]);
    }
    if ((word=="-o") || (word=="-r") || (word=="-s") || (word=="-n") || (i==argc))
    {
      if      (mode==0){Options.gfi_filename=argument; argument=""; mode=10;}
      else if (mode==1){Options.output_dir  =argument; argument="";}
      else if (mode==2){Options.run_name    =argument; argument="";}

      if      (word=="-o"){mode=1; }
      else if (word=="-r"){mode=2; }
      else if (word=="-s"){Options.silent=true; Options.noisy=false; mode=10;}
      else if (word=="-n"){Options.noisy=true;  Options.silent=false; mode=10;}
    }
    else{
      if (argument==""){argument+=word;}
      else             {argument+=" "+word;}
    }
    i++;
  }

  if (Options.gfi_filename==""){
    cout<<"usage: GateFlow [input.gfi] [-o output_dir] [-r run_name] [-s] [-n]"<<endl;
    ExitGracefully("ProcessExecutableArguments: no input (.gfi) file specified",BAD_DATA);
  }

  // make sure that output dir has trailing '/' if not empty
  if ((Options.output_dir.compare("") != 0) && (Options.output_dir.back()!='/')){ Options.output_dir=Options.output_dir+"/"; }

  Options.main_output_dir=Options.output_dir;
}
