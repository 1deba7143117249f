/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#include "GateFlowInclude.h"

/////////////////////////////////////////////////////////////////
/// \brief Finalizes program gracefully, explaining reason for finalizing
/// \remark Called from within ExitGracefully()
///
/// \param statement [in] String to print to user upon exit
/// \param code [in] Code to determine why the system is exiting
//
static void FinalizeGracefully(const char *statement, exitcode code)
{
  string typeline;
  switch (code){
    case(SIMULATION_DONE): {typeline="============================================================";break;}
    case(RUNTIME_ERR):     {typeline="Error Type: Runtime Error";       break;}
    case(BAD_DATA):        {typeline="Error Type: Bad input data";      break;}
    case(BAD_DATA_WARN):   {typeline="Error Type: Bad input data";      break;}
    case(FILE_OPEN_ERR):   {typeline="Error Type: File opening error";  break;}
    default:               {typeline="Error Type: Unknown";             break;}
  }

  if (code != GATEFLOW_OPEN_ERR) { //avoids recursion problems
    ofstream WARNINGS;
    WARNINGS.open((g_output_directory+"GateFlow_errors.txt").c_str(),ios::app);
    if (WARNINGS.fail()) {
      WARNINGS.close();
      string message="Unable to open errors file ("+g_output_directory+"GateFlow_errors.txt)";
      ExitGracefully(message.c_str(),GATEFLOW_OPEN_ERR);
      return;
    }
    if (code!=SIMULATION_DONE) {WARNINGS<<"ERROR    : "<< statement << endl;
                                cerr    <<"ERROR    : "<< statement << endl;}
    else                       {WARNINGS<<"SIMULATION COMPLETE :)"<<endl;}

    WARNINGS.close();
  }
  if (code==BAD_DATA_WARN){return;}//just write these errors to a file, processing continues

  cout <<endl<<endl;
  cout <<"============== Exiting Gracefully =========================="<<endl;
  cout <<"Exiting Gracefully: "<<statement                             <<endl;
  cout << typeline                                                     <<endl;
  cout <<"============================================================"<<endl;
}

/////////////////////////////////////////////////////////////////
/// \brief Exits gracefully from program, explaining reason for exit
/// \remark BAD_DATA_WARN errors are recorded and control returns to the caller
///
/// \param statement [in] String to print to user upon exit
/// \param code [in] Code to determine why the system is exiting
//
void ExitGracefully(const char *statement, exitcode code)
{
  FinalizeGracefully(statement, code);
  if      (code==SIMULATION_DONE){exit(0);}
  else if (code!=BAD_DATA_WARN)  {exit(1);}
}
