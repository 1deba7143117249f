/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#include "GateFlowInclude.h"
#include "GateFlowMain.h"
#include "ParseLib.h"

void   ImproperFormatWarning(string command, CParser *p, bool noisy);
string JoinTokens           (char **s, const int first, const int Len);

///////////////////////////////////////////////////////////////////
/// \brief This method is the GateFlow input routine, called by main; it reads the input
/// (.gfi) file, sets run options and creates all reservoirs
///
/// \details reservoir constants are only checked when each reservoir is initialized, so
/// that one badly described reservoir does not prevent the others from being processed
///
/// \param &aReservoirs [out] reservoirs described in file (created with new; caller owns)
/// \param &Options [in/out] Global options information
/// \return Boolean value indicating success of parsing
//
bool ParseMainInputFile(vector<CGateReservoir*> &aReservoirs, optStruct &Options)
{
  CGateReservoir   *pRes=NULL;       //reservoir block being read
  ifstream          INPUT;
  bool              runname_overridden(false);
  bool              rundir_overridden(false);

  int               code;            //Parsing vars
  bool              ended(false);
  int               Len,line(0);
  char             *s[MAXINPUTITEMS];

  if (Options.noisy){
    cout <<"======================================================"<<endl;
    cout << "Parsing Input File " << Options.gfi_filename <<"..."<<endl;
    cout <<"======================================================"<<endl;
  }

  INPUT.open(Options.gfi_filename.c_str());
  if (INPUT.fail()){cout << "Cannot find file "<<Options.gfi_filename <<endl; return false;}

  CParser *p=new CParser(INPUT,Options.gfi_filename,line);

  //===============================================================================================
  // Set Default Option Values
  //===============================================================================================
  if(Options.run_name!=""       ){runname_overridden=true;}
  if(Options.main_output_dir!=""){rundir_overridden =true;}
  Options.out_format      =OUTPUT_CSV;
  Options.duplicates      =DUPLICATES_KEEP_LAST;
  Options.write_dup_report=true;

  //===============================================================================================
  // Sift through file, processing each command
  //===============================================================================================
  bool end_of_file=p->Tokenize(s,Len);
  while(!end_of_file)
  {
    if (ended){break;}
    if (Options.noisy){ cout << "reading line " << p->GetLineNumber() << ": ";}

    /*assign code for switch statement
      ------------------------------------------------------------------
      <0           : ignored/special
      0   thru 100 : Run options
      100 thru 200 : Reservoir properties
      ------------------------------------------------------------------
    */

    code=0;
    //---------------------SPECIAL -----------------------------
    if       (Len==0)                                     {code=-1; }
    else if  (IsComment(s[0],Len))                        {code=-2; }//comment
    else if  (!strcmp(s[0],":End"                       )){code=-3; }//premature end of file
    //--------------------RUN OPTIONS --------------------------
    else if  (!strcmp(s[0],":RunName"                   )){code=1;  }
    else if  (!strcmp(s[0],":OutputDirectory"           )){code=2;  }
    else if  (!strcmp(s[0],":OutputFormat"              )){code=3;  }
    else if  (!strcmp(s[0],":DuplicateTimestamps"       )){code=4;  }
    else if  (!strcmp(s[0],":WriteDuplicateReport"      )){code=5;  }
    else if  (!strcmp(s[0],":NoDuplicateReport"         )){code=6;  }
    else if  (!strcmp(s[0],":NoisyMode"                 )){code=7;  }
    else if  (!strcmp(s[0],":SilentMode"                )){code=8;  }
    else if  (!strcmp(s[0],":SuppressWarnings"          )){code=9;  }
    //--------------------RESERVOIRS ---------------------------
    else if  (!strcmp(s[0],":Reservoir"                 )){code=100;}
    else if  (!strcmp(s[0],":EndReservoir"              )){code=101;}
    else if  (!strcmp(s[0],":GateLogFile"               )){code=102;}
    else if  (!strcmp(s[0],":GateLogRowsToSkip"         )){code=103;}
    else if  (!strcmp(s[0],":DateColumn"                )){code=104;}
    else if  (!strcmp(s[0],":TimeColumn"                )){code=105;}
    else if  (!strcmp(s[0],":LakeElevationColumn"       )){code=106;}
    else if  (!strcmp(s[0],":GateBlock"                 )){code=107;}
    else if  (!strcmp(s[0],":DropTrailingColumn"        )){code=108;}
    else if  (!strcmp(s[0],":GateIdentifiers"           )){code=109;}
    else if  (!strcmp(s[0],":SpillwayInvertElevation"   )){code=110;}
    else if  (!strcmp(s[0],":GateLength"                )){code=111;}
    else if  (!strcmp(s[0],":RatingCurveFile"           )){code=112;}
    else if  (!strcmp(s[0],":RatingCurveRowsToSkip"     )){code=113;}
    else if  (!strcmp(s[0],":RatingCurve"               )){code=114;}
    else if  (!strcmp(s[0],":MeasurementType"           )){code=115;}
    else if  (!strcmp(s[0],":OutputVersion"             )){code=116;}

    ExitGracefullyIf((code>101) && (code<200) && (pRes==NULL),
                     "ParseMainInputFile: reservoir properties must be given within a :Reservoir ... :EndReservoir block",BAD_DATA);

    switch(code)
    {
    case(-1):  //----------------------------------------------
    {/*Blank Line*/
      if (Options.noisy) {cout <<""<<endl;}break;
    }
    case(-2):  //----------------------------------------------
    {/*Comment # */
      if (Options.noisy) {cout <<"*"<<endl;} break;
    }
    case(-3):  //----------------------------------------------
    {/*:End*/
      if (Options.noisy) {cout <<"EOF"<<endl;} ended=true; break;
    }
    case(1):  //--------------------------------------------
    {/*:RunName [run name]*/
      if (Len<2){ImproperFormatWarning(":RunName",p,Options.noisy); break;}
      if(!runname_overridden) {
        if(Options.noisy) { cout <<"Using Run Name: "<<s[1]<<endl; }
        Options.run_name=s[1];
      }
      else {
        WriteWarning("ParseMainInputFile: when run_name is specified from command line, it cannot be overridden in the .gfi file. :RunName command ignored.",Options.noisy);
      }
      break;
    }
    case(2):  //--------------------------------------------
    {/*:OutputDirectory [dir]*/
      if (Len<2){ImproperFormatWarning(":OutputDirectory",p,Options.noisy); break;}
      if (Options.noisy) {cout <<"Output directory: "<<s[1]<<"/"<<endl;}
      if (!rundir_overridden)
      {
        Options.output_dir=CorrectForRelativePath(JoinTokens(s,1,Len),Options.gfi_filename);//if spaces in folder name
        if (Options.output_dir[Options.output_dir.length()-1]!='/'){Options.output_dir+="/";}
        PrepareOutputdirectory(Options);

        ofstream WARNINGS((Options.output_dir+"GateFlow_errors.txt").c_str());
        WARNINGS.close();
      }
      else {
        WriteWarning("ParseMainInputFile: :OutputDirectory command was ignored because directory was specified from command line.",Options.noisy);
      }
      break;
    }
    case(3):  //--------------------------------------------
    {/*:OutputFormat [CSV|NETCDF]*/
      if (Len<2){ImproperFormatWarning(":OutputFormat",p,Options.noisy); break;}
      string fmt=StringToUppercase(s[1]);
      if (Options.noisy) {cout <<"Output format: "<<fmt<<endl;}
      if      (fmt=="CSV")   {Options.out_format=OUTPUT_CSV;}
      else if (fmt=="NETCDF"){
#ifdef _GFNETCDF_
        Options.out_format=OUTPUT_NETCDF;
#else
        ExitGracefully("ParseMainInputFile: :OutputFormat NETCDF requires GateFlow to be compiled with netCDF support",BAD_DATA);
#endif
      }
      else {
        WriteWarning("ParseMainInputFile: unrecognized :OutputFormat "+fmt+"; CSV output used",Options.noisy);
        Options.out_format=OUTPUT_CSV;
      }
      break;
    }
    case(4):  //--------------------------------------------
    {/*:DuplicateTimestamps [KEEP_LAST|KEEP_FIRST|AVERAGE|KEEP_ALL]*/
      if (Len<2){ImproperFormatWarning(":DuplicateTimestamps",p,Options.noisy); break;}
      bool is_valid;
      dup_policy policy=StringToDupPolicy(s[1],is_valid);
      if (!is_valid){
        WriteWarning("ParseMainInputFile: unrecognized :DuplicateTimestamps policy "+string(s[1])+"; KEEP_LAST used",Options.noisy);
      }
      if (Options.noisy) {cout <<"Duplicate timestamps: "<<DupPolicyToString(policy)<<endl;}
      Options.duplicates=policy;
      break;
    }
    case(5):  //--------------------------------------------
    {/*:WriteDuplicateReport*/
      if (Options.noisy) {cout <<"Write duplicate report ON"<<endl;}
      Options.write_dup_report=true;
      break;
    }
    case(6):  //--------------------------------------------
    {/*:NoDuplicateReport*/
      if (Options.noisy) {cout <<"Write duplicate report OFF"<<endl;}
      Options.write_dup_report=false;
      break;
    }
    case(7):  //--------------------------------------------
    {/*:NoisyMode */
      cout <<"Noisy Mode!!!!"<<endl;
      Options.noisy=true;Options.silent=false;
      break;
    }
    case(8):  //--------------------------------------------
    {/*:SilentMode */
      Options.noisy=false;Options.silent=true;
      break;
    }
    case(9):  //--------------------------------------------
    {/*:SuppressWarnings */
      if (Options.noisy) {cout <<"Suppressing warnings"<<endl;}
      g_suppress_warnings=true;
      break;
    }
    case(100):  //--------------------------------------------
    {/*:Reservoir [name]*/
      if (Len<2){ImproperFormatWarning(":Reservoir",p,Options.noisy); break;}
      if (pRes!=NULL){
        ExitGracefully("ParseMainInputFile: :Reservoir block started before previous :EndReservoir",BAD_DATA);
        break;
      }
      if (Options.noisy) {cout <<"Reservoir "<<s[1]<<endl;}
      pRes=new CGateReservoir(s[1]);
      aReservoirs.push_back(pRes);
      break;
    }
    case(101):  //--------------------------------------------
    {/*:EndReservoir*/
      if (Options.noisy) {cout <<"End Reservoir"<<endl;}
      if (pRes==NULL){
        WriteWarning("ParseMainInputFile: :EndReservoir without matching :Reservoir at line "+to_string(p->GetLineNumber()),Options.noisy);
      }
      pRes=NULL;
      break;
    }
    case(102):  //--------------------------------------------
    {/*:GateLogFile [filename]*/
      if (Len<2){ImproperFormatWarning(":GateLogFile",p,Options.noisy); break;}
      string filename=CorrectForRelativePath(JoinTokens(s,1,Len),Options.gfi_filename);
      if (Options.noisy) {cout <<"Gate log file: "<<filename<<endl;}
      pRes->SetGateLogFile(filename);
      break;
    }
    case(103):  //--------------------------------------------
    {/*:GateLogRowsToSkip [n]*/
      if (Len<2){ImproperFormatWarning(":GateLogRowsToSkip",p,Options.noisy); break;}
      pRes->SetGateLogRowsToSkip(max(s_to_i(s[1]),0));
      break;
    }
    case(104):  //--------------------------------------------
    {/*:DateColumn [header text]*/
      if (Len<2){ImproperFormatWarning(":DateColumn",p,Options.noisy); break;}
      pRes->SetDateColumn(JoinTokens(s,1,Len));
      break;
    }
    case(105):  //--------------------------------------------
    {/*:TimeColumn [header text]*/
      if (Len<2){ImproperFormatWarning(":TimeColumn",p,Options.noisy); break;}
      pRes->SetTimeColumn(JoinTokens(s,1,Len));
      break;
    }
    case(106):  //--------------------------------------------
    {/*:LakeElevationColumn [header text]*/
      if (Len<2){ImproperFormatWarning(":LakeElevationColumn",p,Options.noisy); break;}
      pRes->SetLakeElevationColumn(JoinTokens(s,1,Len));
      break;
    }
    case(107):  //--------------------------------------------
    {/*:GateBlock [first column] [last column+1]*/
      if (Len<3){ImproperFormatWarning(":GateBlock",p,Options.noisy); break;}
      pRes->SetGateBlock(s_to_i(s[1]),s_to_i(s[2]));
      break;
    }
    case(108):  //--------------------------------------------
    {/*:DropTrailingColumn*/
      pRes->SetDropTrailingColumn(true);
      break;
    }
    case(109):  //--------------------------------------------
    {/*:GateIdentifiers [id1] [id2] ... [idN]*/
      if (Len<2){ImproperFormatWarning(":GateIdentifiers",p,Options.noisy); break;}
      vector<string> ids;
      for (int i=1;i<Len;i++){ids.push_back(FormatIdentifier(s[i]));}
      pRes->SetGateIdentifiers(ids);
      break;
    }
    case(110):  //--------------------------------------------
    {/*:SpillwayInvertElevation [elev, ft]*/
      double elev;
      if ((Len<2) || (!StringToDouble(s[1],elev))){ImproperFormatWarning(":SpillwayInvertElevation",p,Options.noisy); break;}
      pRes->SetSpillwayInvert(elev);
      break;
    }
    case(111):  //--------------------------------------------
    {/*:GateLength [length, ft]*/
      double L;
      if ((Len<2) || (!StringToDouble(s[1],L))){ImproperFormatWarning(":GateLength",p,Options.noisy); break;}
      pRes->SetGateLength(L);
      break;
    }
    case(112):  //--------------------------------------------
    {/*:RatingCurveFile [filename]*/
      if (Len<2){ImproperFormatWarning(":RatingCurveFile",p,Options.noisy); break;}
      string filename=CorrectForRelativePath(JoinTokens(s,1,Len),Options.gfi_filename);
      if (Options.noisy) {cout <<"Rating curve file: "<<filename<<endl;}
      pRes->SetRatingCurveFile(filename);
      break;
    }
    case(113):  //--------------------------------------------
    {/*:RatingCurveRowsToSkip [n]*/
      if (Len<2){ImproperFormatWarning(":RatingCurveRowsToSkip",p,Options.noisy); break;}
      pRes->SetRatingCurveRowsToSkip(max(s_to_i(s[1]),0));
      break;
    }
    case(114):  //--------------------------------------------
    {/*:RatingCurve
         :Points
           [d, ft] [C]
           ...
         :EndPoints
       :EndRatingCurve*/
      if (Options.noisy) {cout <<"Rating curve"<<endl;}
      bool done=false;
      while (!done)
      {
        if (p->Tokenize(s,Len)){
          ExitGracefully("ParseMainInputFile: :RatingCurve block not terminated by :EndRatingCurve",BAD_DATA);
          break;
        }
        double d,C;
        if      (Len==0)                                              {}//blank or comment
        else if ((!strcmp(s[0],":Points")) || (!strcmp(s[0],":EndPoints"))){}
        else if (!strcmp(s[0],":EndRatingCurve"))                     {done=true;}
        else if (Len<2)                                               {ImproperFormatWarning(":RatingCurve",p,Options.noisy);}
        else if ((StringToDouble(s[0],d)) && (StringToDouble(s[1],C))){pRes->AddRatingCurvePoint(d,C);}
        else {
          WriteAdvisory("ParseMainInputFile: :RatingCurve entry at line "+to_string(p->GetLineNumber())+" is not a number pair; skipped",Options.noisy);
        }
      }
      break;
    }
    case(115):  //--------------------------------------------
    {/*:MeasurementType [text]*/
      if (Len<2){ImproperFormatWarning(":MeasurementType",p,Options.noisy); break;}
      pRes->SetMeasurementType(JoinTokens(s,1,Len));
      break;
    }
    case(116):  //--------------------------------------------
    {/*:OutputVersion [text]*/
      if (Len<2){ImproperFormatWarning(":OutputVersion",p,Options.noisy); break;}
      pRes->SetOutputVersion(JoinTokens(s,1,Len));
      break;
    }
    default://----------------------------------------------
    {
      char firstChar = *(s[0]);
      if (firstChar==':')
      {
        string warn ="IGNORING unrecognized command: " + string(s[0])+ " in .gfi file";
        WriteWarning(warn,Options.noisy);
      }
      else
      {
        string errString = "Unrecognized command in .gfi file:\n   " + string(s[0]);
        ExitGracefully(errString.c_str(),BAD_DATA_WARN);
      }
      break;
    }
    }//switch

    end_of_file=p->Tokenize(s,Len);
  } //end while (!end_of_file)
  INPUT.close();
  delete p; p=NULL;

  //===============================================================================================
  //Check input quality
  //===============================================================================================
  if (pRes!=NULL){
    WriteWarning("ParseMainInputFile: :Reservoir "+pRes->GetName()+" block not closed with :EndReservoir",Options.noisy);
  }
  if (aReservoirs.size()==0){
    WriteWarning("ParseMainInputFile: no reservoirs specified in "+Options.gfi_filename,Options.noisy);
  }
  return true;
}

///////////////////////////////////////////////////////////////////
/// \brief writes warning for command with too few parameters
//
void ImproperFormatWarning(string command, CParser *p, bool noisy)
{
  string warn;
  warn=command+" command: improper line length at line "+to_string(p->GetLineNumber())+" of "+p->GetFilename();
  WriteWarning(warn,noisy);
}

///////////////////////////////////////////////////////////////////
/// \brief rejoins tokens first..Len-1 with single blanks (e.g., for names with spaces)
//
string JoinTokens(char **s, const int first, const int Len)
{
  string out="";
  for (int i=first;i<Len;i++){
    if (i>first){out+=" ";}
    out+=s[i];
  }
  return out;
}
