/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  GateFlowInclude.h
  Global constants, enumerated types, structures and common
  function declarations
  ----------------------------------------------------------------*/
#ifndef GATEFLOWINCLUDE_H
#define GATEFLOWINCLUDE_H

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <cmath>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <algorithm>
#include <sys/stat.h>
#if defined(_WIN32)
#include <direct.h>
#endif

#ifdef _GFNETCDF_
#include <netcdf.h>
#endif

using namespace std;

const string __GATEFLOW_VERSION__ ="1.2";

//*****************************************************************
// Global Constants
//*****************************************************************
const int    DOESNT_EXIST       =-1;              ///< return value for nonexistent index

const int    MAXINPUTITEMS      =500;             ///< maximum number of tokens in an input line
const int    MAXCHARINLINE      =6000;            ///< maximum characters in an input line

const double GRAVITY_IMPERIAL   =32.2;            ///< [ft/s2] gravitational acceleration
const double INCHES_PER_FOOT    =12.0;            ///< [in/ft]
const double SEC_PER_HR         =3600;            ///< [s/hr]
const double NETCDF_BLANK_VALUE =-9999.0;         ///< fill value for netCDF output

const int    DAYS_PER_MONTH[12] ={31,28,31,30,31,30,31,31,30,31,30,31};

const string DEFAULT_DATE_COLUMN    ="Date";
const string DEFAULT_TIME_COLUMN    ="Time";
const string DEFAULT_ELEV_COLUMN    ="Lake Elevation";
const string DEFAULT_PARAMETER      ="RES FLOW-OUT";
const string DEFAULT_OUTPUT_VERSION ="Obs Gate Ops";
const string FLOW_UNITS             ="cfs";
const string FLOW_TS_TYPE           ="INST";

//*****************************************************************
// Exit Strategies
//*****************************************************************
////////////////////////////////////////////////////////////////////
/// \brief Types of exit strategies
//
enum exitcode
{
  SIMULATION_DONE,   ///< Run completed
  RUNTIME_ERR,       ///< Runtime error (internal inconsistency)
  BAD_DATA,          ///< Bad input data, program ends
  BAD_DATA_WARN,     ///< Bad input data, error written and execution continues
  FILE_OPEN_ERR,     ///< File could not be opened
  GATEFLOW_OPEN_ERR  ///< The errors file itself could not be opened
};

void ExitGracefully(const char *statement, exitcode code);

/////////////////////////////////////////////////////////////////
/// \brief Exits gracefully if the condition is met
/// \param condition [in] Boolean indicating whether the program should exit
/// \param statement [in] String to print to user upon exit
/// \param code [in] Code to determine why the system is exiting
//
inline void ExitGracefullyIf(bool condition, const char *statement, exitcode code)
{
  if (condition){ExitGracefully(statement,code);}
}

//*****************************************************************
// Enumerated types
//*****************************************************************
////////////////////////////////////////////////////////////////////
/// \brief Formats of flow series output
//
enum output_format
{
  OUTPUT_CSV,        ///< date,hour,flow text hydrograph
  OUTPUT_NETCDF      ///< CF-style netCDF time series
};

////////////////////////////////////////////////////////////////////
/// \brief Treatment of flow records sharing a timestamp
//
enum dup_policy
{
  DUPLICATES_KEEP_LAST,  ///< the record from the latest source row is kept
  DUPLICATES_KEEP_FIRST, ///< the record from the earliest source row is kept
  DUPLICATES_AVERAGE,    ///< a single record with the mean flow replaces the group
  DUPLICATES_KEEP_ALL    ///< all records retained, duplicates only reported
};

//*****************************************************************
// Structures
//*****************************************************************
////////////////////////////////////////////////////////////////////
/// \brief Stores date and time of day of a single observation
//
struct time_struct
{
  string date_string;  ///< String date in yyyy-mm-dd format
  int    year;         ///< year
  int    month;        ///< month of year (1-12)
  int    day_of_month; ///< day of month (1-31)
  int    hour;         ///< hour of day (0-23)
  int    minute;       ///< minute of hour (0-59)
  int    second;       ///< second of minute (0-59)

  time_struct(){
    date_string="0000-01-01";
    year=0; month=1; day_of_month=1;
    hour=0; minute=0; second=0;
  }
};

////////////////////////////////////////////////////////////////////
/// \brief Run-level options
//
struct optStruct
{
  string       gfi_filename;      ///< fully qualified filename of input (.gfi) file
  string       run_name;          ///< prefix for output files
  string       output_dir;        ///< output directory (with trailing slash, may be empty)
  string       main_output_dir;   ///< output directory from command line (overrides :OutputDirectory)

  output_format out_format;       ///< format of flow series output
  dup_policy   duplicates;        ///< duplicate timestamp treatment
  bool         write_dup_report;  ///< true if duplicate report files are written

  bool         noisy;             ///< true if lots of diagnostic output is sent to screen
  bool         silent;            ///< true if nothing is sent to screen

  optStruct(){
    gfi_filename="";
    run_name="";
    output_dir="";
    main_output_dir="";
    out_format=OUTPUT_CSV;
    duplicates=DUPLICATES_KEEP_LAST;
    write_dup_report=true;
    noisy=false;
    silent=false;
  }
};

//*****************************************************************
// Global Variables (necessary, but minimized)
//*****************************************************************
extern string g_output_directory;   ///< directory of errors file and output
extern bool   g_suppress_warnings;  ///< if true, warnings and advisories are not written

//*****************************************************************
// Common Functions (CommonFunctions.cpp)
//*****************************************************************
//Conversion Functions
//----------------------------------------------------------------
inline int    s_to_i (const char *s1){return (int)atof(s1);}

bool          StringToDouble          (const string &s, double &val);
bool          StringIsAllDigits       (const string &s);
string        StringTrim              (const string &s);
string        StringToUppercase       (const string &s);
void          SubstringReplace        (string &str, const string &from, const string &to);
string        IntegralRealToDigits    (const string &s);
string        FormatIdentifier        (const string &s);
string        DoubleToString          (const double &val, const int precision);
double        RoundToDecimals         (const double &val, const int ndec);
bool          IsComment               (const char *s, const int Len);

//Delimited text
//----------------------------------------------------------------
vector<string> SplitDelimitedLine     (const string &line, const char delim);
vector<string> SplitDelimitedLine     (const string &line, const char delim, bool &open_quote);
bool          GetTextLine             (istream &in, string &line);

//Time/Date Functions
//----------------------------------------------------------------
bool          IsLeapYear              (const int year);
bool          IsValidDate             (const int year, const int month, const int day);
bool          ParseDateString         (const string &s, int &year, int &month, int &day);
time_struct   MakeTimeStruct          (const int year, const int month, const int day,
                                       const int hr, const int min, const int sec);
long long     TimeStructToSerialSeconds(const time_struct &tt);
string        TimeOfDayToString       (const time_struct &tt);
string        TimeStructToString      (const time_struct &tt);
string        GetCurrentMachineTime   (void);

//File and directory functions
//----------------------------------------------------------------
string        GetDirectoryName        (const string &fname);
string        CorrectForRelativePath  (const string filename, const string relfile);
void          PrepareOutputdirectory  (const optStruct &Options);
string        FilenamePrepare         (const string filebase, const optStruct &Options);

//Warnings and advisories
//----------------------------------------------------------------
void          WriteWarning            (const string warn, bool noisy);
void          WriteAdvisory           (const string warn, bool noisy);

#ifdef _GFNETCDF_
void          HandleNetCDFErrors      (int error_code);
#endif

#endif
