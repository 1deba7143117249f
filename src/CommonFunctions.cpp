//////////////////////////////////////////////////////////////////
///  GateFlow Library Source Code
///  Copyright (c) 2024-2026 the GateFlow Development Team
//////////////////////////////////////////////////////////////////

#include <time.h>
#include <iomanip>
#include "GateFlowInclude.h"

string g_output_directory ="";
bool   g_suppress_warnings=false;

//////////////////////////////////////////////////////////////////
/// \brief strict conversion of string to double
/// \details leading and trailing blanks are ignored; the remainder must be a complete, finite real number
/// \param s [in] string to convert
/// \param &val [out] converted value (unchanged if conversion fails)
/// \return true if s holds a valid number
//
bool StringToDouble(const string &s, double &val)
{
  string t=StringTrim(s);
  if (t.length()==0){return false;}
  char *pEnd=NULL;
  double v=strtod(t.c_str(),&pEnd);
  if ((pEnd==NULL) || (*pEnd!='\0')){return false;}
  if (!std::isfinite(v))            {return false;}
  val=v;
  return true;
}

//////////////////////////////////////////////////////////////////
/// \return true if string is non-empty and consists only of the characters 0-9
//
bool StringIsAllDigits(const string &s)
{
  if (s.length()==0){return false;}
  for (size_t i=0;i<s.length();i++){
    if ((s[i]<'0') || (s[i]>'9')){return false;}
  }
  return true;
}

//////////////////////////////////////////////////////////////////
/// \brief removes leading and trailing blanks, tabs and line ends
//
string StringTrim(const string &s)
{
  const string ws=" \t\r\n";
  size_t first=s.find_first_not_of(ws);
  if (first==string::npos){return "";}
  size_t last =s.find_last_not_of(ws);
  return s.substr(first,last-first+1);
}

//////////////////////////////////////////////////////////////////
/// \brief converts any lowercase characters in a string to uppercase, returning the converted string
/// \param &s [in] String to be converted to uppercase
/// \return &s converted to uppercase
//
string StringToUppercase(const string &s)
{
  string ret(s.size(), char());
  for(int i = 0; i < (int)(s.size()); ++i)
  {
    if ((s[i] <= 'z' && s[i] >= 'a')){ret[i] =  s[i]-('a'-'A');}
    else                             {ret[i]  = s[i];}
  }
  return ret;
}

//////////////////////////////////////////////////////////////////
/// \brief replaces all instances of substring 'from' with string 'to' in string str
/// \param &str [in/out] string subjected to modification
/// \param &from [in] substring to be replaced
/// \param &to [in]  substring to replace it with
//
void SubstringReplace(string &str,const string &from,const string &to)
{
  if(from.empty()) { return; }
  size_t start_pos = 0;
  while((start_pos = str.find(from,start_pos)) != std::string::npos) {
    str.replace(start_pos,from.length(),to);
    start_pos += to.length();
  }
}

//////////////////////////////////////////////////////////////////
/// \brief strips a zero fractional part from an integral real
/// \details spreadsheet exports write whole numbers in numeric cells as e.g., "800.0";
/// these are returned as their digit string ("800"). Any other string is returned unchanged.
/// \param s [in] string (already trimmed)
//
string IntegralRealToDigits(const string &s)
{
  size_t dot=s.find('.');
  if (dot==string::npos) {return s;}
  string whole=s.substr(0,dot);
  string frac =s.substr(dot+1);
  if (!StringIsAllDigits(whole)){return s;}
  for (size_t i=0;i<frac.length();i++){
    if (frac[i]!='0'){return s;}
  }
  return whole;
}

//////////////////////////////////////////////////////////////////
/// \brief returns cleaned identifier text (trimmed, "1.0" -> "1")
//
string FormatIdentifier(const string &s)
{
  return IntegralRealToDigits(StringTrim(s));
}

//////////////////////////////////////////////////////////////////
/// \brief fixed-point representation of a real number
/// \param val [in] value
/// \param precision [in] number of decimal places
//
string DoubleToString(const double &val, const int precision)
{
  ostringstream out;
  out<<fixed<<setprecision(precision)<<val;
  return out.str();
}

//////////////////////////////////////////////////////////////////
/// \brief rounds value to specified number of decimal places
/// \note halfway cases are rounded to even
//
double RoundToDecimals(const double &val, const int ndec)
{
  double mult=pow(10.0,ndec);
  return rint(val*mult)/mult;
}

//////////////////////////////////////////////////////////////////
/// \brief determines whether line is a comment
/// \param *s [in] first token of line
/// \param Len [in] number of tokens in line
/// \return true if line is empty or a comment
//
bool IsComment(const char *s, const int Len)
{
  if ((Len==0) || (s[0]=='#') || (s[0]=='*')){return true;}
  return false;
}

//////////////////////////////////////////////////////////////////
/// \brief splits a line of delimited text into fields
/// \details A field starting with a double quote extends to the matching closing quote;
/// inside it the delimiter is literal and "" stands for a single quote character.
/// A quote appearing inside an unquoted field (e.g., 6" for six inches) is kept as-is.
/// Empty fields are preserved, so a line with N delimiters always yields N+1 fields.
///
/// \param &line [in] line of text, without line ending
/// \param delim [in] field delimiter
/// \return vector of fields, unquoted but not trimmed
//
vector<string> SplitDelimitedLine(const string &line, const char delim)
{
  bool open_quote;
  return SplitDelimitedLine(line,delim,open_quote);
}
//////////////////////////////////////////////////////////////////
/// \brief as above, also reporting whether the line ended inside a quoted field
/// \param &open_quote [out] true if the last field's closing quote was not found (the field continues on the next line)
//
vector<string> SplitDelimitedLine(const string &line, const char delim, bool &open_quote)
{
  vector<string> fields;
  string field="";
  bool   in_quotes=false;
  bool   at_start =true;

  for (size_t i=0;i<line.size();i++)
  {
    char c=line[i];
    if (in_quotes)
    {
      if (c=='"'){
        if (((i+1)<line.size()) && (line[i+1]=='"')){field+='"'; i++;}//escaped quote
        else                                        {in_quotes=false;}
      }
      else {field+=c;}
    }
    else if (c==delim){
      fields.push_back(field);
      field="";
      at_start=true;
      continue;
    }
    else if ((c=='"') && (at_start)){in_quotes=true;}
    else                            {field+=c;}
    at_start=false;
  }
  fields.push_back(field);
  open_quote=in_quotes;
  return fields;
}

//////////////////////////////////////////////////////////////////
/// \brief reads next line of text, removing the trailing carriage return of DOS-formatted files
/// \return false at end of stream
//
bool GetTextLine(istream &in, string &line)
{
  if (!getline(in,line)){return false;}
  if ((line.length()>0) && (line[line.length()-1]=='\r')){line.erase(line.length()-1);}
  return true;
}

////////////////////////////////////////////////////////////////////////////
/// \brief Returns boolean value indicating if year passed is a leap year
/// \note proleptic gregorian calendar
///
/// \param year     [in] Integer year
/// \return Boolean value indicating if year passed is a leap year
//
bool IsLeapYear(const int year)
{
  return (((year % 4 == 0) && (year % 100 != 0)) || (year % 400 == 0));
}

//////////////////////////////////////////////////////////////////
/// \return true if year/month/day is a valid calendar date
//
bool IsValidDate(const int year, const int month, const int day)
{
  if ((month<1) || (month>12)){return false;}
  int ndays=DAYS_PER_MONTH[month-1];
  if ((month==2) && (IsLeapYear(year))){ndays=29;}
  return ((day>=1) && (day<=ndays));
}

//////////////////////////////////////////////////////////////////
/// \brief parses calendar date from string
/// \details accepts yyyy-mm-dd, yyyy/mm/dd, m/d/yyyy and m-d-yyyy, any of which may be followed by
/// a blank and a time of day (ignored). Two-digit years (m/d/yy, m-d-yy) are taken as 2000-2068
/// for 00-68 and 1969-1999 for 69-99.
///
/// \param &s [in] date string
/// \param &year [out] year
/// \param &month [out] month (1-12)
/// \param &day [out] day of month
/// \return true if string holds a valid calendar date
//
bool ParseDateString(const string &s, int &year, int &month, int &day)
{
  string sDate=StringTrim(s);
  size_t blank=sDate.find_first_of(" T");
  if (blank!=string::npos){sDate=sDate.substr(0,blank);}

  char sep='-';
  if (sDate.find('/')!=string::npos){sep='/';}
  vector<string> parts=SplitDelimitedLine(sDate,sep);
  if (parts.size()!=3){return false;}
  for (int i=0;i<3;i++){
    if (!StringIsAllDigits(parts[i])){return false;}
  }

  if (parts[0].length()==4){//yyyy-mm-dd
    if ((parts[1].length()>2) || (parts[2].length()>2)){return false;}
    year =s_to_i(parts[0].c_str());
    month=s_to_i(parts[1].c_str());
    day  =s_to_i(parts[2].c_str());
  }
  else if ((parts[2].length()==4) || (parts[2].length()==2)){//m/d/yyyy or m/d/yy
    if ((parts[0].length()>2) || (parts[1].length()>2)){return false;}
    month=s_to_i(parts[0].c_str());
    day  =s_to_i(parts[1].c_str());
    year =s_to_i(parts[2].c_str());
    if (parts[2].length()==2){
      if (year<69){year+=2000;}
      else        {year+=1900;}
    }
  }
  else {return false;}

  return IsValidDate(year,month,day);
}

//////////////////////////////////////////////////////////////////
/// \brief builds time structure from calendar date and time of day
/// \remark date and time are assumed to have been validated
//
time_struct MakeTimeStruct(const int year, const int month, const int day,
                           const int hr,   const int min,   const int sec)
{
  time_struct tt;
  tt.year        =year;
  tt.month       =month;
  tt.day_of_month=day;
  tt.hour        =hr;
  tt.minute      =min;
  tt.second      =sec;

  char s[20];
  sprintf(s,"%04i-%02i-%02i",year,month,day);
  tt.date_string=string(s);

  return tt;
}

//////////////////////////////////////////////////////////////////
/// \brief returns number of seconds since 1970-01-01 00:00:00
/// \details used for ordering and comparing timestamps; days from civil date after H. Hinnant
//
long long TimeStructToSerialSeconds(const time_struct &tt)
{
  long long y  =tt.year;
  long long m  =tt.month;
  long long d  =tt.day_of_month;
  y-=(m<=2);
  long long era=(y>=0 ? y : y-399)/400;
  long long yoe=y-era*400;
  long long doy=(153*(m+(m>2 ? -3 : 9))+2)/5+d-1;
  long long doe=yoe*365+yoe/4-yoe/100+doy;
  long long days=era*146097+doe-719468;
  return days*86400+tt.hour*3600+tt.minute*60+tt.second;
}

//////////////////////////////////////////////////////////////////
/// \return time of day as hh:mm:ss
//
string TimeOfDayToString(const time_struct &tt)
{
  char s[12];
  sprintf(s,"%02i:%02i:%02i",tt.hour,tt.minute,tt.second);
  return string(s);
}

//////////////////////////////////////////////////////////////////
/// \return timestamp as yyyy-mm-dd hh:mm:ss
//
string TimeStructToString(const time_struct &tt)
{
  return tt.date_string+" "+TimeOfDayToString(tt);
}

////////////////////////////////////////////////////// /////////////////////
/// \brief Get the current system date/time
/// \return "now" as an ISO formatted string
string GetCurrentMachineTime(void)
{
  time_t now;
  time(&now);
  struct tm *curTime = localtime(&now);

  char s[20];
  sprintf(s,"%4i-%02i-%02i %02i:%02i:%02i",
          curTime->tm_year+1900, curTime->tm_mon+1, curTime->tm_mday,
          curTime->tm_hour, curTime->tm_min, curTime->tm_sec);

  return string(s);
}

//////////////////////////////////////////////////////////////////
/// \brief returns directory path given filename
///
/// \param fname [in] filename, e.g., /tmp/lake/thisfile.gfi returns /tmp/lake
//
string GetDirectoryName(const string &fname)
{
  size_t pos = fname.find_last_of("\\/");
  if (std::string::npos == pos){ return ""; }
  else                         { return fname.substr(0, pos);}
}

//////////////////////////////////////////////////////////////////
/// \brief returns path of file given relative to the directory of a reference file
///
/// \param filename [in] filename, e.g., gatelog.csv
/// \param relfile [in] filename of reference file, e.g., ../lake/run.gfi
/// \return e.g., ../lake/gatelog.csv; absolute filenames are returned unchanged
//
string CorrectForRelativePath(const string filename,const string relfile)
{
  string filedir = GetDirectoryName(relfile);
  if ((filedir=="") || (filename==""))               {return filename;}
  if (filename.substr(0,1)=="/")                     {return filename;}//UNIX absolute path
  if ((filename.length()>1) && (filename[1]==':'))   {return filename;}//WINDOWS absolute path
  return filedir+"/"+filename;
}

/////////////////////////////////////////////////////////////////
/// \brief writes warning to screen and to GateFlow_errors.txt file
/// \param warn [in] warning message printed
//
void WriteWarning(const string warn, bool noisy)
{
  if (!g_suppress_warnings){
    ofstream WARNINGS;
    WARNINGS.open((g_output_directory+"GateFlow_errors.txt").c_str(),ios::app);
    if (noisy){cout<<"WARNING!: "<<warn<<endl;}
    WARNINGS<<"WARNING  : "<<warn<<endl;
    WARNINGS.close();
  }
}
/////////////////////////////////////////////////////////////////
/// \brief writes advisory to screen and to GateFlow_errors.txt file
/// \param warn [in] warning message printed
//
void WriteAdvisory(const string warn, bool noisy)
{
  if (!g_suppress_warnings){
    ofstream WARNINGS;
    WARNINGS.open((g_output_directory+"GateFlow_errors.txt").c_str(),ios::app);
    if (noisy){cout<<"ADVISORY: "<<warn<<endl;}
    WARNINGS<<"ADVISORY : "<<warn<<endl;
    WARNINGS.close();
  }
}

#ifdef _GFNETCDF_
///////////////////////////////////////////////////////////////////
/// \brief NetCDF error handling
/// \return Error string and NetCDF exit code
//
void HandleNetCDFErrors(int error_code)
{
  if(error_code==0){ return; }
  string warn;
  warn="NetCDF error ["+ string(nc_strerror(error_code))+"] occured.";
  ExitGracefully(warn.c_str(),BAD_DATA);
}
#endif
