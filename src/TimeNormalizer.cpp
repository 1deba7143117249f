/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#include "TimeNormalizer.h"

//////////////////////////////////////////////////////////////////
/// \brief splits H:MM or HH:MM into hour and minute digit strings
/// \return true if s has exactly this shape
//
static bool SplitHourMinute(const string &s, string &hr, string &min)
{
  size_t colon=s.find(':');
  if (colon==string::npos){return false;}
  hr =s.substr(0,colon);
  min=s.substr(colon+1);
  if ((hr.length()<1) || (hr.length()>2)){return false;}
  if (min.length()!=2)                   {return false;}
  return (StringIsAllDigits(hr) && StringIsAllDigits(min));
}

//////////////////////////////////////////////////////////////////
/// \brief converts a time-of-day cell from a gate log to canonical form
/// \details recognized encodings (after trimming and conversion to uppercase):
///   "123"    -> "1:23:00"
///   "1234"   -> "12:34:00"
///   "12345"  -> "12:34:5"  (seconds field is not padded)
///   "1:23" / "12:34"   -> "01:23:00" / "12:34:00"
///   "1:24A" / "1:24P"  -> "01:24:00" / "13:24:00"
/// an integral real (e.g., "800.0" from a numeric cell) is treated as its digit string.
/// Anything else is returned unchanged, to be judged by ParseTimeOfDay().
///
/// \param &raw [in] raw cell contents
/// \return canonical time string, or empty string if cell is empty
//
string NormalizeTimeString(const string &raw)
{
  string s=StringToUppercase(StringTrim(raw));
  if (s.length()==0){return "";}
  s=IntegralRealToDigits(s);

  string hr,min;
  char   buf[20];
  char   last=s[s.length()-1];

  //H:MMA or H:MMP
  if (((last=='A') || (last=='P')) && (SplitHourMinute(s.substr(0,s.length()-1),hr,min)))
  {
    int h=s_to_i(hr.c_str());
    if      ((last=='P') && (h!=12)){h+=12;}
    else if ((last=='A') && (h==12)){h=0;  }
    sprintf(buf,"%02i:%s:00",h,min.c_str());
    return string(buf);
  }
  //H:MM or HH:MM
  if (SplitHourMinute(s,hr,min))
  {
    sprintf(buf,"%02i:%s:00",s_to_i(hr.c_str()),min.c_str());
    return string(buf);
  }
  //HMM, HHMM, HHMMS
  if (StringIsAllDigits(s))
  {
    if      (s.length()==3){return s.substr(0,1)+":"+s.substr(1,2)+":00";}
    else if (s.length()==4){return s.substr(0,2)+":"+s.substr(2,2)+":00";}
    else if (s.length()==5){return s.substr(0,2)+":"+s.substr(2,2)+":"+s.substr(4,1);}
  }
  return s;
}

//////////////////////////////////////////////////////////////////
/// \brief parses a time of day
/// \details accepts H:MM, H:MM:S, H:MM:SS, optionally with fractional seconds (truncated)
/// and optionally followed by an AM/PM/A/P marker
///
/// \param &s [in] time string, usually output of NormalizeTimeString()
/// \param &hr [out] hour (0-23)
/// \param &min [out] minute (0-59)
/// \param &sec [out] second (0-59)
/// \return false if string is not a valid time of day
//
bool ParseTimeOfDay(const string &s, int &hr, int &min, int &sec)
{
  string t=StringToUppercase(StringTrim(s));
  if (t.length()==0){return false;}

  char marker=' ';
  if ((t.length()>2) && ((t.substr(t.length()-2)=="AM") || (t.substr(t.length()-2)=="PM"))){
    marker=t[t.length()-2];
    t=StringTrim(t.substr(0,t.length()-2));
  }
  else if ((t[t.length()-1]=='A') || (t[t.length()-1]=='P')){
    marker=t[t.length()-1];
    t=StringTrim(t.substr(0,t.length()-1));
  }

  vector<string> parts=SplitDelimitedLine(t,':');
  if ((parts.size()<2) || (parts.size()>3)){return false;}

  string sSec="0";
  if (parts.size()==3){
    sSec=parts[2];
    size_t dot=sSec.find('.');
    if (dot!=string::npos){
      if (!StringIsAllDigits(sSec.substr(dot+1))){return false;}
      sSec=sSec.substr(0,dot);
    }
  }
  if ((parts[0].length()<1) || (parts[0].length()>2) || (!StringIsAllDigits(parts[0]))){return false;}
  if ((parts[1].length()<1) || (parts[1].length()>2) || (!StringIsAllDigits(parts[1]))){return false;}
  if ((sSec.length()<1)     || (sSec.length()>2)     || (!StringIsAllDigits(sSec)))    {return false;}

  int h=s_to_i(parts[0].c_str());
  int m=s_to_i(parts[1].c_str());
  int c=s_to_i(sSec.c_str());

  if (marker!=' '){
    if ((h<1) || (h>12)){return false;}
    if      ((marker=='P') && (h!=12)){h+=12;}
    else if ((marker=='A') && (h==12)){h=0;  }
  }
  if ((h<0) || (h>23) || (m<0) || (m>59) || (c<0) || (c>59)){return false;}

  hr=h; min=m; sec=c;
  return true;
}
