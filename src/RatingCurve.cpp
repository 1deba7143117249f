/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#include "RatingCurve.h"

//////////////////////////////////////////////////////////////////
// Constructor/Destructor
//
CRatingCurve::CRatingCurve(const string name, const double *d, const double *C, const int N)
{
  ExitGracefullyIf(N<=0,"CRatingCurve: rating curve must have at least one entry",RUNTIME_ERR);
  _name=name;
  _aD=new double [N];
  _aC=new double [N];
  _nPoints=N;
  for (int i = 0; i < _nPoints; i++) {
    _aD[i]=RoundToDecimals(d[i],2);
    _aC[i]=C[i];
  }
}
CRatingCurve::~CRatingCurve() {
  delete [] _aD;
  delete [] _aC;
}
//////////////////////////////////////////////////////////////////
// Accessors
//
string CRatingCurve::GetName     () const {return _name;}
int    CRatingCurve::GetNumPoints() const {return _nPoints;}
double CRatingCurve::GetOpening(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=_nPoints),"CRatingCurve::GetOpening: bad index",RUNTIME_ERR);
  return _aD[i];
}
double CRatingCurve::GetCoeffAt(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=_nPoints),"CRatingCurve::GetCoeffAt: bad index",RUNTIME_ERR);
  return _aC[i];
}

//////////////////////////////////////////////////////////////////
/// \brief returns discharge coefficient for gate opening d
/// \details exact match on d if present; otherwise the entry with smallest |d_i-d|
/// (first in table order in case of ties). Use of the closest entry is written as an advisory.
///
/// \param &d [in] gate opening [ft], rounded to 0.01 ft
/// \param &is_fallback [out] true if no exact match was found
/// \param &d_used [out] opening of the entry used
/// \return discharge coefficient
//
double CRatingCurve::GetCoefficient(const double &d, bool &is_fallback, double &d_used) const
{
  const double TOL=1e-9;
  for (int i=0;i<_nPoints;i++){
    if (fabs(_aD[i]-d)<TOL){
      is_fallback=false;
      d_used     =_aD[i];
      return _aC[i];
    }
  }
  //distances in whole hundredths of a foot
  int  ibest=0;
  long dmin =labs(lrint(100.0*_aD[0])-lrint(100.0*d));
  for (int i=1;i<_nPoints;i++){
    long dist=labs(lrint(100.0*_aD[i])-lrint(100.0*d));
    if (dist<dmin){dmin=dist;ibest=i;}
  }
  is_fallback=true;
  d_used     =_aD[ibest];
  WriteAdvisory(_name+": gate opening "+DoubleToString(d,2)+" ft not found in rating curve; using closest d value "+DoubleToString(d_used,2)+" ft",false);
  return _aC[ibest];
}
//////////////////////////////////////////////////////////////////
double CRatingCurve::GetCoefficient(const double &d) const
{
  bool   junk;
  double d_used;
  return GetCoefficient(d,junk,d_used);
}

//////////////////////////////////////////////////////////////////
/// \brief creates rating curve from d,C pairs
/// \return new curve (caller owns), or NULL if no pairs are given (error written)
//
CRatingCurve *CRatingCurve::Create(const string name, const vector<double> &d, const vector<double> &C)
{
  if ((d.size()==0) || (d.size()!=C.size())){
    string errString=name+": rating curve is empty; reservoir cannot be processed";
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    return NULL;
  }
  return new CRatingCurve(name,&d[0],&C[0],(int)(d.size()));
}

//////////////////////////////////////////////////////////////////
/// \brief reads rating curve from comma-delimited text file
/// \details after skiprows lines, the header line must contain columns 'd' and 'C'.
/// Rows in which either value is not a number are skipped with an advisory.
///
/// \param filename [in] name of file
/// \param name [in] reservoir name
/// \param skiprows [in] number of leading lines to ignore
/// \return new curve (caller owns), or NULL if file cannot be read or holds no entries
//
CRatingCurve *CRatingCurve::ReadFromFile(const string filename, const string name, const int skiprows)
{
  string errString;
  ifstream INPUT;
  INPUT.open(filename.c_str());
  if (INPUT.fail()){
    errString="CRatingCurve::ReadFromFile: unable to open rating curve file "+filename;
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    return NULL;
  }

  string line;
  int    lineno=0;
  for (int i=0;i<skiprows;i++){
    if (!GetTextLine(INPUT,line)){break;}
    lineno++;
  }
  int iD=DOESNT_EXIST,iC=DOESNT_EXIST;
  if (GetTextLine(INPUT,line)){
    lineno++;
    vector<string> headers=SplitDelimitedLine(line,',');
    for (int j=(int)(headers.size())-1;j>=0;j--){
      if (StringTrim(headers[j])=="d"){iD=j;}
      if (StringTrim(headers[j])=="C"){iC=j;}
    }
  }
  if ((iD==DOESNT_EXIST) || (iC==DOESNT_EXIST)){
    errString="CRatingCurve::ReadFromFile: columns 'd' and 'C' not found in rating curve file "+filename;
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    INPUT.close();
    return NULL;
  }

  vector<double> aD,aC;
  while (GetTextLine(INPUT,line))
  {
    lineno++;
    if (StringTrim(line)==""){continue;}
    vector<string> cells=SplitDelimitedLine(line,',');
    double d,C;
    if (((int)(cells.size())<=max(iD,iC)) || (!StringToDouble(cells[iD],d)) || (!StringToDouble(cells[iC],C))){
      WriteAdvisory(name+": rating curve file "+filename+" line "+to_string(lineno)+" skipped (d or C is not a number)",false);
      continue;
    }
    aD.push_back(d);
    aC.push_back(C);
  }
  INPUT.close();
  return Create(name,aD,aC);
}
