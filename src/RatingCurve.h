/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  RatingCurve.h
  ----------------------------------------------------------------*/
#ifndef RATINGCURVE_H
#define RATINGCURVE_H

#include "GateFlowInclude.h"

///////////////////////////////////////////////////////////////////
/// \brief Discharge coefficient C as a function of gate opening d
/// \details entries are kept in table order. Lookup is by exact match of d,
/// falling back on the entry with the closest d. The curve is not modified after construction.
//
class CRatingCurve
{
 private:
  string  _name;     ///< reservoir name
  double *_aD;       ///< gate openings [ft], rounded to 0.01 ft [size: _nPoints]
  double *_aC;       ///< discharge coefficients [-] [size: _nPoints]
  int     _nPoints;  ///< number of entries (>0)

  CRatingCurve(const CRatingCurve &c); //suppresses default copy constructor

 public:
  CRatingCurve(const string name, const double *d, const double *C, const int N);
  ~CRatingCurve();

  string GetName       () const;
  int    GetNumPoints  () const;
  double GetOpening    (const int i) const;
  double GetCoeffAt    (const int i) const;

  double GetCoefficient(const double &d) const;
  double GetCoefficient(const double &d, bool &is_fallback, double &d_used) const;

  static CRatingCurve *Create      (const string name, const vector<double> &d, const vector<double> &C);
  static CRatingCurve *ReadFromFile(const string filename, const string name, const int skiprows);
};
#endif
