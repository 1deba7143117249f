/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  GateLogTable.h
  ------------------------------------------------------------------
  tabular gate-operation log and its schema repair
  ----------------------------------------------------------------*/
#ifndef GATELOGTABLE_H
#define GATELOGTABLE_H

#include "GateFlowInclude.h"

////////////////////////////////////////////////////////////////////
/// \brief Column layout of a raw gate log
/// \details gate columns [gate_first,gate_last) carry a group label as header; the
/// individual gate identifiers sit in the first data row
//
struct gate_layout
{
  int    gate_first;      ///< index of first gate column (zero-based)
  int    gate_last;       ///< index one past the last gate column
  bool   drop_trailing;   ///< true if last column of table is discarded
  string date_col;        ///< header of date column
  string time_col;        ///< header of time column
  string elev_col;        ///< header of lake elevation column

  gate_layout(){
    gate_first   =DOESNT_EXIST;
    gate_last    =DOESNT_EXIST;
    drop_trailing=false;
    date_col     =DEFAULT_DATE_COLUMN;
    time_col     =DEFAULT_TIME_COLUMN;
    elev_col     =DEFAULT_ELEV_COLUMN;
  }
};

/*****************************************************************
   Class CGateLogTable
------------------------------------------------------------------
   Headers plus rows of text cells; an empty cell is missing.
   Every row remembers the line of the source file it came from.
******************************************************************/
class CGateLogTable
{
private:/*-------------------------------------------------------*/
  string                  _name;       ///< table name (reservoir or filename), for messages
  vector<string>          _aHeaders;   ///< column headers [size: number of columns]
  vector<vector<string> > _aRows;      ///< cells [row][column]
  vector<int>             _aLineNums;  ///< 1-based source line of each row

  CGateLogTable(const CGateLogTable &t); //suppresses default copy constructor

public:/*-------------------------------------------------------*/
  CGateLogTable(const string name, const vector<string> &headers);
  ~CGateLogTable();

  string         GetName          () const;
  int            GetNumColumns    () const;
  int            GetNumRows       () const;
  string         GetHeader        (const int j) const;
  const vector<string> &GetHeaders() const;
  const vector<string> &GetRow    (const int i) const;
  string         GetCell          (const int i, const int j) const;
  int            GetLineNumber    (const int i) const;
  int            GetColumnIndex   (const string &header) const;

  void           AddRow           (const vector<string> &cells, const int line);

  static CGateLogTable *ReadFromFile(const string filename, const string name, const int skiprows);
};

CGateLogTable *RepairGateLogTable(const CGateLogTable &raw, const gate_layout &layout, const bool noisy);
bool           IsSectionDivider  (const string &date_cell);

#endif
