/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  Class CGateLogTable
  ----------------------------------------------------------------*/
#include "GateLogTable.h"

//////////////////////////////////////////////////////////////////
/// \brief Constructor
/// \param name [in] table name
/// \param &headers [in] column headers
//
CGateLogTable::CGateLogTable(const string name, const vector<string> &headers)
{
  _name    =name;
  _aHeaders=headers;
}
//////////////////////////////////////////////////////////////////
/// \brief Destructor
//
CGateLogTable::~CGateLogTable(){}

//////////////////////////////////////////////////////////////////
/// \brief splits one comma-delimited record, reading continuation lines while a quoted cell is open
/// \details a quoted cell may hold line breaks (e.g., multi-line remarks); these are kept as '\n'
///
/// \param &in [in] input stream positioned after the first line of the record
/// \param &line [in/out] first line of record; on return, the full record text
/// \param &lineno [in/out] line number of the last line read
/// \param filename [in] file name, for warnings
/// \return trimmed cells of record
//
static vector<string> ReadDelimitedRecord(istream &in, string &line, int &lineno, const string &filename)
{
  int  start=lineno;
  bool open_quote;
  vector<string> cells=SplitDelimitedLine(line,',',open_quote);
  string next;
  while ((open_quote) && (GetTextLine(in,next)))
  {
    lineno++;
    line+="\n"+next;
    cells=SplitDelimitedLine(line,',',open_quote);
  }
  if (open_quote){
    WriteWarning("CGateLogTable::ReadFromFile: unterminated quoted cell starting on line "+to_string(start)+" of "+filename,false);
  }
  for (size_t j=0;j<cells.size();j++){cells[j]=StringTrim(cells[j]);}
  return cells;
}

//////////////////////////////////////////////////////////////////
// Accessors
//
string CGateLogTable::GetName      () const {return _name;}
int    CGateLogTable::GetNumColumns() const {return (int)(_aHeaders.size());}
int    CGateLogTable::GetNumRows   () const {return (int)(_aRows.size());}
const vector<string> &CGateLogTable::GetHeaders() const {return _aHeaders;}

string CGateLogTable::GetHeader(const int j) const
{
  ExitGracefullyIf((j<0) || (j>=GetNumColumns()),"CGateLogTable::GetHeader: bad column index",RUNTIME_ERR);
  return _aHeaders[j];
}
const vector<string> &CGateLogTable::GetRow(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=GetNumRows()),"CGateLogTable::GetRow: bad row index",RUNTIME_ERR);
  return _aRows[i];
}
string CGateLogTable::GetCell(const int i, const int j) const
{
  ExitGracefullyIf((j<0) || (j>=GetNumColumns()),"CGateLogTable::GetCell: bad column index",RUNTIME_ERR);
  return GetRow(i)[j];
}
int CGateLogTable::GetLineNumber(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=GetNumRows()),"CGateLogTable::GetLineNumber: bad row index",RUNTIME_ERR);
  return _aLineNums[i];
}

//////////////////////////////////////////////////////////////////
/// \brief returns index of first column with given header, or DOESNT_EXIST
//
int CGateLogTable::GetColumnIndex(const string &header) const
{
  for (int j=0;j<GetNumColumns();j++){
    if (_aHeaders[j]==header){return j;}
  }
  return DOESNT_EXIST;
}

//////////////////////////////////////////////////////////////////
/// \brief appends row to table
/// \details short rows are padded with missing cells; surplus cells are discarded
/// \param &cells [in] row cells
/// \param line [in] source line number
//
void CGateLogTable::AddRow(const vector<string> &cells, const int line)
{
  vector<string> row=cells;
  if ((int)(row.size())>GetNumColumns()){
    bool blank=true;
    for (int j=GetNumColumns();j<(int)(row.size());j++){if (row[j]!=""){blank=false;}}
    if (!blank){
      WriteWarning(_name+": line "+to_string(line)+" has more cells than the header; surplus cells ignored",false);
    }
  }
  row.resize(GetNumColumns(),"");
  _aRows.push_back(row);
  _aLineNums.push_back(line);
}

//////////////////////////////////////////////////////////////////
/// \brief reads gate log table from comma-delimited text file
/// \details the first skiprows lines are ignored, the next line is the header,
/// and all remaining non-empty lines are data rows. Cells are trimmed.
///
/// \param filename [in] name of file
/// \param name [in] table name
/// \param skiprows [in] number of leading lines to ignore
/// \return new table (caller owns) or NULL if file cannot be read
//
CGateLogTable *CGateLogTable::ReadFromFile(const string filename, const string name, const int skiprows)
{
  ifstream INPUT;
  INPUT.open(filename.c_str());
  if (INPUT.fail()){
    string errString="CGateLogTable::ReadFromFile: unable to open gate log file "+filename;
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    return NULL;
  }

  string line;
  int    lineno=0;
  for (int i=0;i<skiprows;i++){
    if (!GetTextLine(INPUT,line)){break;}
    lineno++;
  }
  if (!GetTextLine(INPUT,line)){
    string errString="CGateLogTable::ReadFromFile: no header line found in gate log file "+filename;
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    INPUT.close();
    return NULL;
  }
  lineno++;

  vector<string> headers=ReadDelimitedRecord(INPUT,line,lineno,filename);

  CGateLogTable *pTable=new CGateLogTable(name,headers);

  while (GetTextLine(INPUT,line))
  {
    lineno++;
    if (StringTrim(line)==""){continue;}
    int first=lineno;
    vector<string> cells=ReadDelimitedRecord(INPUT,line,lineno,filename);
    pTable->AddRow(cells,first);
  }
  INPUT.close();
  return pTable;
}

//////////////////////////////////////////////////////////////////
/// \brief returns true if date cell holds only a four digit year (e.g., "2015" or "2015.0")
/// \details logs separate each year of records with such a row
//
bool IsSectionDivider(const string &date_cell)
{
  string s=IntegralRealToDigits(StringTrim(date_cell));
  return ((s.length()==4) && (StringIsAllDigits(s)));
}

//////////////////////////////////////////////////////////////////
/// \brief repairs the two-level header of a raw gate log
/// \details builds a new table in which
///  - headers of the gate block are replaced by the gate identifiers of the first data row
///  - the trailing column is dropped, if requested
///  - the identifier row, and any section divider (bare year) rows, are removed
///  - missing dates are forward-filled from the preceding retained row
///  - rows without a time or lake elevation are removed
/// The raw table is not modified.
///
/// \param &raw [in] table as read from the gate log
/// \param &layout [in] gate block and column names
/// \param noisy [in] true if messages are echoed to screen
/// \return new table (caller owns), or NULL if the layout does not fit the table
//
CGateLogTable *RepairGateLogTable(const CGateLogTable &raw, const gate_layout &layout, const bool noisy)
{
  string name =raw.GetName();
  int    ncols=raw.GetNumColumns();
  string errString;

  if ((layout.gate_first<0) || (layout.gate_last<=layout.gate_first) || (layout.gate_last>ncols)){
    errString=name+": gate block ["+to_string(layout.gate_first)+","+to_string(layout.gate_last)+
              ") does not fit a gate log with "+to_string(ncols)+" columns";
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    return NULL;
  }
  if ((layout.drop_trailing) && (layout.gate_last>=ncols)){
    errString=name+": trailing column to be dropped lies inside the gate block";
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    return NULL;
  }
  if (raw.GetNumRows()==0){
    errString=name+": gate log has no gate identifier row";
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    return NULL;
  }

  //splice gate identifiers into header ---------------------------
  vector<string>        headers=raw.GetHeaders();
  const vector<string> &idrow  =raw.GetRow(0);
  for (int j=layout.gate_first;j<layout.gate_last;j++)
  {
    int    k =j-layout.gate_first+1;
    string id=FormatIdentifier(idrow[j]);
    if (id==""){
      id="Gate"+to_string(k);
      WriteWarning(name+": gate identifier missing for column "+to_string(j)+"; using "+id,noisy);
    }
    headers[j]=id;
  }
  if (layout.drop_trailing){headers.pop_back();}

  int iDate=DOESNT_EXIST,iTime=DOESNT_EXIST,iElev=DOESNT_EXIST;
  for (int j=(int)(headers.size())-1;j>=0;j--){
    if (headers[j]==layout.date_col){iDate=j;}
    if (headers[j]==layout.time_col){iTime=j;}
    if (headers[j]==layout.elev_col){iElev=j;}
  }
  string missing="";
  if      (iDate==DOESNT_EXIST){missing=layout.date_col;}
  else if (iTime==DOESNT_EXIST){missing=layout.time_col;}
  else if (iElev==DOESNT_EXIST){missing=layout.elev_col;}
  if (missing!=""){
    errString=name+": column \""+missing+"\" not found in gate log";
    ExitGracefully(errString.c_str(),BAD_DATA_WARN);
    return NULL;
  }

  //filter rows ----------------------------------------------------
  CGateLogTable *pTable=new CGateLogTable(name,headers);
  string last_date ="";
  int    nDividers =0;
  int    nIncomplete=0;
  for (int i=1;i<raw.GetNumRows();i++)
  {
    vector<string> row=raw.GetRow(i);
    if (layout.drop_trailing){row.pop_back();}

    if (IsSectionDivider(row[iDate])){nDividers++;continue;}

    if (row[iDate]==""){row[iDate]=last_date;}
    else               {last_date =row[iDate];}

    if ((row[iTime]=="") || (row[iElev]=="")){
      WriteAdvisory(name+": line "+to_string(raw.GetLineNumber(i))+" discarded (missing time or lake elevation)",noisy);
      nIncomplete++;
      continue;
    }
    pTable->AddRow(row,raw.GetLineNumber(i));
  }

  if (noisy){
    cout<<"  "<<name<<": "<<pTable->GetNumRows()<<" rows retained, "<<nDividers<<" section dividers and "
        <<nIncomplete<<" incomplete rows discarded"<<endl;
  }
  return pTable;
}
