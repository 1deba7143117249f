/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/

#include "ParseLib.h"

/*----------------------------------------------------------------
  Constructor
  -----------------------------------------------------------------------*/
CParser::CParser(ifstream &FILE, string filename, const int i)
{
  _filename=filename;
  _INPUT =&FILE;
  _lineno=i;
}
/*----------------------------------------------------------------
  Basic Member Functions
  -----------------------------------------------------------------------*/
int    CParser::GetLineNumber ()         {return _lineno;}
//-----------------------------------------------------------------------
string CParser::GetFilename   ()         {return _filename;}
//-----------------------------------------------------------------------
/*----------------------------------------------------------------
  Tokenize
  ----------------------------------------------------------------
  tokenizes a line delimited by spaces, tabs, commas & return characters

  parameters:
  out is the array of strings in the line
  numwords is the number of strings in the line
  returns true if file has ended
  -------------------------------------------------------------------------*/
bool CParser::Tokenize(char **out, int &numwords)
{
  static char wholeline     [MAXCHARINLINE];
  static char *tempwordarray[MAXINPUTITEMS];
  const char  delimiters[]=" \t,\r\n";
  char *p;
  int ct(0);

  numwords=0;
  (*wholeline)=0;
  if (_INPUT->eof()){return true;}
  _INPUT->getline(wholeline,MAXCHARINLINE);
  if (_INPUT->fail()){return true;}

  _lineno++;

  if ((*wholeline) == 0) {return false;}

  p=strtok(wholeline, delimiters);
  while (p){
    if (p[0]=='#'){break;} //ignore all content after '#'
    if (ct>=MAXINPUTITEMS){
      string warn="CParser::Tokenize: exceeded maximum number of items in single line in file "+_filename;
      ExitGracefully(warn.c_str(),BAD_DATA);
      return true;
    }
    tempwordarray[ct]=p;
    p=strtok(NULL, delimiters);
    ct++;
  }
  for (int w=0; w<ct; w++){out[w]=tempwordarray[w];}
  numwords=ct;
  return false;
}
