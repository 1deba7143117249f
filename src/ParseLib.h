/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  ParseLib.h
  Line tokenizer for keyword-driven input files
  ----------------------------------------------------------------*/
#ifndef PARSELIB_H
#define PARSELIB_H

#include "GateFlowInclude.h"

///////////////////////////////////////////////////////////////////
/// \brief Reads an input file line by line, splitting lines into words
/// \details words are separated by blanks, tabs or commas; everything after a '#'
/// word is ignored. The parser does not own the stream.
//
class CParser
{
 private:
  ifstream *_INPUT;      ///< input stream
  string    _filename;   ///< name of file being parsed (for messages)
  int       _lineno;     ///< current line number

 public:
  CParser(ifstream &FILE, string filename, const int i);

  int       GetLineNumber ();
  string    GetFilename   ();

  bool      Tokenize      (char **out, int &numwords);
};
#endif
