/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  TestHelpers.h
  scratch directory and file utilities shared by unit tests
  ----------------------------------------------------------------*/
#ifndef TESTHELPERS_H
#define TESTHELPERS_H

#include "GateFlowInclude.h"

string TestDirectory ();                                              //with trailing slash
string WriteTestFile (const string &filename, const string &contents); //returns full path
string ReadTestFile  (const string &path);
bool   TestFileExists(const string &path);
int    CountOccurrences(const string &text, const string &pattern);

#endif
