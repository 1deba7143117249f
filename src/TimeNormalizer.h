/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  TimeNormalizer.h
  ----------------------------------------------------------------*/
#ifndef TIMENORMALIZER_H
#define TIMENORMALIZER_H

#include "GateFlowInclude.h"

string NormalizeTimeString(const string &raw);
bool   ParseTimeOfDay     (const string &s, int &hr, int &min, int &sec);

#endif
