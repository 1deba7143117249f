/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#ifndef GATEFLOW_MAIN
#define GATEFLOW_MAIN

#include "GateFlowInclude.h"
#include "GateReservoir.h"
#include "FlowSeriesWriters.h"

//Defined in ParseInput.cpp
bool ParseMainInputFile(vector<CGateReservoir*> &aReservoirs, optStruct &Options);

//Local functions defined below main() in GateFlowMain.cpp
void ProcessExecutableArguments(int argc, char* argv[], optStruct &Options);

#endif
