/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------
  FlowSeriesWriters.h
  ------------------------------------------------------------------
  output of assembled flow series
  ----------------------------------------------------------------*/
#ifndef FLOWSERIESWRITERS_H
#define FLOWSERIESWRITERS_H

#include "GateFlowInclude.h"
#include "FlowSeries.h"

/*****************************************************************
   Class CFlowSeriesWriterABC
------------------------------------------------------------------
   Writes an assembled flow series, tagged with its pathname,
   units and type, to a file
******************************************************************/
class CFlowSeriesWriterABC
{
public:
  virtual ~CFlowSeriesWriterABC(){}

  virtual string GetFilename(const series_descriptor &desc, const optStruct &Options) const=0;
  virtual bool   WriteSeries(const CFlowSeries &series, const series_descriptor &desc, const optStruct &Options) const=0;

  static CFlowSeriesWriterABC *Create(const output_format fmt);
};

/*****************************************************************
   Class CCSVFlowWriter
------------------------------------------------------------------
   <run_name>_<RES>_GateFlows.csv: comment lines, then date,hour,flow
******************************************************************/
class CCSVFlowWriter : public CFlowSeriesWriterABC
{
public:
  string GetFilename(const series_descriptor &desc, const optStruct &Options) const;
  bool   WriteSeries(const CFlowSeries &series, const series_descriptor &desc, const optStruct &Options) const;
};

/*****************************************************************
   Class CNetCDFFlowWriter
------------------------------------------------------------------
   <run_name>_<RES>_GateFlows.nc: CF time series with unlimited
   time dimension (hours since first record) and variable q_out
******************************************************************/
class CNetCDFFlowWriter : public CFlowSeriesWriterABC
{
public:
  string GetFilename(const series_descriptor &desc, const optStruct &Options) const;
  bool   WriteSeries(const CFlowSeries &series, const series_descriptor &desc, const optStruct &Options) const;
};

bool WriteDuplicateReport(const CFlowSeries &series, const series_descriptor &desc, const optStruct &Options);

#endif
