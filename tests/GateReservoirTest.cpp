/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "GateReservoir.h"
#include "TestHelpers.h"

namespace
{
  const char *LAWTONKA_LOG=
    "LAKE LAWTONKA SPILLWAY GATE OPERATIONS\n"
    "Date,Time,Lake Elevation,Gates Open (inches),,Remarks\n"
    ",,,1,2,\n"
    "2020,,,,,\n"                                        //line 4: section divider
    "2020-05-01,800,1337.00,\"6\"\"\",0,\n"              //line 5: scenario 1
    ",,,,,checked gates\n"                               //line 6: no time or elevation
    ",1000,,6,0,\n"                                      //line 7: no elevation
    ",,1337.05,6,0,\n"                                   //line 8: no time
    "2021-03-01,900,1337.00,6,0,\n"                      //line 9
    ",1200,1337.00,12,12,\n"                             //line 10
    ",9:00,1337.00,12,0,\n";                             //line 11: same time as line 9

  void SetupLawtonka(CGateReservoir &res, const string &logfile)
  {
    res.SetGateLogFile(logfile);
    res.SetGateLogRowsToSkip(1);
    res.SetGateBlock(3,5);
    res.SetDropTrailingColumn(true);
    res.SetSpillwayInvert(1335.55);
    res.SetGateLength(20.0);
    res.AddRatingCurvePoint(0.5,0.62);
    res.AddRatingCurvePoint(1.0,0.61);
  }

  optStruct TestOptions()
  {
    optStruct Options;
    Options.output_dir=TestDirectory();
    Options.silent    =true;
    return Options;
  }
}

TEST(GateReservoir, EndToEndFlowSeries)
{
  CGateReservoir res("Lawtonka");
  SetupLawtonka(res,WriteTestFile("lawtonka_log.csv",LAWTONKA_LOG));
  optStruct Options=TestOptions();
  Options.duplicates=DUPLICATES_KEEP_ALL;

  ASSERT_TRUE(res.Run(Options));
  EXPECT_EQ(res.GetNumObservations(),4);
  EXPECT_EQ(res.GetNumDroppedRows(),0);

  const CFlowSeries *pSeries=res.GetFlowSeries();
  ASSERT_TRUE(pSeries!=NULL);
  ASSERT_EQ(pSeries->GetNumRecords(),4);

  //scenario 1
  const flow_record &first=pSeries->GetRecord(0);
  EXPECT_EQ(TimeStructToString(first.tt),"2020-05-01 08:00:00");
  EXPECT_DOUBLE_EQ(first.flow,54.40);
  EXPECT_EQ(first.source_line,5);

  //no divider year, no incomplete rows
  for (int n=0;n<pSeries->GetNumRecords();n++){
    EXPECT_NE(pSeries->GetRecord(n).source_line,4);
    EXPECT_NE(pSeries->GetRecord(n).source_line,6);
    EXPECT_NE(pSeries->GetRecord(n).source_line,7);
    EXPECT_NE(pSeries->GetRecord(n).source_line,8);
  }

  //scenario 4: both rows kept and reported
  ASSERT_EQ(pSeries->GetNumDuplicates(),1);
  const duplicate_entry &dup=pSeries->GetDuplicate(0);
  EXPECT_EQ(TimeStructToString(dup.tt),"2021-03-01 09:00:00");
  ASSERT_EQ(dup.aSourceLines.size(),2u);
  EXPECT_EQ(dup.aSourceLines[0],9);
  EXPECT_EQ(dup.aSourceLines[1],11);
  EXPECT_EQ(pSeries->GetRecord(1).source_line,9);
  EXPECT_EQ(pSeries->GetRecord(2).source_line,11);

  //two 1 ft gates at line 10
  EXPECT_EQ(pSeries->GetRecord(3).source_line,10);
  EXPECT_GT(pSeries->GetRecord(3).flow,0.0);
}

TEST(GateReservoir, DefaultPolicyLeavesStrictlyIncreasingSeries)
{
  CGateReservoir res("Lawtonka");
  SetupLawtonka(res,WriteTestFile("lawtonka_log2.csv",LAWTONKA_LOG));
  optStruct Options=TestOptions();

  ASSERT_TRUE(res.Run(Options));
  const CFlowSeries *pSeries=res.GetFlowSeries();
  ASSERT_EQ(pSeries->GetNumRecords(),3);
  EXPECT_TRUE(pSeries->IsStrictlyIncreasing());
  EXPECT_EQ(pSeries->GetRecord(1).source_line,11);
  EXPECT_EQ(pSeries->GetNumDuplicates(),1);
}

TEST(GateReservoir, ClosedGatesNeedNoLookups)
{
  CGateReservoir res("Lawtonka");
  SetupLawtonka(res,WriteTestFile("lawtonka_log3.csv",LAWTONKA_LOG));
  optStruct Options=TestOptions();
  ASSERT_TRUE(res.Run(Options));
  //one open gate at lines 5, 9, 11 and two at line 10
  EXPECT_EQ(res.GetDiagnostics().nLookups,5);
  EXPECT_EQ(res.GetDiagnostics().nFallbacks,0);
}

TEST(GateReservoir, MissingConstantsStopOnlyThisReservoir)
{
  CGateReservoir res("Ellsworth");
  res.SetGateLogFile(WriteTestFile("ellsworth_log.csv",LAWTONKA_LOG));
  res.SetGateBlock(3,5);
  res.SetGateLength(20.0);
  res.AddRatingCurvePoint(0.5,0.62);
  optStruct Options=TestOptions();
  EXPECT_FALSE(res.Run(Options));
  EXPECT_TRUE(res.GetFlowSeries()==NULL);

  string errors=ReadTestFile(TestDirectory()+"GateFlow_errors.txt");
  EXPECT_NE(errors.find("Ellsworth: :SpillwayInvertElevation not specified"),string::npos);
}

TEST(GateReservoir, EmptyRatingCurveStopsReservoir)
{
  CGateReservoir res("Ellsworth");
  res.SetGateLogFile(WriteTestFile("ellsworth_log2.csv",LAWTONKA_LOG));
  res.SetGateBlock(3,5);
  res.SetSpillwayInvert(1225.0);
  res.SetGateLength(20.0);
  optStruct Options=TestOptions();
  EXPECT_FALSE(res.Initialize(Options));
  EXPECT_TRUE(res.GetRatingCurve()==NULL);
}

TEST(GateReservoir, RatingCurveFileTakesPrecedence)
{
  CGateReservoir res("Lawtonka");
  SetupLawtonka(res,WriteTestFile("lawtonka_log4.csv",LAWTONKA_LOG));
  res.SetRatingCurveFile(WriteTestFile("lawtonka_curve.csv","d,C\n0.5,0.70\n"));
  optStruct Options=TestOptions();
  ASSERT_TRUE(res.Initialize(Options));
  ASSERT_TRUE(res.GetRatingCurve()!=NULL);
  EXPECT_EQ(res.GetRatingCurve()->GetNumPoints(),1);
  EXPECT_DOUBLE_EQ(res.GetRatingCurve()->GetCoefficient(0.5),0.70);
}

TEST(GateReservoir, SeriesDescriptor)
{
  CGateReservoir res("Lawtonka");
  series_descriptor desc=res.GetSeriesDescriptor();
  EXPECT_EQ(desc.location,"Lawtonka");
  EXPECT_EQ(desc.units,"cfs");
  EXPECT_EQ(desc.ts_type,"INST");
  res.SetMeasurementType("RES FLOW-GATE");
  EXPECT_EQ(BuildPathname(res.GetSeriesDescriptor()),"//LAWTONKA/RES FLOW-GATE//IR-CENTURY/Obs Gate Ops");
}
