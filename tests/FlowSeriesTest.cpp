/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "FlowSeries.h"

namespace
{
  // two records share 2021-03-01 09:00:00 (lines 12 and 20), one record out of order
  void AddRecords(CFlowSeries &series)
  {
    series.AddRecord(MakeTimeStruct(2021,3,1,14,0,0),30.00,15);
    series.AddRecord(MakeTimeStruct(2021,3,1, 9,0,0),10.00,12);
    series.AddRecord(MakeTimeStruct(2021,2,28,8,0,0), 5.00,10);
    series.AddRecord(MakeTimeStruct(2021,3,1, 9,0,0),20.02,20);
  }
}

TEST(FlowSeries, OrdersRecordsByTimestamp)
{
  CFlowSeries series("Lawtonka");
  series.AddRecord(MakeTimeStruct(2021,3,2,0,0,0),2.0,3);
  series.AddRecord(MakeTimeStruct(2021,3,1,0,0,0),1.0,4);
  series.Assemble(DUPLICATES_KEEP_LAST,false);
  ASSERT_EQ(series.GetNumRecords(),2);
  EXPECT_EQ(series.GetRecord(0).source_line,4);
  EXPECT_EQ(series.GetNumDuplicates(),0);
  EXPECT_TRUE(series.IsStrictlyIncreasing());
  EXPECT_TRUE(series.IsAssembled());
}

TEST(FlowSeries, DuplicatesReportedWithSourceLines)
{
  CFlowSeries series("Lawtonka");
  AddRecords(series);
  series.Assemble(DUPLICATES_KEEP_ALL,false);

  ASSERT_EQ(series.GetNumDuplicates(),1);
  const duplicate_entry &dup=series.GetDuplicate(0);
  EXPECT_EQ(TimeStructToString(dup.tt),"2021-03-01 09:00:00");
  ASSERT_EQ(dup.aSourceLines.size(),2u);
  EXPECT_EQ(dup.aSourceLines[0],12);
  EXPECT_EQ(dup.aSourceLines[1],20);
  EXPECT_DOUBLE_EQ(dup.aFlows[1],20.02);

  EXPECT_EQ(series.GetNumRecords(),4);
  EXPECT_FALSE(series.IsStrictlyIncreasing());
}

TEST(FlowSeries, KeepLastPolicy)
{
  CFlowSeries series("Lawtonka");
  AddRecords(series);
  series.Assemble(DUPLICATES_KEEP_LAST,false);
  ASSERT_EQ(series.GetNumRecords(),3);
  EXPECT_EQ(series.GetRecord(1).source_line,20);
  EXPECT_DOUBLE_EQ(series.GetRecord(1).flow,20.02);
  EXPECT_TRUE(series.IsStrictlyIncreasing());
}

TEST(FlowSeries, KeepFirstPolicy)
{
  CFlowSeries series("Lawtonka");
  AddRecords(series);
  series.Assemble(DUPLICATES_KEEP_FIRST,false);
  ASSERT_EQ(series.GetNumRecords(),3);
  EXPECT_EQ(series.GetRecord(1).source_line,12);
  EXPECT_EQ(series.GetNumDuplicates(),1);
}

TEST(FlowSeries, AveragePolicyRoundsToHundredths)
{
  CFlowSeries series("Lawtonka");
  AddRecords(series);
  series.Assemble(DUPLICATES_AVERAGE,false);
  ASSERT_EQ(series.GetNumRecords(),3);
  EXPECT_DOUBLE_EQ(series.GetRecord(1).flow,15.01);
  EXPECT_TRUE(series.IsStrictlyIncreasing());
}

TEST(FlowSeries, EqualTimesKeepInsertionOrder)
{
  CFlowSeries series("Lawtonka");
  series.AddRecord(MakeTimeStruct(2021,3,1,9,0,0),3.0,40);
  series.AddRecord(MakeTimeStruct(2021,3,1,9,0,0),1.0,30);
  series.Assemble(DUPLICATES_KEEP_LAST,false);
  ASSERT_EQ(series.GetNumRecords(),1);
  EXPECT_EQ(series.GetRecord(0).source_line,30);
}

TEST(DupPolicy, StringConversion)
{
  bool is_valid=false;
  EXPECT_EQ(StringToDupPolicy("average",is_valid),DUPLICATES_AVERAGE);
  EXPECT_TRUE(is_valid);
  EXPECT_EQ(StringToDupPolicy("KEEP_ALL",is_valid),DUPLICATES_KEEP_ALL);
  EXPECT_EQ(StringToDupPolicy("newest",is_valid),DUPLICATES_KEEP_LAST);
  EXPECT_FALSE(is_valid);
  EXPECT_EQ(DupPolicyToString(DUPLICATES_KEEP_FIRST),"KEEP_FIRST");
}

TEST(BuildPathname, UsesUppercaseLocation)
{
  series_descriptor desc;
  desc.location="Lawtonka";
  EXPECT_EQ(BuildPathname(desc),"//LAWTONKA/RES FLOW-OUT//IR-CENTURY/Obs Gate Ops");
  desc.parameter="RES FLOW-SPILL";
  desc.version  ="Rev 2";
  EXPECT_EQ(BuildPathname(desc),"//LAWTONKA/RES FLOW-SPILL//IR-CENTURY/Rev 2");
}
