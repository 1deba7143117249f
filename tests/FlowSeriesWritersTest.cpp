/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "FlowSeriesWriters.h"
#include "TestHelpers.h"

namespace
{
  class FlowWriterTest : public ::testing::Test
  {
  protected:
    CFlowSeries      *pSeries;
    series_descriptor desc;
    optStruct         Options;

    void SetUp()
    {
      pSeries=new CFlowSeries("Lawtonka");
      pSeries->AddRecord(MakeTimeStruct(2021,3,1,9,0,0),10.0 ,9);
      pSeries->AddRecord(MakeTimeStruct(2020,5,1,8,0,0),54.4 ,5);
      pSeries->AddRecord(MakeTimeStruct(2021,3,1,9,0,0),27.25,11);
      pSeries->Assemble(DUPLICATES_KEEP_LAST,false);

      desc.location     ="Lawtonka";
      Options.output_dir=TestDirectory();
      Options.run_name  ="w";
      Options.silent    =true;
    }
    void TearDown()
    {
      delete pSeries;
    }
  };
}

TEST_F(FlowWriterTest, CSVSeriesFile)
{
  CFlowSeriesWriterABC *pWriter=CFlowSeriesWriterABC::Create(OUTPUT_CSV);
  string filename=pWriter->GetFilename(desc,Options);
  EXPECT_EQ(filename,TestDirectory()+"w_Lawtonka_GateFlows.csv");
  ASSERT_TRUE(pWriter->WriteSeries(*pSeries,desc,Options));
  delete pWriter;

  string text=ReadTestFile(filename);
  EXPECT_EQ(text,
    "# pathname: //LAWTONKA/RES FLOW-OUT//IR-CENTURY/Obs Gate Ops\n"
    "# units: cfs\n"
    "# type: INST\n"
    "date,hour,flow [cfs]\n"
    "2020-05-01,08:00:00,54.40\n"
    "2021-03-01,09:00:00,27.25\n");
}

TEST_F(FlowWriterTest, DuplicateReportListsSourceRows)
{
  ASSERT_TRUE(WriteDuplicateReport(*pSeries,desc,Options));
  string text=ReadTestFile(TestDirectory()+"w_Lawtonka_DuplicateTimestamps.csv");
  EXPECT_EQ(text,
    "timestamp,source_rows,flows [cfs]\n"
    "2021-03-01 09:00:00,9;11,10.00;27.25\n");
}

TEST_F(FlowWriterTest, NoDuplicateReportWithoutDuplicates)
{
  CFlowSeries clean("Ellsworth");
  clean.AddRecord(MakeTimeStruct(2021,3,1,9,0,0),1.0,3);
  clean.Assemble(DUPLICATES_KEEP_LAST,false);
  desc.location="Ellsworth";
  ASSERT_TRUE(WriteDuplicateReport(clean,desc,Options));
  EXPECT_FALSE(TestFileExists(TestDirectory()+"w_Ellsworth_DuplicateTimestamps.csv"));
}

TEST_F(FlowWriterTest, NetCDFSeriesFile)
{
  CFlowSeriesWriterABC *pWriter=CFlowSeriesWriterABC::Create(OUTPUT_NETCDF);
  string filename=pWriter->GetFilename(desc,Options);
  EXPECT_EQ(filename,TestDirectory()+"w_Lawtonka_GateFlows.nc");
#ifdef _GFNETCDF_
  EXPECT_TRUE(pWriter->WriteSeries(*pSeries,desc,Options));
  EXPECT_TRUE(TestFileExists(filename));
#else
  EXPECT_FALSE(pWriter->WriteSeries(*pSeries,desc,Options));
#endif
  delete pWriter;
}

TEST(FilenamePrepare, RunNamePrefix)
{
  optStruct Options;
  Options.output_dir="out/";
  EXPECT_EQ(FilenamePrepare("Lawtonka_GateFlows.csv",Options),"out/Lawtonka_GateFlows.csv");
  Options.run_name="hist";
  EXPECT_EQ(FilenamePrepare("Lawtonka_GateFlows.csv",Options),"out/hist_Lawtonka_GateFlows.csv");
}

TEST(PrepareOutputdirectory, CreatesDirectoryAndRoutesErrors)
{
  optStruct Options;
  Options.output_dir=TestDirectory()+"results/";
  PrepareOutputdirectory(Options);
  EXPECT_EQ(g_output_directory,Options.output_dir);

  string path=WriteTestFile("results/probe.txt","x");
  EXPECT_TRUE(TestFileExists(path));

  g_output_directory=TestDirectory();
}
