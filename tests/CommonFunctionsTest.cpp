/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "GateFlowInclude.h"

TEST(SplitDelimitedLine, KeepsEmptyFields)
{
  vector<string> f=SplitDelimitedLine("a,,c,",',');
  ASSERT_EQ(f.size(),4u);
  EXPECT_EQ(f[0],"a");
  EXPECT_EQ(f[1],"");
  EXPECT_EQ(f[2],"c");
  EXPECT_EQ(f[3],"");
}

TEST(SplitDelimitedLine, ReportsUnterminatedQuote)
{
  bool open_quote=false;
  vector<string> f=SplitDelimitedLine("2020-05-01,0800,\"gate 1 opened",',',open_quote);
  EXPECT_TRUE(open_quote);
  ASSERT_EQ(f.size(),3u);
  EXPECT_EQ(f[2],"gate 1 opened");

  SplitDelimitedLine("2020-05-01,0800,\"gate 1 opened\nby operator\"",',',open_quote);
  EXPECT_FALSE(open_quote);
}

TEST(SplitDelimitedLine, QuotedFields)
{
  vector<string> f=SplitDelimitedLine("\"Lake, Elevation\",\"6\"\"\",6\",x",',');
  ASSERT_EQ(f.size(),4u);
  EXPECT_EQ(f[0],"Lake, Elevation");
  EXPECT_EQ(f[1],"6\"");
  EXPECT_EQ(f[2],"6\"");
  EXPECT_EQ(f[3],"x");
}

TEST(StringToDouble, RequiresWholeStringToBeNumeric)
{
  double v=-1.0;
  EXPECT_TRUE (StringToDouble(" 1337.25 ",v));
  EXPECT_DOUBLE_EQ(v,1337.25);
  EXPECT_FALSE(StringToDouble("",v));
  EXPECT_FALSE(StringToDouble("12ft",v));
  EXPECT_FALSE(StringToDouble("nan",v));
}

TEST(IntegralRealToDigits, DropsZeroFraction)
{
  EXPECT_EQ(IntegralRealToDigits("800.0"), "800");
  EXPECT_EQ(IntegralRealToDigits("2015.00"),"2015");
  EXPECT_EQ(IntegralRealToDigits("8.5"),   "8.5");
  EXPECT_EQ(IntegralRealToDigits("A.0"),   "A.0");
  EXPECT_EQ(FormatIdentifier(" 3.0 "),     "3");
}

TEST(RoundToDecimals, TwoDecimals)
{
  EXPECT_DOUBLE_EQ(RoundToDecimals(0.5000001,2),0.5);
  EXPECT_DOUBLE_EQ(RoundToDecimals(9.0/12.0,2), 0.75);
  EXPECT_DOUBLE_EQ(RoundToDecimals(1.0/12.0,2), 0.08);
  EXPECT_EQ(DoubleToString(54.4,2),"54.40");
}

TEST(ParseDateString, AcceptedFormats)
{
  int y=0,m=0,d=0;
  ASSERT_TRUE(ParseDateString("2020-05-01",y,m,d));
  EXPECT_EQ(y,2020); EXPECT_EQ(m,5); EXPECT_EQ(d,1);

  ASSERT_TRUE(ParseDateString("2021/3/1",y,m,d));
  EXPECT_EQ(y,2021); EXPECT_EQ(m,3); EXPECT_EQ(d,1);

  ASSERT_TRUE(ParseDateString("12/31/2019",y,m,d));
  EXPECT_EQ(y,2019); EXPECT_EQ(m,12); EXPECT_EQ(d,31);

  ASSERT_TRUE(ParseDateString("2020-05-01 00:00:00",y,m,d));
  EXPECT_EQ(d,1);
}

TEST(ParseDateString, MonthFirstWithDashesAndTwoDigitYears)
{
  int y=0,m=0,d=0;
  ASSERT_TRUE(ParseDateString("05-01-2020",y,m,d));
  EXPECT_EQ(y,2020); EXPECT_EQ(m,5); EXPECT_EQ(d,1);

  ASSERT_TRUE(ParseDateString("5/1/20",y,m,d));
  EXPECT_EQ(y,2020); EXPECT_EQ(m,5); EXPECT_EQ(d,1);

  ASSERT_TRUE(ParseDateString("12-31-99",y,m,d));
  EXPECT_EQ(y,1999); EXPECT_EQ(m,12); EXPECT_EQ(d,31);

  ASSERT_TRUE(ParseDateString("1/2/68",y,m,d));
  EXPECT_EQ(y,2068);

  EXPECT_FALSE(ParseDateString("13-01-2020",y,m,d));
  EXPECT_FALSE(ParseDateString("5/1/020",   y,m,d));
  EXPECT_FALSE(ParseDateString("2/29/21",   y,m,d));
}

TEST(ParseDateString, RejectsInvalidDates)
{
  int y,m,d;
  EXPECT_FALSE(ParseDateString("2015",      y,m,d));
  EXPECT_FALSE(ParseDateString("2019-02-29",y,m,d));
  EXPECT_FALSE(ParseDateString("2020-13-01",y,m,d));
  EXPECT_FALSE(ParseDateString("May 1",     y,m,d));
  EXPECT_TRUE (ParseDateString("2020-02-29",y,m,d));
}

TEST(TimeStruct, SerialSecondsOrderAndFormat)
{
  time_struct a=MakeTimeStruct(2020,12,31,23,59,59);
  time_struct b=MakeTimeStruct(2021, 1, 1, 0, 0, 0);
  EXPECT_EQ(TimeStructToSerialSeconds(b)-TimeStructToSerialSeconds(a),1);
  EXPECT_EQ(TimeStructToSerialSeconds(MakeTimeStruct(1970,1,1,0,0,0)),0);
  EXPECT_EQ(TimeStructToString(b),"2021-01-01 00:00:00");
  EXPECT_EQ(MakeTimeStruct(2020,3,1,12,0,0).date_string,"2020-03-01");
}

TEST(CorrectForRelativePath, ResolvesAgainstInputFile)
{
  EXPECT_EQ(CorrectForRelativePath("logs/lawtonka.csv","/data/run/model.gfi"),"/data/run/logs/lawtonka.csv");
  EXPECT_EQ(CorrectForRelativePath("/abs/lawtonka.csv","/data/run/model.gfi"),"/abs/lawtonka.csv");
  EXPECT_EQ(CorrectForRelativePath("lawtonka.csv","model.gfi"),"lawtonka.csv");
}
