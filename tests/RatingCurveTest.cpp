/*----------------------------------------------------------------
  GateFlow Library Source Code
  Copyright (c) 2024-2026 the GateFlow Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "RatingCurve.h"
#include "TestHelpers.h"

namespace
{
  CRatingCurve *MakeCurve()
  {
    const double d[]={0.5 ,1.0 ,1.5 ,2.0 };
    const double C[]={0.62,0.61,0.60,0.59};
    return new CRatingCurve("Lawtonka",d,C,4);
  }
}

TEST(RatingCurve, ExactMatchIsNotAFallback)
{
  CRatingCurve *pCurve=MakeCurve();
  for (int i=0;i<pCurve->GetNumPoints();i++)
  {
    bool   is_fallback=true;
    double d_used=-1;
    double C=pCurve->GetCoefficient(pCurve->GetOpening(i),is_fallback,d_used);
    EXPECT_DOUBLE_EQ(C,pCurve->GetCoeffAt(i));
    EXPECT_FALSE(is_fallback);
    EXPECT_DOUBLE_EQ(d_used,pCurve->GetOpening(i));
  }
  delete pCurve;
}

TEST(RatingCurve, NearestEntryUsedWhenNoExactMatch)
{
  CRatingCurve *pCurve=MakeCurve();
  bool   is_fallback=false;
  double d_used;
  EXPECT_DOUBLE_EQ(pCurve->GetCoefficient(0.92,is_fallback,d_used),0.61);
  EXPECT_TRUE(is_fallback);
  EXPECT_DOUBLE_EQ(d_used,1.0);

  EXPECT_DOUBLE_EQ(pCurve->GetCoefficient(0.08),0.62);
  EXPECT_DOUBLE_EQ(pCurve->GetCoefficient(5.0), 0.59);
  delete pCurve;
}

TEST(RatingCurve, TiesGoToFirstEntryInTableOrder)
{
  const double d[]={1.0 ,0.5 };
  const double C[]={0.61,0.62};
  CRatingCurve curve("Ellsworth",d,C,2);
  bool   is_fallback;
  double d_used;
  EXPECT_DOUBLE_EQ(curve.GetCoefficient(0.75,is_fallback,d_used),0.61);
  EXPECT_DOUBLE_EQ(d_used,1.0);
}

TEST(RatingCurve, DecimalTiesGoToFirstEntryInTableOrder)
{
  const double d[]={0.5 ,0.6 };
  const double C[]={0.62,0.61};
  CRatingCurve curve("Lawtonka",d,C,2);
  bool   is_fallback;
  double d_used;
  EXPECT_DOUBLE_EQ(curve.GetCoefficient(0.55,is_fallback,d_used),0.62);
  EXPECT_TRUE(is_fallback);
  EXPECT_DOUBLE_EQ(d_used,0.5);

  const double d2[]={0.6 ,0.5 };
  const double C2[]={0.61,0.62};
  CRatingCurve reversed("Lawtonka",d2,C2,2);
  EXPECT_DOUBLE_EQ(reversed.GetCoefficient(0.55,is_fallback,d_used),0.61);
  EXPECT_DOUBLE_EQ(d_used,0.6);
}

TEST(RatingCurve, LookupIsIdempotent)
{
  CRatingCurve *pCurve=MakeCurve();
  EXPECT_DOUBLE_EQ(pCurve->GetCoefficient(1.23),pCurve->GetCoefficient(1.23));
  EXPECT_DOUBLE_EQ(pCurve->GetCoefficient(1.5), pCurve->GetCoefficient(1.5));
  delete pCurve;
}

TEST(RatingCurve, OpeningsRoundedToHundredths)
{
  const double d[]={0.333333};
  const double C[]={0.6};
  CRatingCurve curve("Lawtonka",d,C,1);
  EXPECT_DOUBLE_EQ(curve.GetOpening(0),0.33);
  bool   is_fallback;
  double d_used;
  curve.GetCoefficient(0.33,is_fallback,d_used);
  EXPECT_FALSE(is_fallback);
}

TEST(RatingCurve, CreateRejectsEmptyCurve)
{
  vector<double> d,C;
  EXPECT_TRUE(CRatingCurve::Create("Lawtonka",d,C)==NULL);
  string errors=ReadTestFile(TestDirectory()+"GateFlow_errors.txt");
  EXPECT_NE(errors.find("ERROR    : Lawtonka: rating curve is empty"),string::npos);
}

TEST(RatingCurve, ReadFromFileUsesNamedColumns)
{
  string path=WriteTestFile("lawtonka_rating.csv",
    "C,d,note\n"
    "0.62,0.5,\n"
    "0.61,1.00,interpolated\n"
    "n/a,1.5,\n"
    "0.59,2.0,\n");
  CRatingCurve *pCurve=CRatingCurve::ReadFromFile(path,"Lawtonka",0);
  ASSERT_TRUE(pCurve!=NULL);
  ASSERT_EQ(pCurve->GetNumPoints(),3);
  EXPECT_DOUBLE_EQ(pCurve->GetOpening(1),1.0);
  EXPECT_DOUBLE_EQ(pCurve->GetCoeffAt(1),0.61);
  EXPECT_DOUBLE_EQ(pCurve->GetCoefficient(2.0),0.59);
  delete pCurve;
}

TEST(RatingCurve, ReadFromFileWithoutColumnsFails)
{
  string path=WriteTestFile("bad_rating.csv","opening,coef\n0.5,0.62\n");
  EXPECT_TRUE(CRatingCurve::ReadFromFile(path,"Lawtonka",0)==NULL);
}
