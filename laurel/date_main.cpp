//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "date.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE date_test

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_CASE(ordinal)
{
  BOOST_CHECK_EQUAL(laurel::date_ordinal(1601, 1, 1), 1);
  BOOST_CHECK_EQUAL(laurel::date_ordinal(1601, 1, 2), 2);
  BOOST_CHECK_EQUAL(laurel::date_ordinal(1602, 1, 1), 366);
  BOOST_CHECK_EQUAL(laurel::date_ordinal(2000, 1, 1), 145732);
  
  BOOST_CHECK_EQUAL(laurel::date_ordinal("16010101"), 1);
  BOOST_CHECK_EQUAL(laurel::date_ordinal("20000101"), 145732);
  
  BOOST_CHECK_EQUAL(laurel::date_ordinal("19990101") + 365, laurel::date_ordinal("20000101"));
  BOOST_CHECK_EQUAL(laurel::date_ordinal("20000228") + 2, laurel::date_ordinal("20000301"));
  BOOST_CHECK_EQUAL(laurel::date_ordinal("19000228") + 1, laurel::date_ordinal("19000301"));
}

BOOST_AUTO_TEST_CASE(short_form)
{
  BOOST_CHECK_EQUAL(laurel::date_ordinal("150101"), laurel::date_ordinal("20150101"));
  BOOST_CHECK_EQUAL(laurel::date_ordinal("300101"), laurel::date_ordinal("20300101"));
  BOOST_CHECK_EQUAL(laurel::date_ordinal("310101"), laurel::date_ordinal("19310101"));
  BOOST_CHECK_EQUAL(laurel::date_ordinal("981231"), laurel::date_ordinal("19981231"));
}

BOOST_AUTO_TEST_CASE(invalid)
{
  BOOST_CHECK_EQUAL(laurel::date_ordinal("20100931"), 0);
  BOOST_CHECK_EQUAL(laurel::date_ordinal("20100229"), 0);
  BOOST_CHECK(laurel::date_ordinal("20120229") > 0);
  BOOST_CHECK_EQUAL(laurel::date_ordinal("19000229"), 0);
  BOOST_CHECK(laurel::date_ordinal("20000229") > 0);
  
  BOOST_CHECK_EQUAL(laurel::date_ordinal("20101301"), 0);
  BOOST_CHECK_EQUAL(laurel::date_ordinal("20100100"), 0);
  BOOST_CHECK_EQUAL(laurel::date_ordinal("2010AB01"), 0);
  BOOST_CHECK_EQUAL(laurel::date_ordinal(""), 0);
  
  // trailing characters
  BOOST_CHECK_EQUAL(laurel::date_ordinal("150101X"), 0);
  BOOST_CHECK_EQUAL(laurel::date_ordinal("1501011"), 0);
  BOOST_CHECK_EQUAL(laurel::date_ordinal("201501011"), 0);
}
