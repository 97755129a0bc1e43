// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__DATE__HPP__
#define __LAUREL__DATE__HPP__ 1

#include <string>

namespace laurel
{
  // day ordinal of a YYYYMMDD or YYMMDD string, with 1601-01-01 as 1.
  // strings of at most seven characters are YYMMDD, where YY <= 30 is 20YY and 19YY otherwise.
  // Characters after the eighth are ignored.
  // Returns zero for a malformed date or a day which does not exist.
  int date_ordinal(const std::string& date);
  
  // ordinal from numerical year, month and day, or zero when invalid
  int date_ordinal(int year, int month, int day);
};

#endif
