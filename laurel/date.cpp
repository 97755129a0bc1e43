//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#define BOOST_SPIRIT_THREADSAFE
#define PHOENIX_THREADSAFE

#include <boost/spirit/include/qi.hpp>

#include "date.hpp"

namespace laurel
{
  int date_ordinal(int year, int month, int day)
  {
    static const int days[13] = {0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    
    if (month < 1 || month > 12 || day < 1 || day > days[month])
      return 0;
    
    if (month == 2) {
      const bool leap = (year % 400 == 0) || (year % 100 != 0 && year % 4 == 0);
      if (! leap && day > 28)
	return 0;
    }
    
    // julian day number
    const int adjust = (month < 3 ? 1 : 0);
    const int y = year + 4800 - adjust;
    const int m = month + 12 * adjust - 3;
    
    const int julian = day + (153 * m + 2) / 5 + 365 * y + y / 4 - y / 100 + y / 400 - 32045;
    
    // 1601-01-01 is julian day 2305814
    return julian - 2305813;
  }
  
  int date_ordinal(const std::string& date)
  {
    namespace qi = boost::spirit::qi;
    
    qi::uint_parser<int, 10, 4, 4> year4;
    qi::uint_parser<int, 10, 2, 2> digit2;
    
    int year = 0;
    int month = 0;
    int day = 0;
    
    std::string::const_iterator iter = date.begin();
    std::string::const_iterator end = date.end();
    
    if (date.size() > 7) {
      if (! qi::parse(iter, end, year4 >> digit2 >> digit2, year, month, day))
	return 0;
    } else {
      if (! qi::parse(iter, end, digit2 >> digit2 >> digit2, year, month, day))
	return 0;
      
      year += (year <= 30 ? 2000 : 1900);
    }
    
    if (iter != end)
      return 0;
    
    return date_ordinal(year, month, day);
  }
};
