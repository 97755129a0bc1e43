// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__CLAUSE__HPP__
#define __LAUREL__CLAUSE__HPP__ 1

// elision of comma delimited clauses.
//
// initial:  phrases before the first comma
// terminal: phrases between the last comma and the final punctuation
// internal: phrases between two successive commas
//
// a clause is removed when its word count is within [min, max]. A zero max disables the pass.
// Only complete phrases are removed, and the comma markers are left in place.
//

#include "token.hpp"
#include "failure.hpp"
#include "config.hpp"

namespace laurel
{
  class ClauseElision
  {
  public:
    ClauseElision(const int __comma_min, const int __comma_max,
		  const int __comma_bmin, const int __comma_bmax,
		  const int __comma_emin, const int __comma_emax)
      : comma_min(__comma_min), comma_max(__comma_max),
	comma_bmin(__comma_bmin), comma_bmax(__comma_bmax),
	comma_emin(__comma_emin), comma_emax(__comma_emax) {}
    
    ClauseElision(const Config& config)
      : comma_min(config.comma_min), comma_max(config.comma_max),
	comma_bmin(config.comma_bmin), comma_bmax(config.comma_bmax),
	comma_emin(config.comma_emin), comma_emax(config.comma_emax) {}
    
    Failure operator()(token_set_type& tokens) const;
    
  private:
    bool within(const int count, const int minimum, const int maximum) const
    {
      return minimum <= count && count <= maximum;
    }
    
  private:
    int comma_min;
    int comma_max;
    int comma_bmin;
    int comma_bmax;
    int comma_emin;
    int comma_emax;
  };
};

#endif
