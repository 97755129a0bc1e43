// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__CONFIG__HPP__
#define __LAUREL__CONFIG__HPP__ 1

#include <string>

namespace laurel
{
  // options consumed by the coding engine
  struct Config
  {
    Config()
      : comma_min(2), comma_max(8),
	comma_bmin(0), comma_bmax(0),
	comma_emin(0), comma_emax(0),
	require_dyad(true),
	new_actor_length(0),
	write_actor_root(false),
	write_actor_text(false),
	stop_on_error(false),
	debug(0) {}
    
    // clause elision thresholds on the word counts of internal, initial (b) and terminal (e) clauses.
    // a zero maximum disables the pass
    int comma_min;
    int comma_max;
    int comma_bmin;
    int comma_bmax;
    int comma_emin;
    int comma_emax;
    
    bool require_dyad;
    
    // unresolved entities shorter than this are emitted as quoted phrases
    int  new_actor_length;
    
    bool write_actor_root;
    bool write_actor_text;
    
    bool stop_on_error;
    
    int debug;
  };
};

#endif
