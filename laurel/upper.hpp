// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__UPPER__HPP__
#define __LAUREL__UPPER__HPP__ 1

// unicode aware upper casing of sentences and parses

#include <string>

#include <boost/noncopyable.hpp>

namespace laurel
{
  class Upper : private boost::noncopyable
  {
  public:
    Upper();
    ~Upper();
    
  public:
    std::string operator()(const std::string& text) const;
    
  private:
    void* pimpl;
  };
};

#endif
