// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__INFLECTION__HPP__
#define __LAUREL__INFLECTION__HPP__ 1

// regular inflections generated at dictionary loading.
// irregular forms are listed in the dictionaries themselves.
//

#include <string>
#include <vector>

namespace laurel
{
  // Y -> IES, S -> SES, otherwise +S
  std::string plural(const std::string& noun);
  
  // issue phrases: Y -> IES, otherwise +S
  std::string plural_issue(const std::string& noun);
  
  // third person singular, past and gerund: +S, +D/+ED and +ING (a final E is dropped)
  std::vector<std::string> verb_forms(const std::string& root);
};

#endif
