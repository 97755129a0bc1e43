//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "inflection.hpp"

namespace laurel
{
  std::string plural(const std::string& noun)
  {
    if (noun.empty())
      return noun;
    
    switch (noun[noun.size() - 1]) {
    case 'Y': return noun.substr(0, noun.size() - 1) + "IES";
    case 'S': return noun + "ES";
    default:  return noun + 'S';
    }
  }
  
  std::string plural_issue(const std::string& noun)
  {
    if (noun.empty())
      return noun;
    
    if (noun[noun.size() - 1] == 'Y')
      return noun.substr(0, noun.size() - 1) + "IES";
    else
      return noun + 'S';
  }
  
  std::vector<std::string> verb_forms(const std::string& root)
  {
    std::vector<std::string> forms;
    
    if (root.empty())
      return forms;
    
    forms.push_back(root + 'S');
    
    if (root[root.size() - 1] == 'E') {
      forms.push_back(root + 'D');
      forms.push_back(root.substr(0, root.size() - 1) + "ING");
    } else {
      forms.push_back(root + "ED");
      forms.push_back(root + "ING");
    }
    
    return forms;
  }
};
