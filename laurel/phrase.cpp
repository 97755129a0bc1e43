//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "phrase.hpp"

namespace laurel
{
  void split_phrase(const std::string& text, phrase_item_set_type& items)
  {
    items.clear();
    
    std::string word;
    std::string::const_iterator citer_end = text.end();
    for (std::string::const_iterator citer = text.begin(); citer != citer_end; ++ citer) {
      if (*citer == ' ' || *citer == '_' || *citer == '\t') {
	if (! word.empty()) {
	  items.push_back(phrase_item_type(word, *citer == '_' ? '_' : ' '));
	  word.clear();
	} else if (! items.empty() && *citer == '_')
	  items.back().second = '_';
      } else
	word += *citer;
    }
    
    if (! word.empty())
      items.push_back(phrase_item_type(word, ' '));
  }
  
  bool Phrase::assign(const std::string& text)
  {
    phrase_item_set_type items;
    split_phrase(text, items);
    
    keyword.clear();
    words.clear();
    connectors.clear();
    
    if (items.empty()) return false;
    
    keyword = items.front().first;
    for (size_t i = 1; i != items.size(); ++ i) {
      words.push_back(items[i].first);
      connectors.push_back(items[i - 1].second);
    }
    
    return true;
  }
  
  bool Phrase::match(const phrase_type& fragment, size_t pos) const
  {
    size_t kfrag = pos + 1;
    
    for (size_t kpat = 0; kpat != words.size(); ++ kpat) {
      for (;;) {
	if (kfrag >= fragment.size())
	  return false;
	
	if (fragment[kfrag] == words[kpat]) {
	  ++ kfrag;
	  break;
	} else if (connectors[kpat] == '_')
	  return false;
	else
	  ++ kfrag;
      }
    }
    
    return true;
  }
};
