// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__PHRASE__HPP__
#define __LAUREL__PHRASE__HPP__ 1

// dictionary phrases: words joined by connectors.
// '_' requires the next word to be adjacent, ' ' allows intervening words.
//

#include <string>
#include <vector>
#include <utility>

namespace laurel
{
  typedef std::vector<std::string, std::allocator<std::string> > phrase_type;
  
  // a word and the connector which follows it
  typedef std::pair<std::string, char> phrase_item_type;
  typedef std::vector<phrase_item_type, std::allocator<phrase_item_type> > phrase_item_set_type;
  
  // split a text on ' ' and '_'. Empty words are dropped, and a '_' is kept when
  // it is merged with other connectors
  void split_phrase(const std::string& text, phrase_item_set_type& items);
  
  struct Phrase
  {
    Phrase() : keyword(), words(), connectors() {}
    
    // false when text has no words
    bool assign(const std::string& text);
    
    // match against a fragment whose word at pos equals the keyword
    bool match(const phrase_type& fragment, size_t pos) const;
    
    size_t size() const { return words.size() + 1; }
    
    std::string keyword;
    phrase_type words;       // words following the keyword
    std::string connectors;  // connector preceding each of words
  };
  
  // longest phrase first
  struct greater_length
  {
    template <typename Tp>
    bool operator()(const Tp& x, const Tp& y) const
    {
      return x.size() > y.size();
    }
  };
};

#endif
