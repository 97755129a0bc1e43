//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include "discard.hpp"
#include "reader.hpp"

namespace laurel
{
  void DiscardList::read(const path_type& path)
  {
    Reader reader(path);
    read(reader);
  }
  
  void DiscardList::read(Reader& reader)
  {
    std::string line;
    while (reader.getline(line)) {
      std::string target = boost::algorithm::trim_copy(line.substr(0, line.find('#')));
      
      Phrase phrase;
      if (! target.empty() && target[0] == '+') {
	phrase.story = true;
	target = boost::algorithm::trim_copy(target.substr(1));
      }
      if (! target.empty() && target[target.size() - 1] == '_') {
	phrase.terminal = true;
	target.erase(target.size() - 1);
      }
      
      if (target.empty()) {
	reader.warning() << "empty discard phrase" << std::endl;
	continue;
      }
      
      phrase.text = ' ' + boost::algorithm::to_upper_copy(target);
      phrases.push_back(phrase);
    }
  }
  
  static inline
  bool boundary(const std::string& text, const std::string::size_type pos)
  {
    return pos >= text.size() || text[pos] == ' ' || text[pos] == '.' || text[pos] == '!' || text[pos] == '?';
  }
  
  static inline
  bool contains(const std::string& text, const DiscardList::Phrase& phrase)
  {
    for (std::string::size_type pos = text.find(phrase.text); pos != std::string::npos; pos = text.find(phrase.text, pos + 1))
      if (! phrase.terminal || boundary(text, pos + phrase.text.size()))
	return true;
    return false;
  }
  
  DiscardList::Result DiscardList::check(const std::string& sentence) const
  {
    // phrases start with a blank
    const std::string text = ' ' + sentence;
    
    phrase_set_type::const_iterator piter_end = phrases.end();
    for (phrase_set_type::const_iterator piter = phrases.begin(); piter != piter_end; ++ piter)
      if (piter->story && contains(text, *piter))
	return Result(STORY, piter->text.substr(1));
    
    for (phrase_set_type::const_iterator piter = phrases.begin(); piter != piter_end; ++ piter)
      if (! piter->story && contains(text, *piter))
	return Result(SENTENCE, piter->text.substr(1));
    
    return Result();
  }
};
