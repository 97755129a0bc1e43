//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <stdexcept>

#include "coder.hpp"
#include "date.hpp"

namespace laurel
{
  std::ostream& operator<<(std::ostream& os, const Summary& summary)
  {
    os << "stories: " << summary.stories
       << " sentences coded: " << summary.sentences
       << " events: " << summary.events << '\n'
       << "discards: sentence: " << summary.discards_sentence
       << " story: " << summary.discards_story
       << " sentences without events: " << summary.empty
       << " failures: " << summary.failures;
    return os;
  }
  
  Failure Coder::tokenize(const Sentence& sentence, token_set_type& tokens) const
  {
    const int ordinal = date_ordinal(sentence.date);
    if (! ordinal)
      return Failure(Failure::BAD_DATE, "invalid date: " + sentence.date);
    
    Failure failure = normalizer(sentence.parse, tokens);
    if (failure.failed())
      return failure;
    
    if (config.debug >= 3)
      std::cerr << "normalized: " << tokens << std::endl;
    
    failure = elision(tokens);
    if (failure.failed())
      return failure;
    
    resolver(tokens, ordinal);
    
    if (config.debug >= 2)
      std::cerr << "resolved: " << tokens << std::endl;
    
    return failure;
  }
  
  Coding Coder::operator()(const Sentence& sentence) const
  {
    Coding coding;
    coding.id = sentence.id;
    
    const DiscardList::Result discard = dict.discards.check(sentence.text);
    if (discard.type != DiscardList::NONE) {
      coding.discard = discard.type;
      coding.phrase  = discard.phrase;
      
      if (config.debug)
	std::cerr << (discard.type == DiscardList::STORY ? "story" : "sentence")
		  << " discard: " << sentence.id << ": " << discard.phrase << std::endl;
      return coding;
    }
    
    token_set_type tokens;
    
    coding.failure = tokenize(sentence, tokens);
    if (coding.failure.ok())
      coding.failure = matcher(tokens, coding.events);
    
    if (coding.failure.failed()) {
      coding.events.clear();
      
      std::cerr << "warning: " << sentence.id << ": " << coding.failure << std::endl;
      return coding;
    }
    
    if (config.debug)
      for (event_set_type::const_iterator eiter = coding.events.begin(); eiter != coding.events.end(); ++ eiter)
	std::cerr << "event: " << sentence.id << ": " << *eiter << std::endl;
    
    if (! coding.events.empty() && ! dict.issues.empty())
      coding.issues = dict.issues.code(sentence.text);
    
    return coding;
  }
};
