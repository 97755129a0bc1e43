//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/tokenizer.hpp>

#include "verb.hpp"
#include "reader.hpp"
#include "inflection.hpp"
#include "token.hpp"
#include "phrase.hpp"

#include "utils/space_separator.hpp"

namespace laurel
{
  typedef boost::tokenizer<utils::space_separator> tokenizer_type;
  
  // "TEXT [CODE]" into text and code
  static
  void split_code(const std::string& line, std::string& text, std::string& code)
  {
    const std::string::size_type pos_open = line.find('[');
    
    if (pos_open == std::string::npos) {
      text = boost::algorithm::trim_copy(line);
      code.clear();
    } else {
      const std::string::size_type pos_close = line.find(']', pos_open + 1);
      
      text = boost::algorithm::trim_copy(line.substr(0, pos_open));
      code = boost::algorithm::trim_copy(line.substr(pos_open + 1, pos_close == std::string::npos
						     ? std::string::npos
						     : pos_close - pos_open - 1));
    }
  }
  
  // contents of {...}
  static
  phrase_type braces(const std::string& text)
  {
    phrase_type forms;
    
    const std::string::size_type pos_open  = text.find('{');
    const std::string::size_type pos_close = text.find('}', pos_open);
    if (pos_open == std::string::npos) return forms;
    
    const std::string inside = text.substr(pos_open + 1, pos_close == std::string::npos
					   ? std::string::npos
					   : pos_close - pos_open - 1);
    
    tokenizer_type tokenizer(inside);
    forms.insert(forms.end(), tokenizer.begin(), tokenizer.end());
    
    return forms;
  }
  
  static
  std::string before_braces(const std::string& text)
  {
    return boost::algorithm::trim_copy(text.substr(0, text.find('{')));
  }
  
  struct VerbParser
  {
    VerbParser(VerbDictionary& __dict, Reader& __reader)
      : dict(__dict), reader(__reader), verb(), code_primary(Token::unresolved()), block(false) {}
    
    void operator()()
    {
      std::string line;
      bool pending = reader.getline(line);
      
      while (pending) {
	std::string text;
	std::string code;
	
	split_code(line, text, code);
	
	if (boost::algorithm::starts_with(text, "---")) {
	  code_primary = (code.empty() ? Token::unresolved() : code);
	  block = true;
	  
	} else if (text.empty())
	  reader.warning() << "no verb" << std::endl;
	  
	else if (text[0] == '-')
	  pattern(text, code);
	  
	else if (text[0] == '&') {
	  synset(text, line);
	  pending = ! line.empty();
	  continue;
	  
	} else
	  verb_line(text, code);
	
	pending = reader.getline(line);
      }
    }
    
    // a synonym set followed by +members. line holds the line following the set
    void synset(std::string text, std::string& line)
    {
      const bool noplural = boost::algorithm::ends_with(text, "_");
      if (noplural)
	text.erase(text.size() - 1);
      
      VerbDictionary::synset_type& members = dict.synsets[text];
      members.clear();
      
      while (reader.getline(line) && line[0] == '+') {
	std::string member = boost::algorithm::trim_copy(line.substr(1));
	const bool plural_member = ! noplural && ! boost::algorithm::ends_with(member, "_");
	
	boost::algorithm::replace_all(member, "_", " ");
	
	tokenizer_type tokenizer(member);
	phrase_type words(tokenizer.begin(), tokenizer.end());
	if (words.empty()) continue;
	
	members.push_back(words);
	
	if (plural_member) {
	  words.back() = plural(words.back());
	  members.push_back(words);
	}
      }
      
      if (members.empty())
	reader.warning() << "empty synset " << text << std::endl;
    }
    
    bool atom(const std::string& word, const char connector, pattern_type& pattern)
    {
      PatternAtom::kind_type kind = PatternAtom::LITERAL;
      
      if (word == "$")
	kind = PatternAtom::SOURCE;
      else if (word == "+")
	kind = PatternAtom::TARGET;
      else if (word == "^")
	kind = PatternAtom::SKIP;
      else if (word == "%")
	kind = PatternAtom::COMPOUND;
      else if (word[0] == '&') {
	if (! dict.synset(word)) {
	  reader.warning() << "synset " << word << " has not been defined; pattern skipped" << std::endl;
	  return false;
	}
	kind = PatternAtom::SYNSET;
      }
      
      pattern.push_back(PatternAtom(kind, word, connector));
      return true;
    }
    
    void pattern(const std::string& text, const std::string& code)
    {
      // TABARI legacy
      if (text.find('{') != std::string::npos)
	return;
      
      if (verb.empty()) {
	reader.warning() << "pattern outside of a verb block" << std::endl;
	return;
      }
      
      std::string body = text.substr(1) + ' ';
      boost::algorithm::replace_all(body, "_ ", " ");
      
      const std::string::size_type pos = body.find('*');
      
      std::string upper = boost::algorithm::trim_left_copy(body.substr(0, pos));
      std::string lower = (pos == std::string::npos ? std::string() : boost::algorithm::trim_right_copy(body.substr(pos + 1)));
      
      VerbPattern result;
      result.code = code;
      if (result.code.empty()) {
	reader.warning() << "pattern without a code" << std::endl;
	result.code = Token::unresolved();
      }
      
      phrase_item_set_type items;
      
      // upper is stored from the verb backward
      split_phrase(upper, items);
      for (phrase_item_set_type::const_reverse_iterator iter = items.rbegin(); iter != items.rend(); ++ iter)
	if (! atom(iter->first, iter->second, result.upper))
	  return;
      
      if (! lower.empty()) {
	char connector = ' ';
	if (lower[0] == ' ' || lower[0] == '_') {
	  connector = lower[0];
	  lower.erase(0, 1);
	}
	
	split_phrase(lower, items);
	for (phrase_item_set_type::const_iterator iter = items.begin(); iter != items.end(); ++ iter) {
	  if (! atom(iter->first, connector, result.lower))
	    return;
	  connector = iter->second;
	}
      }
      
      dict.verbs[verb].patterns.push_back(result);
    }
    
    void verb_line(const std::string& text, const std::string& code)
    {
      const std::string code_verb = (code.empty() ? code_primary : code);
      
      bool is_primary = false;
      
      // a verb outside of a block starts a new block
      if (block || verb.empty()) {
	verb = before_braces(text);
	
	VerbDictionary::verb_map_type::iterator iter = dict.verbs.find(verb);
	if (iter != dict.verbs.end() && iter->second.primary && ! iter->second.patterns.empty())
	  reader.warning() << "duplicated verb " << verb << std::endl;
	
	VerbEntry& entry = dict.verbs[verb];
	entry.primary = true;
	entry.code = code_verb;
	entry.redirect.clear();
	
	block = false;
	is_primary = true;
      }
      
      if (text.find('_') != std::string::npos) {
	multiword(text, code_verb);
	return;
      }
      
      if (! is_primary)
	redirect(before_braces(text), code_verb);
      
      if (text.find('{') != std::string::npos) {
	const phrase_type forms = braces(text);
	for (phrase_type::const_iterator fiter = forms.begin(); fiter != forms.end(); ++ fiter)
	  redirect(*fiter, code_verb);
      } else {
	const phrase_type forms = verb_forms(before_braces(text));
	for (phrase_type::const_iterator fiter = forms.begin(); fiter != forms.end(); ++ fiter)
	  redirect(*fiter, code_verb);
      }
    }
    
    void redirect(const std::string& form, const std::string& code)
    {
      VerbEntry& entry = dict.verbs[form];
      
      // never overwrite a primary entry
      if (entry.primary && (! entry.code.empty() || ! entry.patterns.empty() || form == verb))
	return;
      
      entry.primary = false;
      entry.code = code;
      entry.redirect = verb;
    }
    
    void multiword(const std::string& text, const std::string& code)
    {
      phrase_type phrases = braces(text);
      phrases.push_back(before_braces(text));
      
      for (phrase_type::const_iterator piter = phrases.begin(); piter != phrases.end(); ++ piter) {
	if (piter->find('+') == std::string::npos) {
	  reader.warning() << "multi-word verb without +: " << *piter << std::endl;
	  continue;
	}
	
	phrase_type words;
	{
	  std::string phrase = *piter;
	  boost::algorithm::replace_all(phrase, "_", " ");
	  tokenizer_type tokenizer(phrase);
	  words.assign(tokenizer.begin(), tokenizer.end());
	}
	if (words.size() < 2) {
	  reader.warning() << "multi-word verb with a single word: " << *piter << std::endl;
	  continue;
	}
	
	MultiWord multi;
	multi.code = code;
	multi.verb = verb;
	
	std::string head;
	if (words.front()[0] == '+') {
	  multi.forward = true;
	  multi.words.assign(words.begin() + 1, words.end());
	  head = words.front().substr(1);
	} else if (words.back()[0] == '+') {
	  multi.forward = false;
	  multi.words.assign(words.rbegin() + 1, words.rend());
	  head = words.back().substr(1);
	} else {
	  reader.warning() << "the verb of a multi-word verb must be the first or the last word: " << *piter << std::endl;
	  continue;
	}
	
	VerbDictionary::verb_map_type::iterator iter = dict.verbs.find(head);
	if (iter == dict.verbs.end()) {
	  VerbEntry& entry = dict.verbs[head];
	  entry.primary = true;
	  entry.code = Token::unresolved();
	  entry.multiwords.insert(entry.multiwords.begin(), multi);
	} else
	  iter->second.multiwords.insert(iter->second.multiwords.begin(), multi);
      }
    }
    
    VerbDictionary& dict;
    Reader&         reader;
    
    std::string verb;           // key of the current primary verb
    std::string code_primary;   // code of the current block
    bool        block;          // a new block started
  };
  
  void VerbDictionary::read(const path_type& path)
  {
    Reader reader(path);
    read(reader);
  }
  
  void VerbDictionary::read(Reader& reader)
  {
    VerbParser parser(*this, reader);
    parser();
  }
  
  std::ostream& operator<<(std::ostream& os, const pattern_type& pattern)
  {
    pattern_type::const_iterator piter_begin = pattern.begin();
    pattern_type::const_iterator piter_end   = pattern.end();
    for (pattern_type::const_iterator piter = piter_begin; piter != piter_end; ++ piter) {
      if (piter != piter_begin)
	os << piter->connector;
      os << piter->word;
    }
    return os;
  }
};
