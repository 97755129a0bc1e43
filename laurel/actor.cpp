//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <cctype>
#include <algorithm>

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "actor.hpp"
#include "reader.hpp"
#include "date.hpp"
#include "inflection.hpp"
#include "token.hpp"

#include "utils/unordered_map.hpp"

namespace laurel
{
  const std::string& ActorCode::resolve(const int ordinal) const
  {
    restriction_set_type::const_iterator riter_end = restrictions.end();
    for (restriction_set_type::const_iterator riter = restrictions.begin(); riter != riter_end; ++ riter)
      if (riter->match(ordinal))
	return riter->code;
    
    return (code.empty() ? Token::unresolved() : code);
  }
  
  template <typename PhraseMap>
  inline
  void sort_phrases(PhraseMap& phrases)
  {
    typename PhraseMap::iterator piter_end = phrases.end();
    for (typename PhraseMap::iterator piter = phrases.begin(); piter != piter_end; ++ piter)
      std::stable_sort(piter->second.begin(), piter->second.end(), greater_length());
  }
  
  // text up to the first of the delimiters
  static inline
  std::string prefix(const std::string& text, const char* delimiters)
  {
    return boost::algorithm::trim_copy(text.substr(0, text.find_first_of(delimiters)));
  }
  
  // contents of the first [...]
  static inline
  std::string bracket(const std::string& text)
  {
    const std::string::size_type pos_open = text.find('[');
    if (pos_open == std::string::npos) return std::string();
    
    const std::string::size_type pos_close = text.find(']', pos_open + 1);
    return boost::algorithm::trim_copy(text.substr(pos_open + 1, pos_close == std::string::npos
						   ? std::string::npos
						   : pos_close - pos_open - 1));
  }
  
  void ActorDictionary::read(const path_type& path)
  {
    Reader reader(path);
    read(reader);
  }
  
  // a date restriction line:
  //	[CODE <date], [CODE >date], [CODE date-date] or [CODE]
  static
  void actor_restriction(const std::string& line, ActorCode& actor, Reader& reader)
  {
    const std::string::size_type pos_bracket = line.find('[');
    if (pos_bracket == std::string::npos) {
      reader.warning() << "string in date restriction could not be interpreted; line skipped" << std::endl;
      return;
    }
    
    const std::string inside = boost::algorithm::trim_copy(line.substr(pos_bracket + 1));
    const std::string::size_type pos_space = inside.find(' ');
    
    const std::string code = inside.substr(0, pos_space);
    const std::string rest = (pos_space == std::string::npos
			      ? std::string()
			      : boost::algorithm::trim_left_copy(inside.substr(pos_space + 1)));
    
    if (rest.find_first_of("<>") != std::string::npos) {
      std::string::const_iterator first = rest.begin() + 1;
      while (first != rest.end() && ! std::isdigit(*first))
	++ first;
      std::string::const_iterator last = first;
      while (last != rest.end() && std::isdigit(*last))
	++ last;
      
      const int ordinal = date_ordinal(std::string(first, last));
      if (! ordinal) {
	reader.warning() << "string in date restriction could not be interpreted; line skipped" << std::endl;
	return;
      }
      
      actor.restrictions.push_back(ActorCode::Restriction(rest[0] == '<'
							  ? ActorCode::Restriction::BEFORE
							  : ActorCode::Restriction::AFTER,
							  ordinal, ordinal, code));
      
    } else if (rest.find('-') != std::string::npos) {
      const std::string::size_type pos_hyphen = rest.find('-');
      
      const int ordinal_first = date_ordinal(boost::algorithm::trim_copy(rest.substr(0, pos_hyphen)));
      const int ordinal_last  = date_ordinal(prefix(rest.substr(pos_hyphen + 1), "]"));
      
      if (! ordinal_first || ! ordinal_last) {
	reader.warning() << "string in date restriction could not be interpreted; line skipped" << std::endl;
	return;
      }
      if (ordinal_last < ordinal_first) {
	reader.warning() << "end date in interval date restriction is less than starting date; line skipped" << std::endl;
	return;
      }
      
      actor.restrictions.push_back(ActorCode::Restriction(ActorCode::Restriction::INTERVAL, ordinal_first, ordinal_last, code));
    } else
      actor.code = prefix(code, "]");
  }
  
  void ActorDictionary::read(Reader& reader)
  {
    // slot of the current primary phrase
    bool has_actor = false;
    
    std::string line;
    while (reader.getline(line)) {
      if (line.find("---STOP---") != std::string::npos)
	break;
      
      if (line[0] == '\t') {
	if (! has_actor)
	  reader.warning() << "date restriction without an actor" << std::endl;
	else
	  actor_restriction(line, codes.back(), reader);
	continue;
      }
      
      std::string text;
      
      if (line[0] == '+') {
	if (! has_actor) {
	  reader.warning() << "synonym without an actor" << std::endl;
	  continue;
	}
	text = prefix(line.substr(1), ";[");
      } else {
	text = prefix(line, ";[");
	
	codes.push_back(ActorCode());
	codes.back().code = bracket(line);
	codes.back().root = text;
	has_actor = true;
      }
      
      ActorPhrase phrase;
      if (! phrase.assign(text)) {
	reader.warning() << "empty actor phrase" << std::endl;
	continue;
      }
      phrase.slot = codes.size() - 1;
      
      phrases[phrase.keyword].push_back(phrase);
    }
    
    sort_phrases(phrases);
  }
  
  // plural of an agent phrase, keeping the terminal connector
  static inline
  std::string agent_plural(const std::string& agent)
  {
    if (! agent.empty() && agent[agent.size() - 1] == '_')
      return plural(agent.substr(0, agent.size() - 1)) + '_';
    else
      return plural(agent);
  }
  
  void AgentDictionary::read(const path_type& path)
  {
    Reader reader(path);
    read(reader);
  }
  
  void AgentDictionary::read(Reader& reader)
  {
    typedef utils::unordered_map<std::string, phrase_type>::type marker_map_type;
    
    marker_map_type markers;
    
    std::string line;
    while (reader.getline(line)) {
      // !marker! = a, b, c
      if (line.find('!') != std::string::npos && line.find('=') != std::string::npos) {
	const std::string::size_type pos_first = line.find('!');
	const std::string::size_type pos_second = line.find('!', pos_first + 1);
	const std::string::size_type pos_equal = line.find('=', pos_first);
	
	if (pos_second == std::string::npos || pos_equal == std::string::npos || pos_equal < pos_second) {
	  reader.warning() << "substitution marker incorrectly defined; line skipped" << std::endl;
	  continue;
	}
	
	phrase_type& members = markers[line.substr(pos_first + 1, pos_second - pos_first - 1)];
	members.clear();
	
	const std::string list = line.substr(pos_equal + 1);
	boost::algorithm::split(members, list, boost::algorithm::is_any_of(","));
	for (phrase_type::iterator miter = members.begin(); miter != members.end(); ++ miter)
	  boost::algorithm::trim(*miter);
	members.erase(std::remove(members.begin(), members.end(), std::string()), members.end());
	continue;
      }
      
      if (line.find('[') == std::string::npos) {
	reader.warning() << "codes are required for agents; line skipped" << std::endl;
	continue;
      }
      
      const std::string code = bracket(line);
      const std::string agent = prefix(line, "[");
      
      // pairs of a singular and its plural
      typedef std::pair<std::string, std::string> form_type;
      typedef std::vector<form_type, std::allocator<form_type> > form_set_type;
      
      form_set_type forms;
      
      if (agent.find('!') != std::string::npos) {
	const std::string::size_type pos_first = agent.find('!');
	const std::string::size_type pos_second = agent.find('!', pos_first + 1);
	
	if (pos_second == std::string::npos) {
	  reader.warning() << "substitution marker syntax incorrect; line skipped" << std::endl;
	  continue;
	}
	
	marker_map_type::const_iterator miter = markers.find(agent.substr(pos_first + 1, pos_second - pos_first - 1));
	if (miter == markers.end()) {
	  reader.warning() << "substitution marker " << agent.substr(pos_first, pos_second - pos_first + 1)
			   << " missing; line skipped" << std::endl;
	  continue;
	}
	
	const std::string head = agent.substr(0, pos_first);
	const std::string tail = boost::algorithm::trim_right_copy(agent.substr(pos_second + 1));
	
	for (phrase_type::const_iterator siter = miter->second.begin(); siter != miter->second.end(); ++ siter) {
	  const std::string expanded = head + *siter + tail;
	  forms.push_back(form_type(expanded, agent_plural(expanded)));
	}
	
      } else if (agent.find('{') != std::string::npos) {
	const std::string::size_type pos_open = agent.find('{');
	const std::string::size_type pos_close = agent.find('}', pos_open);
	
	if (pos_close == std::string::npos) {
	  reader.warning() << "missing '}'; line skipped" << std::endl;
	  continue;
	}
	
	forms.push_back(form_type(boost::algorithm::trim_copy(agent.substr(0, pos_open)),
				  boost::algorithm::trim_copy(agent.substr(pos_open + 1, pos_close - pos_open - 1))));
      } else
	forms.push_back(form_type(agent, agent_plural(agent)));
      
      for (form_set_type::const_iterator fiter = forms.begin(); fiter != forms.end(); ++ fiter) {
	AgentPhrase phrase;
	phrase.code = code;
	
	if (phrase.assign(fiter->first))
	  phrases[phrase.keyword].push_back(phrase);
	else
	  reader.warning() << "empty agent phrase" << std::endl;
	
	if (! fiter->second.empty() && phrase.assign(fiter->second))
	  phrases[phrase.keyword].push_back(phrase);
      }
    }
    
    sort_phrases(phrases);
  }
};
