//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <algorithm>

#include <boost/algorithm/string/predicate.hpp>

#include "matcher.hpp"

namespace laurel
{
  namespace matcher_impl
  {
    inline
    bool coded(const Token& token)
    {
      return ! boost::algorithm::starts_with(token.code, Token::unresolved());
    }
    
    inline
    bool auxiliary(const Token& token)
    {
      return token.is_word() && (token.label == "WAS" || token.label == "IS" || token.label == "BEEN");
    }
    
    // the entity enclosing pos
    int find_entity(const sequence_type& sequence, int pos, const bool upper)
    {
      // upper context is reversed
      const int step = (upper ? 1 : -1);
      
      for (/**/; pos >= 0 && pos < static_cast<int>(sequence.size()); pos += step)
	if (sequence[pos].kind == Token::ENTITY)
	  return pos;
      return -1;
    }
    
    int find_compound(const sequence_type& sequence, int pos, const bool upper)
    {
      const int step = (upper ? 1 : -1);
      
      for (/**/; pos >= 0 && pos < static_cast<int>(sequence.size()); pos += step)
	if (sequence[pos].kind == Token::COMPOUND)
	  return pos;
      return -1;
    }
  };
  
  size_t Matcher::passive(const token_set_type& tokens, const size_t pos_vp, const size_t pos_vp_end)
  {
    using namespace matcher_impl;
    
    // at least an auxiliary verb precedes the participle
    size_t pos = pos_vp + 3;
    for (/**/; pos < pos_vp_end; ++ pos)
      if (tokens[pos].is_open("VBN")) break;
    if (pos >= pos_vp_end)
      return 0;
    
    const size_t pos_close = find_close(tokens, pos);
    if (pos_close >= pos_vp_end)
      return 0;
    
    bool by = false;
    for (size_t i = pos_close + 1; i < pos_vp_end && ! by; ++ i)
      by = (tokens[i].is_word() && tokens[i].label == "BY");
    if (! by)
      return 0;
    
    for (size_t i = pos - 1; i > pos_vp; -- i)
      if (tokens[i].kind == Token::CLOSE
	  && boost::algorithm::starts_with(tokens[i].label, "VB")
	  && auxiliary(tokens[i - 1]))
	return pos + 1;
    
    return 0;
  }
  
  void Matcher::upper_sequence(const token_set_type& tokens, const size_t first, sequence_type& sequence)
  {
    sequence.clear();
    
    for (size_t pos = std::min(first + 1, tokens.size()); pos > parse_start; -- pos) {
      const Token& token = tokens[pos - 1];
      
      if (token.is_close(","))
	break;
      else if (token.kind != Token::OPEN && token.kind != Token::CLOSE)
	sequence.push_back(Element(token, pos - 1));
    }
  }
  
  bool Matcher::lower_sequence(const token_set_type& tokens, const size_t first, const size_t last, sequence_type& sequence)
  {
    sequence.clear();
    
    for (size_t pos = first; pos < tokens.size(); ++ pos) {
      if (pos == last)
	return true;
      
      const Token& token = tokens[pos];
      if (token.kind != Token::OPEN && token.kind != Token::CLOSE)
	sequence.push_back(Element(token, pos));
    }
    
    return false;
  }
  
  bool Matcher::multiword(const token_set_type& tokens,
			  const MultiWord& multi,
			  const size_t pos,
			  const size_t pos_vp_end,
			  size_t& first_upper,
			  size_t& first_lower)
  {
    phrase_type::const_iterator witer = multi.words.begin();
    phrase_type::const_iterator witer_end = multi.words.end();
    
    if (multi.forward) {
      size_t pos_word = pos + 1;
      
      while (witer != witer_end) {
	if (pos_word >= pos_vp_end)
	  return false;
	
	const Token& token = tokens[pos_word];
	if (token.kind == Token::OPEN || token.kind == Token::CLOSE)
	  ++ pos_word;
	else if (token.is_word() && token.label == *witer) {
	  ++ pos_word;
	  ++ witer;
	} else
	  return false;
      }
      
      first_upper = pos - 1;
      first_lower = pos_word;
    } else {
      size_t pos_word = pos;
      
      while (witer != witer_end) {
	if (pos_word <= parse_start)
	  return false;
	
	const Token& token = tokens[pos_word - 1];
	if (token.kind == Token::OPEN || token.kind == Token::CLOSE)
	  -- pos_word;
	else if (token.is_word() && token.label == *witer) {
	  -- pos_word;
	  ++ witer;
	} else
	  return false;
      }
      
      first_upper = pos_word - 1;
      first_lower = pos + 1;
    }
    
    return true;
  }
  
  bool Matcher::synset_match(const std::string& name, const sequence_type& sequence, size_t& pos, const bool upper) const
  {
    const VerbDictionary::synset_type* synset = verbs.synset(name);
    if (! synset) return false;
    
    VerbDictionary::synset_type::const_iterator siter_end = synset->end();
    for (VerbDictionary::synset_type::const_iterator siter = synset->begin(); siter != siter_end; ++ siter) {
      const phrase_type& words = *siter;
      
      if (words.empty() || pos + words.size() > sequence.size()) continue;
      
      // the upper context is matched in reverse
      size_t i = 0;
      for (/**/; i != words.size(); ++ i)
	if (sequence[pos + i].word != (upper ? words[words.size() - i - 1] : words[i]))
	  break;
      
      if (i == words.size()) {
	pos += words.size() - 1;
	return true;
      }
    }
    
    return false;
  }
  
  Matcher::match_type Matcher::match(const pattern_type& pattern,
				     const sequence_type& sequence,
				     const bool upper,
				     Locator& source,
				     Locator& target) const
  {
    using namespace matcher_impl;
    
    if (pattern.empty())
      return MATCH;
    if (sequence.empty())
      return NO_MATCH;
    
    bool inside_entity = false;
    bool inside_compound = false;
    
    size_t kpat = 0;
    size_t kseq = 0;
    
    while (kpat != pattern.size()) {
      const PatternAtom& atom = pattern[kpat];
      const Element& element = sequence[kseq];
      
      if (element.kind == Token::ENTITY || element.kind == Token::ENTITY_END) {
	inside_entity = ! inside_entity;
	if (++ kseq == sequence.size())
	  return NO_MATCH;
	continue;
      } else if (element.kind == Token::COMPOUND || element.kind == Token::COMPOUND_END) {
	inside_compound = ! inside_compound;
	if (++ kseq == sequence.size())
	  return NO_MATCH;
	continue;
      }
      
      bool matched = false;
      
      if (atom.is_control()) {
	if (inside_entity) {
	  switch (atom.kind) {
	  case PatternAtom::SOURCE:
	  case PatternAtom::TARGET: {
	    const int pos = find_entity(sequence, kseq, upper);
	    if (pos < 0)
	      return ERROR;
	    
	    if (atom.kind == PatternAtom::SOURCE)
	      source = Locator(pos, upper);
	    else
	      target = Locator(pos, upper);
	  } break;
	  case PatternAtom::SKIP: {
	    // the end of the entity in the order of matching
	    const Token::kind_type last = (upper ? Token::ENTITY : Token::ENTITY_END);
	    
	    while (sequence[kseq].kind != last)
	      if (++ kseq == sequence.size())
		return ERROR;
	    
	    inside_entity = false;
	  } break;
	  default:
	    break;
	  }
	  
	  matched = true;
	} else if (inside_compound) {
	  if (atom.kind == PatternAtom::COMPOUND) {
	    const int pos = find_compound(sequence, kseq, upper);
	    if (pos < 0)
	      return NO_MATCH;
	    
	    source = Locator(pos, upper);
	    target = Locator(pos, upper);
	  }
	  
	  matched = true;
	}
      } else if (atom.kind == PatternAtom::SYNSET)
	matched = synset_match(atom.word, sequence, kseq, upper);
      else
	matched = (element.kind == Token::WORD && element.word == atom.word);
      
      if (matched) {
	if (++ kpat == pattern.size())
	  return MATCH;
      } else if (atom.connector == '_')
	return NO_MATCH;
      
      if (++ kseq == sequence.size())
	return NO_MATCH;
    }
    
    return MATCH;
  }
  
  bool Matcher::participants(const token_set_type& tokens,
			     const sequence_type& sequence,
			     const Locator& locator,
			     participant_set_type& participants) const
  {
    participants.clear();
    
    std::vector<size_t, std::allocator<size_t> > entities;
    
    if (sequence[locator.index].kind == Token::COMPOUND) {
      const int step = (locator.upper ? -1 : 1);
      
      int pos = locator.index + step;
      for (/**/; pos >= 0 && pos < static_cast<int>(sequence.size()); pos += step) {
	if (sequence[pos].kind == Token::COMPOUND_END)
	  break;
	else if (sequence[pos].kind == Token::ENTITY)
	  entities.push_back(sequence[pos].position);
      }
      
      if (pos < 0 || pos >= static_cast<int>(sequence.size()))
	return false;
    } else
      entities.push_back(sequence[locator.index].position);
    
    std::vector<size_t, std::allocator<size_t> >::const_iterator eiter_end = entities.end();
    for (std::vector<size_t, std::allocator<size_t> >::const_iterator eiter = entities.begin(); eiter != eiter_end; ++ eiter) {
      const Token& entity = tokens[*eiter];
      
      Participant participant;
      
      if (entity.code != Token::unresolved()) {
	participant.code = entity.code;
	participant.root = entity.root;
      } else if (config.new_actor_length > 0) {
	// an unknown actor is coded by its quoted phrase
	const std::string phrase = '"' + entity.text + '"';
	
	if (std::count(phrase.begin(), phrase.end(), ' ') < config.new_actor_length)
	  participant.code = phrase;
	else
	  participant.code = entity.code;
	participant.root = Token::unresolved();
      } else
	continue;
      
      if (! config.write_actor_root)
	participant.root.clear();
      if (config.write_actor_text)
	participant.text = entity.text;
      
      participants.push_back(participant);
    }
    
    // a compound of unresolved entities
    if (participants.empty())
      participants.push_back(Participant(Token::unresolved()));
    
    return true;
  }
  
  Locator Matcher::find_source(const token_set_type& tokens, const sequence_type& upper) const
  {
    using namespace matcher_impl;
    
    // in the order of the sentence
    for (int pos = upper.size() - 1; pos >= 0; -- pos)
      if (upper[pos].kind == Token::COMPOUND || (upper[pos].kind == Token::ENTITY && coded(tokens[upper[pos].position])))
	return Locator(pos, true);
    
    for (int pos = upper.size() - 1; pos >= 0; -- pos)
      if (upper[pos].kind == Token::ENTITY)
	return Locator(pos, true);
    
    return Locator();
  }
  
  Locator Matcher::find_target(const token_set_type& tokens,
			       const sequence_type& upper,
			       const sequence_type& lower,
			       const Locator& source) const
  {
    using namespace matcher_impl;
    
    // the source code is compared only when it is a single code
    std::string code_source;
    {
      participant_set_type sources;
      if (participants(tokens, source.upper ? upper : lower, source, sources) && sources.size() == 1)
	code_source = sources.front().code;
    }
    
    const sequence_type* sequences[2] = {&lower, &upper};
    
    for (int i = 0; i != 2; ++ i) {
      const sequence_type& sequence = *sequences[i];
      const bool is_upper = (i == 1);
      
      // coded by a different code
      for (size_t pos = 0; pos != sequence.size(); ++ pos) {
	if (sequence[pos].kind == Token::COMPOUND)
	  return Locator(pos, is_upper);
	
	if (sequence[pos].kind == Token::ENTITY) {
	  const Token& entity = tokens[sequence[pos].position];
	  
	  if (coded(entity) && (code_source.empty() || ! boost::algorithm::starts_with(entity.code, code_source)))
	    return Locator(pos, is_upper);
	}
      }
      
      // uncoded
      for (size_t pos = 0; pos != sequence.size(); ++ pos)
	if (sequence[pos].kind == Token::ENTITY && ! coded(tokens[sequence[pos].position]))
	  if (! is_upper || ! source.upper || static_cast<int>(pos) != source.index)
	    return Locator(pos, is_upper);
    }
    
    return Locator();
  }
  
  Failure Matcher::operator()(const token_set_type& tokens, event_set_type& events) const
  {
    const Assembler assembler(config.require_dyad);
    
    for (size_t pos = parse_start; pos + 2 < tokens.size(); ++ pos) {
      if (! tokens[pos].is_open("VP")
	  || tokens[pos + 1].kind != Token::OPEN
	  || ! boost::algorithm::starts_with(tokens[pos + 1].label, "VB"))
	continue;
      
      const size_t pos_end = find_close(tokens, pos);
      if (pos_end == tokens.size()) {
	if (config.debug)
	  std::cerr << "warning: verb phrase without its end: " << tokens[pos] << std::endl;
	continue;
      }
      
      const size_t pos_passive = passive(tokens, pos, pos_end);
      const bool   is_passive  = pos_passive;
      const size_t pos_verb    = (is_passive ? pos_passive : pos + 2);
      
      if (! tokens[pos_verb].is_word()) continue;
      
      const VerbEntry* entry = verbs.find(tokens[pos_verb].label);
      if (! entry) continue;
      
      sequence_type upper;
      sequence_type lower;
      
      const VerbEntry* primary = 0;
      std::string code_verb;
      
      // multi-word verbs
      VerbEntry::multiword_set_type::const_iterator miter_end = entry->multiwords.end();
      VerbEntry::multiword_set_type::const_iterator miter = entry->multiwords.begin();
      for (/**/; miter != miter_end; ++ miter) {
	size_t first_upper = 0;
	size_t first_lower = 0;
	
	if (multiword(tokens, *miter, pos_verb, pos_end, first_upper, first_lower)) {
	  const VerbEntry* redirect = verbs.find(miter->verb);
	  
	  primary = (redirect ? verbs.primary(*redirect) : 0);
	  code_verb = miter->code;
	  
	  upper_sequence(tokens, first_upper, upper);
	  if (! lower_sequence(tokens, first_lower, pos_end, lower))
	    return Failure(Failure::SEQUENCE_BOUNDS, "lower sequence of a multi-word verb");
	  break;
	}
      }
      
      if (miter == miter_end) {
	primary = verbs.primary(*entry);
	code_verb = entry->code;
	
	upper_sequence(tokens, pos_verb - 1, upper);
	if (! lower_sequence(tokens, pos_verb + 1, pos_end, lower))
	  return Failure(Failure::SEQUENCE_BOUNDS, "lower sequence");
      }
      
      if (config.debug >= 2)
	std::cerr << "verb: " << tokens[pos_verb].label << (is_passive ? " passive" : "") << std::endl;
      
      Locator source;
      Locator target;
      std::string code;
      bool found = false;
      
      if (primary) {
	VerbEntry::pattern_set_type::const_iterator piter_end = primary->patterns.end();
	for (VerbEntry::pattern_set_type::const_iterator piter = primary->patterns.begin(); piter != piter_end; ++ piter) {
	  source = Locator();
	  target = Locator();
	  
	  const match_type match_upper = match(piter->upper, upper, true, source, target);
	  if (match_upper == ERROR)
	    return Failure(Failure::SEQUENCE_BOUNDS, "upper sequence");
	  if (match_upper != MATCH) continue;
	  
	  const match_type match_lower = match(piter->lower, lower, false, source, target);
	  if (match_lower == ERROR)
	    return Failure(Failure::SEQUENCE_BOUNDS, "lower sequence");
	  if (match_lower != MATCH) continue;
	  
	  if (config.debug >= 2)
	    std::cerr << "pattern: " << piter->upper << " * " << piter->lower << " [" << piter->code << ']' << std::endl;
	  
	  code = piter->code;
	  found = true;
	  break;
	}
	
	if (! found) {
	  source = Locator();
	  target = Locator();
	}
      }
      
      if (found && code == Token::unresolved())
	found = false;
      
      if (! found && ! code_verb.empty() && code_verb != Token::unresolved()) {
	code = code_verb;
	found = true;
      }
      
      if (! found) continue;
      
      if (! source.valid())
	source = find_source(tokens, upper);
      if (source.valid() && ! target.valid())
	target = find_target(tokens, upper, lower, source);
      
      if (source.valid() && target.valid()) {
	participant_set_type sources;
	participant_set_type targets;
	
	if (! participants(tokens, source.upper ? upper : lower, source, sources)
	    || ! participants(tokens, target.upper ? upper : lower, target, targets))
	  return Failure(Failure::SEQUENCE_BOUNDS, "compound without its end");
	
	if (! assembler(sources, targets, code, is_passive, events))
	  std::cerr << "warning: empty codes for the verb " << tokens[pos_verb].label << std::endl;
      }
      
      // resume past the verb phrase
      pos = pos_end;
    }
    
    return Failure();
  }
};
