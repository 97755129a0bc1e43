//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <algorithm>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/join.hpp>

#include "resolver.hpp"

namespace laurel
{
  // codes are assembled by blocks of three characters
  static const size_t code_block = 3;
  
  void Resolver::compose(std::string& code, const std::string& agent)
  {
    if (agent.empty()) return;
    
    const bool front = (agent[agent.size() - 1] == '~');
    
    std::string block = agent;
    if (block[0] == '~')
      block.erase(0, 1);
    else if (front)
      block.erase(block.size() - 1);
    
    if (block.empty()) return;
    
    for (size_t pos = 0; pos + block.size() <= code.size(); pos += code_block)
      if (code.compare(pos, block.size(), block) == 0)
	return;
    
    if (front)
      code = block + code;
    else
      code += block;
  }
  
  Resolver::Result Resolver::resolve(const phrase_type& phrase, const int ordinal) const
  {
    Result result;
    
    // first actor from the left
    bool found_actor = false;
    for (size_t pos = 0; pos != phrase.size() && ! found_actor; ++ pos) {
      const ActorDictionary::phrase_set_type* candidates = actors.find(phrase[pos]);
      if (! candidates) continue;
      
      ActorDictionary::phrase_set_type::const_iterator citer_end = candidates->end();
      for (ActorDictionary::phrase_set_type::const_iterator citer = candidates->begin(); citer != citer_end; ++ citer)
	if (citer->match(phrase, pos)) {
	  const ActorCode& actor = actors.code(citer->slot);
	  
	  result.code = actor.resolve(ordinal);
	  result.root = actor.root;
	  found_actor = true;
	  break;
	}
    }
    
    // all agents with distinct codes
    std::vector<std::string, std::allocator<std::string> > codes;
    for (size_t pos = 0; pos != phrase.size(); ++ pos) {
      const AgentDictionary::phrase_set_type* candidates = agents.find(phrase[pos]);
      if (! candidates) continue;
      
      AgentDictionary::phrase_set_type::const_iterator citer_end = candidates->end();
      for (AgentDictionary::phrase_set_type::const_iterator citer = candidates->begin(); citer != citer_end; ++ citer)
	if (citer->match(phrase, pos)) {
	  if (std::find(codes.begin(), codes.end(), citer->code) == codes.end())
	    codes.push_back(citer->code);
	  break;
	}
    }
    
    if (codes.empty())
      return result;
    
    if (! found_actor)
      result.code = Token::unresolved();
    
    std::vector<std::string, std::allocator<std::string> >::const_iterator aiter_end = codes.end();
    for (std::vector<std::string, std::allocator<std::string> >::const_iterator aiter = codes.begin(); aiter != aiter_end; ++ aiter)
      compose(result.code, *aiter);
    
    return result;
  }
  
  size_t Resolver::expand(token_set_type& tokens, const size_t pos)
  {
    const size_t pos_end = find_close(tokens, pos);
    if (pos_end == tokens.size())
      return pos;
    
    size_t pos_compound = pos + 1;
    for (/**/; pos_compound != pos_end; ++ pos_compound)
      if (tokens[pos_compound].is_compound()) break;
    if (pos_compound == pos_end)
      return pos;
    
    const size_t pos_compound_end = find_close(tokens, pos_compound);
    if (pos_compound_end >= pos_end)
      return pos;
    
    const token_set_type prefix(tokens.begin() + pos + 1, tokens.begin() + pos_compound);
    const token_set_type suffix(tokens.begin() + pos_compound_end + 1, tokens.begin() + pos_end);
    
    // one entity for each noun head
    token_set_type expanded;
    expanded.push_back(Token::compound());
    
    size_t pos_head = pos_compound + 1;
    while (pos_head < pos_compound_end) {
      const Token& head = tokens[pos_head];
      
      if ((head.kind == Token::OPEN && boost::algorithm::starts_with(head.label, "N")) || head.is_compound()) {
	const size_t pos_head_end = find_close(tokens, pos_head);
	if (pos_head_end >= pos_compound_end) break;
	
	expanded.push_back(Token::entity());
	expanded.insert(expanded.end(), prefix.begin(), prefix.end());
	expanded.insert(expanded.end(), tokens.begin() + pos_head + 1, tokens.begin() + pos_head_end);
	expanded.insert(expanded.end(), suffix.begin(), suffix.end());
	expanded.push_back(Token::entity_end());
	
	pos_head = pos_head_end + 1;
      } else
	++ pos_head;
    }
    
    expanded.push_back(Token::compound_end());
    
    tokens.erase(tokens.begin() + pos, tokens.begin() + pos_end + 1);
    tokens.insert(tokens.begin() + pos, expanded.begin(), expanded.end());
    
    // nested compounds are expanded in place
    size_t pos_expanded_end = pos + expanded.size() - 1;
    for (size_t pos_entity = pos + 1; pos_entity < pos_expanded_end; ++ pos_entity)
      if (tokens[pos_entity].is_entity()) {
	const size_t size = tokens.size();
	const size_t pos_next = expand(tokens, pos_entity);
	
	if (pos_next != pos_entity) {
	  // the compound wrapper of the nested expansion is dropped
	  const size_t pos_nested_end = pos_next - 1;
	  tokens.erase(tokens.begin() + pos_nested_end);
	  tokens.erase(tokens.begin() + pos_entity);
	  
	  pos_expanded_end += tokens.size() - size;
	  pos_entity = pos_nested_end - 2;
	}
      }
    
    return pos_expanded_end + 1;
  }
  
  void Resolver::operator()(token_set_type& tokens, const int ordinal) const
  {
    size_t pos = parse_start;
    while (pos < tokens.size()) {
      if (! tokens[pos].is_entity()) {
	++ pos;
	continue;
      }
      
      const size_t pos_end = find_close(tokens, pos);
      if (pos_end == tokens.size()) {
	++ pos;
	continue;
      }
      
      // the expanded entities are resolved in turn
      if (expand(tokens, pos) != pos) {
	++ pos;
	continue;
      }
      
      phrase_type phrase;
      for (size_t i = pos + 1; i != pos_end; ++ i)
	if (tokens[i].is_word())
	  phrase.push_back(tokens[i].label);
      
      const Result result = resolve(phrase, ordinal);
      
      Token& entity = tokens[pos];
      if (result.found()) {
	entity.code = result.code;
	entity.root = result.root;
      }
      entity.text = boost::algorithm::join(phrase, " ");
      
      pos = pos_end + 1;
    }
  }
};
