//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "token.hpp"

namespace laurel
{
  bool balanced(const token_set_type& tokens)
  {
    std::vector<const Token*, std::allocator<const Token*> > stack;
    
    token_set_type::const_iterator titer_end = tokens.end();
    for (token_set_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
      if (titer->is_opening())
	stack.push_back(&(*titer));
      else if (titer->is_closing()) {
	if (stack.empty() || ! stack.back()->closed_by(*titer))
	  return false;
	stack.pop_back();
      }
    }
    
    return stack.empty();
  }
  
  size_t find_close(const token_set_type& tokens, size_t pos)
  {
    if (pos >= tokens.size() || ! tokens[pos].is_opening())
      return tokens.size();
    
    int depth = 0;
    for (size_t i = pos; i != tokens.size(); ++ i) {
      if (tokens[i].is_opening())
	++ depth;
      else if (tokens[i].is_closing()) {
	-- depth;
	if (! depth)
	  return (tokens[pos].closed_by(tokens[i]) ? i : tokens.size());
      }
    }
    return tokens.size();
  }
  
  std::ostream& operator<<(std::ostream& os, const Token& token)
  {
    switch (token.kind) {
    case Token::OPEN:
      os << '(' << token.label;
      if (token.index)
	os << token.index;
      break;
    case Token::CLOSE:
      os << '~' << token.label;
      if (token.index)
	os << token.index;
      break;
    case Token::ENTITY:
      os << "(NE " << token.code;
      break;
    case Token::ENTITY_END:
      os << "~NE";
      break;
    case Token::COMPOUND:
      os << "(NEC";
      if (token.index)
	os << token.index;
      break;
    case Token::COMPOUND_END:
      os << "~NEC";
      if (token.index)
	os << token.index;
      break;
    case Token::WORD:
      os << token.label;
      break;
    }
    return os;
  }
  
  std::ostream& operator<<(std::ostream& os, const token_set_type& tokens)
  {
    token_set_type::const_iterator titer_begin = tokens.begin();
    token_set_type::const_iterator titer_end   = tokens.end();
    for (token_set_type::const_iterator titer = titer_begin; titer != titer_end; ++ titer) {
      if (titer != titer_begin)
	os << ' ';
      os << *titer;
    }
    return os;
  }
};
