//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <cctype>

#include "clause.hpp"

namespace laurel
{
  namespace clause_impl
  {
    inline
    bool is_comma(const Token& token)
    {
      return token.is_open(",");
    }
    
    // (, , ~,
    static const size_t comma_size = 3;
    
    // words starting with an alphabet in [first, last)
    int count_word(const token_set_type& tokens, size_t first, size_t last)
    {
      int count = 0;
      for (/**/; first < last && first < tokens.size(); ++ first)
	if (tokens[first].is_word() && ! tokens[first].label.empty() && std::isalpha(static_cast<unsigned char>(tokens[first].label[0])))
	  ++ count;
      return count;
    }
    
    // the opening token of the final punctuation, i.e. one before the last non-closing token
    size_t find_end(const token_set_type& tokens)
    {
      size_t pos = tokens.size() - 1;
      while (pos >= parse_start && tokens[pos].is_closing())
	-- pos;
      return pos - 1;
    }
    
    size_t find_comma(const token_set_type& tokens, size_t first)
    {
      for (/**/; first < tokens.size(); ++ first)
	if (is_comma(tokens[first]))
	  return first;
      return tokens.size();
    }
    
    // the last comma before last, searching down to parse_start
    size_t rfind_comma(const token_set_type& tokens, size_t last)
    {
      for (size_t pos = last; pos > parse_start; -- pos)
	if (is_comma(tokens[pos - 1]))
	  return pos - 1;
      return tokens.size();
    }
    
    // delete complete phrases in [first, last), leaving the markup of incomplete phrases
    void delete_phrases(token_set_type& tokens, const size_t first, const size_t last)
    {
      std::vector<Token, std::allocator<Token> > stack;
      
      for (size_t pos = std::min(last, tokens.size()); pos > first; -- pos) {
	const Token& token = tokens[pos - 1];
	
	if (token.is_closing())
	  stack.push_back(token);
	else if (token.is_opening() && ! stack.empty() && token.closed_by(stack.back())) {
	  const size_t pos_close = find_close(tokens, pos - 1);
	  if (pos_close == tokens.size()) break;
	  
	  tokens.erase(tokens.begin() + (pos - 1), tokens.begin() + pos_close + 1);
	  stack.pop_back();
	}
      }
    }
  };
  
  Failure ClauseElision::operator()(token_set_type& tokens) const
  {
    using namespace clause_impl;
    
    if (find_comma(tokens, parse_start) == tokens.size())
      return Failure();
    
    if (comma_bmax) {
      const size_t comma = find_comma(tokens, parse_start);
      
      if (within(count_word(tokens, parse_start, comma), comma_bmin, comma_bmax))
	delete_phrases(tokens, parse_start, comma);
    }
    
    if (comma_emax) {
      const size_t last = find_end(tokens);
      const size_t comma = rfind_comma(tokens, last);
      
      if (comma != tokens.size() && within(count_word(tokens, comma, tokens.size()), comma_emin, comma_emax))
	delete_phrases(tokens, comma + comma_size, last);
    }
    
    if (comma_max) {
      size_t first = find_comma(tokens, parse_start);
      
      while (first != tokens.size()) {
	const size_t second = find_comma(tokens, first + 1);
	if (second == tokens.size()) break;
	
	if (within(count_word(tokens, first + comma_size, second), comma_min, comma_max)) {
	  // relocate the second comma after the deletion
	  const size_t distance = tokens.size() - second;
	  
	  delete_phrases(tokens, first + comma_size, second);
	  
	  first = tokens.size() - distance;
	} else
	  first = second;
      }
    }
    
    // dangling initial or terminal comma
    {
      const size_t comma = find_comma(tokens, parse_start);
      if (comma != tokens.size() && ! count_word(tokens, parse_start, comma))
	tokens.erase(tokens.begin() + comma, tokens.begin() + comma + comma_size);
    }
    
    {
      const size_t last = find_end(tokens);
      const size_t comma = rfind_comma(tokens, last);
      if (comma != tokens.size() && ! count_word(tokens, comma + 1, last))
	tokens.erase(tokens.begin() + comma, tokens.begin() + comma + comma_size);
    }
    
    if (! balanced(tokens))
      return Failure(Failure::BAD_COMMA_PARSE, "unbalanced after clause elision");
    
    return Failure();
  }
};
