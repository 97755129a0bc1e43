// -*- mode: c++ -*-

#ifndef __UTILS__SPACE_SEPARATOR__HPP__
#define __UTILS__SPACE_SEPARATOR__HPP__ 1

#include <cctype>

namespace utils
{
  // a TokenizerFunction for boost::tokenizer splitting on any run of white spaces
  // (boost::char_separator needs an explicit set of delimiters)
  struct space_separator
  {
    void reset() {}
    
    template <typename Iterator, typename Token>
    bool operator()(Iterator& next, Iterator end, Token& tok)
    {
      while (next != end && is_space(*next))
	++ next;
      
      if (next == end)
	return false;
      
      Iterator first(next);
      while (next != end && ! is_space(*next))
	++ next;
      
      tok.assign(first, next);
      return true;
    }
    
  private:
    template <typename Char>
    static bool is_space(Char c)
    {
      return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
  };
};

#endif
