// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__TOKEN__HPP__
#define __LAUREL__TOKEN__HPP__ 1

// the flat, bracketed representation of a single sentence.
// phrases are represented by OPEN/CLOSE pairs, entities by ENTITY/ENTITY_END pairs,
// and compound entities by COMPOUND/COMPOUND_END pairs.
//

#include <string>
#include <vector>
#include <iostream>

namespace laurel
{
  struct Token
  {
    typedef enum {
      OPEN,
      CLOSE,
      ENTITY,
      ENTITY_END,
      COMPOUND,
      COMPOUND_END,
      WORD,
    } kind_type;
    
    typedef std::string label_type;
    typedef std::string word_type;
    typedef std::string code_type;
    
    // sentinel for an unresolved entity
    static const code_type& unresolved()
    {
      static const code_type __unresolved("---");
      return __unresolved;
    }
    
    Token() : kind(WORD), label(), index(0), code(), root(), text() {}
    Token(const kind_type& __kind, const label_type& __label, const int __index=0)
      : kind(__kind), label(__label), index(__index), code(), root(), text()
    {
      if (kind == ENTITY)
	code = unresolved();
    }
    
    static Token word(const word_type& __word) { return Token(WORD, __word); }
    static Token open(const label_type& __label, const int __index=0) { return Token(OPEN, __label, __index); }
    static Token close(const label_type& __label, const int __index=0) { return Token(CLOSE, __label, __index); }
    static Token entity() { return Token(ENTITY, "NE"); }
    static Token entity_end() { return Token(ENTITY_END, "NE"); }
    static Token compound(const int __index=0) { return Token(COMPOUND, "NEC", __index); }
    static Token compound_end(const int __index=0) { return Token(COMPOUND_END, "NEC", __index); }
    
    bool is_word() const { return kind == WORD; }
    bool is_opening() const { return kind == OPEN || kind == ENTITY || kind == COMPOUND; }
    bool is_closing() const { return kind == CLOSE || kind == ENTITY_END || kind == COMPOUND_END; }
    bool is_entity() const { return kind == ENTITY; }
    bool is_compound() const { return kind == COMPOUND; }
    
    bool is_open(const label_type& __label) const { return kind == OPEN && label == __label; }
    bool is_close(const label_type& __label) const { return kind == CLOSE && label == __label; }
    
    // true when a closing token matches this opening token
    bool closed_by(const Token& x) const
    {
      switch (kind) {
      case OPEN:     return x.kind == CLOSE        && x.label == label && x.index == index;
      case ENTITY:   return x.kind == ENTITY_END;
      case COMPOUND: return x.kind == COMPOUND_END && x.index == index;
      default:       return false;
      }
    }
    
    bool resolved() const { return kind == ENTITY && code != unresolved(); }
    
    kind_type  kind;
    label_type label;    // syntactic label, or a word for WORD
    int        index;    // occurrence index, zero when not numbered
    
    // payload of ENTITY
    code_type   code;
    std::string root;
    std::string text;
  };
  
  typedef std::vector<Token, std::allocator<Token> > token_set_type;
  
  // first position where the actual sentence begins: ROOT and the top-level clause are skipped
  static const size_t parse_start = 2;
  
  // balance check: every opening token is closed by its matching closing token
  bool balanced(const token_set_type& tokens);
  
  // position of the closing token matching the opening token at pos, or tokens.size()
  size_t find_close(const token_set_type& tokens, size_t pos);
  
  std::ostream& operator<<(std::ostream& os, const Token& token);
  std::ostream& operator<<(std::ostream& os, const token_set_type& tokens);
};

#endif
