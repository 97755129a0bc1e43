// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__FAILURE__HPP__
#define __LAUREL__FAILURE__HPP__ 1

// sentence-level failures. A sentence which fails is skipped, and the failure is reported
// by its tag, which is also used by the validation records.
//

#include <string>
#include <iostream>

namespace laurel
{
  class Failure
  {
  public:
    typedef enum {
      NONE = 0,
      BAD_INPUT_PARSE,
      EMPTY_NPLIST,
      BAD_FINAL_PARSE,
      DATELINE,
      BAD_COMMA_PARSE,
      SEQUENCE_BOUNDS,
      BAD_DATE,
    } tag_type;
    
  public:
    Failure() : tag_(NONE), message_() {}
    Failure(const tag_type& __tag, const std::string& __message)
      : tag_(__tag), message_(__message) {}
    
    static Failure success() { return Failure(); }
    
    bool ok() const { return tag_ == NONE; }
    bool failed() const { return tag_ != NONE; }
    
    const tag_type& tag() const { return tag_; }
    const std::string& message() const { return message_; }
    
    // stable identifier
    const char* name() const
    {
      switch (tag_) {
      case NONE:            return "none";
      case BAD_INPUT_PARSE: return "bad_input_parse";
      case EMPTY_NPLIST:    return "empty_nplist";
      case BAD_FINAL_PARSE: return "bad_final_parse";
      case DATELINE:        return "dateline";
      case BAD_COMMA_PARSE: return "bad_comma_parse";
      case SEQUENCE_BOUNDS: return "sequence_bounds";
      case BAD_DATE:        return "bad_date";
      }
      return "unknown";
    }
    
  private:
    tag_type    tag_;
    std::string message_;
  };
  
  inline
  std::ostream& operator<<(std::ostream& os, const Failure& x)
  {
    os << x.name();
    if (! x.message().empty())
      os << ": " << x.message();
    return os;
  }
};

#endif
