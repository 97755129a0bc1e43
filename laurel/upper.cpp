//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <memory>
#include <stdexcept>

#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/translit.h>

#include "upper.hpp"

namespace laurel
{
  Upper::Upper() : pimpl(0)
  {
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::Transliterator> trans(icu::Transliterator::createInstance(icu::UnicodeString::fromUTF8("Upper"), UTRANS_FORWARD, status));
    if (U_FAILURE(status))
      throw std::runtime_error(std::string("transliterator::create_instance(): ") + u_errorName(status));
    
    pimpl = trans.release();
  }
  
  Upper::~Upper()
  {
    std::unique_ptr<icu::Transliterator> tmp(static_cast<icu::Transliterator*>(pimpl));
  }
  
  std::string Upper::operator()(const std::string& text) const
  {
    if (! pimpl)
      throw std::runtime_error("no upper caser?");
    
    if (text.empty()) return text;
    
    icu::UnicodeString utext = icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), text.size()));
    
    static_cast<icu::Transliterator*>(pimpl)->transliterate(utext);
    
    std::string text_upper;
    utext.toUTF8String(text_upper);
    
    return text_upper;
  }
};
