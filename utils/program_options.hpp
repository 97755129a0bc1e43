// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __UTILS__PROGRAM_OPTIONS__HPP__
#define __UTILS__PROGRAM_OPTIONS__HPP__ 1

// additional definition for program_options...

#include <memory>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace utils
{
  // a boolean option which accepts an explicit value, such as --option=false or "option = False" in a config file
  inline
  boost::program_options::typed_value<bool>* true_false_switch(bool* value)
  {
    typedef boost::program_options::typed_value<bool> value_type;

    std::unique_ptr<value_type> ret(new value_type(value));
    if (value)
      ret->default_value(*value, *value ? "true" : "false");
    else
      ret->default_value(false, "false");
    ret->implicit_value(true, "true");

    return ret.release();
  }

  inline
  boost::program_options::typed_value<bool>* true_false_switch()
  {
    return true_false_switch(0);
  }

  // comma separated list, with surrounding spaces and empty elements removed
  template <typename Container>
  inline
  void comma_list(const std::string& list, Container& container)
  {
    std::vector<std::string> elements;
    boost::algorithm::split(elements, list, boost::algorithm::is_any_of(","));

    std::vector<std::string>::iterator eiter_end = elements.end();
    for (std::vector<std::string>::iterator eiter = elements.begin(); eiter != eiter_end; ++ eiter) {
      boost::algorithm::trim(*eiter);
      if (! eiter->empty())
	container.push_back(typename Container::value_type(*eiter));
    }
  }
};

#endif
