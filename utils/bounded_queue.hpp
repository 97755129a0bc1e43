// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __UTILS__BOUNDED_QUEUE__HPP__
#define __UTILS__BOUNDED_QUEUE__HPP__ 1

// blocking queue of a fixed capacity shared by producers and consumers

#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition.hpp>

namespace utils
{
  template <typename Tp, typename Alloc=std::allocator<Tp> >
  class bounded_queue : private boost::noncopyable
  {
  private:
    typedef std::vector<Tp, Alloc>    buffer_type;
    typedef boost::mutex              mutex_type;
    typedef boost::condition          condition_type;
    typedef boost::mutex::scoped_lock lock_type;
    
  public:
    bounded_queue(const size_t n)
      : buffer(n > 0 ? n : 1), first(0), last(0), buffered(0) {}
    
  public:
    size_t size() { lock_type lock(mutex); return buffered; }
    bool empty() { lock_type lock(mutex); return buffered == 0; }
    
    void push(const Tp& x)
    {
      lock_type lock(mutex);
      
      while (buffered == buffer.size())
	not_full.wait(lock);
      
      buffer[last] = x;
      last = (last + 1) % buffer.size();
      ++ buffered;
      
      not_empty.notify_one();
    }
    
    void pop(Tp& x)
    {
      lock_type lock(mutex);
      
      while (buffered == 0)
	not_empty.wait(lock);
      
      x = buffer[first];
      buffer[first] = Tp();
      first = (first + 1) % buffer.size();
      -- buffered;
      
      not_full.notify_one();
    }
    
  private:
    buffer_type buffer;
    size_t first;
    size_t last;
    size_t buffered;
    
    mutex_type     mutex;
    condition_type not_full;
    condition_type not_empty;
  };
};

#endif
