#ifndef NOW_DOT_HPP
#define NOW_DOT_HPP

#include <ctime>
#include <ostream>

#include <glog/logging.h>

// Wall clock time, with the RFC 5322 date-time rendering taken once.

class Now {
public:
  Now();

  auto sec() const { return ts_.tv_sec; }
  auto usec() const { return ts_.tv_nsec / 1000; }

  // For a Date: header.
  char const* string() const { return date_; }

private:
  timespec ts_;
  char     date_[32]; // RFC 5322 section 3.3.

  friend std::ostream& operator<<(std::ostream& s, Now const& now)
  {
    return s << now.date_;
  }
};

inline Now::Now()
{
  PCHECK(clock_gettime(CLOCK_REALTIME, &ts_) == 0);
  tm tm_buf;
  tm* ptm = CHECK_NOTNULL(localtime_r(&ts_.tv_sec, &tm_buf));
  CHECK_EQ(strftime(date_, sizeof date_, "%a, %d %b %Y %H:%M:%S %z", ptm),
           sizeof(date_) - 1);
}

#endif // NOW_DOT_HPP
