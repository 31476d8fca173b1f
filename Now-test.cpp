#include "Now.hpp"

#include <cstring>
#include <sstream>

int main(int argc, char* argv[])
{
  Now then;

  std::stringstream then_str;
  then_str << then;

  Now then_again{then};
  std::stringstream then_again_str;
  then_again_str << then_again;

  CHECK_EQ(then_str.str(), then_again_str.str());
  CHECK_EQ(strlen(then.string()), 31u);
  CHECK_GE(then.usec(), 0);
  CHECK_LT(then.usec(), 1000000);

  Now later;
  CHECK_GE(later.sec(), then.sec());
}
