#ifndef CTPN_COMMON_HPP_
#define CTPN_COMMON_HPP_

#include <boost/random/mersenne_twister.hpp>
#include <boost/shared_ptr.hpp>
#include <glog/logging.h>

#include <cmath>
#include <map>
#include <string>
#include <utility>
#include <vector>

// Instantiate a class with float and double specifications.
#define INSTANTIATE_CLASS(classname) \
  char gInstantiationGuard##classname; \
  template class classname<float>; \
  template class classname<double>

namespace ctpn {

// Common functions and classes from std and boost that ctpn uses.
using boost::shared_ptr;
using std::map;
using std::pair;
using std::string;
using std::vector;

typedef boost::mt19937 rng_t;

// Seedable random source. Every component that samples takes one of these
// from its caller, so a fixed seed reproduces the same labels.
class RNG {
 public:
  explicit RNG(unsigned int seed);
  RNG(const RNG& other);
  RNG& operator=(const RNG& other);

  unsigned int rand();
  void reseed(unsigned int seed);

 private:
  shared_ptr<rng_t> generator_;
};

}  // namespace ctpn

#endif  // CTPN_COMMON_HPP_
