#include "ctpn/common.hpp"

namespace ctpn {

RNG::RNG(unsigned int seed) : generator_(new rng_t(seed)) {}

RNG::RNG(const RNG& other) : generator_(new rng_t(*other.generator_)) {}

RNG& RNG::operator=(const RNG& other) {
  generator_.reset(new rng_t(*other.generator_));
  return *this;
}

unsigned int RNG::rand() {
  return (*generator_)();
}

void RNG::reseed(unsigned int seed) {
  generator_->seed(seed);
}

}  // namespace ctpn
