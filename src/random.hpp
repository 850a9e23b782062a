#ifndef EDGEWFC_RANDOM_HPP
#define EDGEWFC_RANDOM_HPP

#include <vector>
#include "constants.hpp"

// A Mersenne twister seeded with seed, drawing uniformly from [0, 1).
RandomDouble make_random_double(unsigned seed);

// Pick a random index weighted by a
size_t spin_the_bottle(const std::vector<double>& a, double between_zero_and_one);

// Pick a random index in [0, count)
size_t pick_uniform(size_t count, double between_zero_and_one);

#endif
