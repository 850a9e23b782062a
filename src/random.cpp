#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <loguru.hpp>
#include "random.hpp"

RandomDouble make_random_double(unsigned seed)
{
	return [gen = std::mt19937(seed), dis = std::uniform_real_distribution<double>(0.0, 1.0)]() mutable {
		return dis(gen);
	};
}

double calc_sum(const std::vector<double>& a)
{
	return std::accumulate(a.begin(), a.end(), 0.0);
}

size_t spin_the_bottle(const std::vector<double>& a, double between_zero_and_one)
{
	CHECK_F(!a.empty(), "Nothing to choose from");

	double sum = calc_sum(a);

	if (sum == 0.0) {
		return pick_uniform(a.size(), between_zero_and_one);
	}

	double between_zero_and_sum = between_zero_and_one * sum;

	double accumulated = 0;

	for (auto i : irange(a.size())) {
		accumulated += a[i];
		if (between_zero_and_sum < accumulated) {
			return i;
		}
	}

	// Rounding errors: fall back to the last index with any weight.
	for (size_t i = a.size(); i-- > 0;) {
		if (a[i] > 0) { return i; }
	}
	return 0;
}

size_t pick_uniform(size_t count, double between_zero_and_one)
{
	CHECK_GT_F(count, 0u);
	const auto index = static_cast<size_t>(std::floor(between_zero_and_one * count));
	return std::min(index, count - 1);
}
