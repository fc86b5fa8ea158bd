#pragma once

#include "types.hpp"

#include <vector>

Period gcd(Period a, Period b);

// All positive divisors of n in increasing order; empty for n == 0.
std::vector<Period> divisors(Period n);

// Moebius function: 0 if n has a squared prime factor, otherwise
// (-1)^(number of prime factors). moebius(1) == 1.
int moebius(Period n);
