#include "arithmetic.hpp"

#include <algorithm>

Period gcd(Period a, Period b)
{
    while (b != 0) {
        const Period r = a % b;
        a = b;
        b = r;
    }
    return a;
}

std::vector<Period> divisors(Period n)
{
    std::vector<Period> out;
    for (Period d = 1; d <= n / d; ++d) {
        if (n % d != 0) continue;
        out.push_back(d);
        if (d != n / d) out.push_back(n / d);
    }
    std::sort(out.begin(), out.end());
    return out;
}

int moebius(Period n)
{
    if (n == 0) return 0;
    int result = 1;
    for (Period p = 2; p <= n / p; ++p) {
        if (n % p != 0) continue;
        n /= p;
        if (n % p == 0) return 0;
        result = -result;
    }
    if (n > 1) result = -result;
    return result;
}
