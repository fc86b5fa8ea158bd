#include "point_info.hpp"

#include <cstdio>

static constexpr int DISPLAY_PREC = 12;

static bool same_periodic(const PointInfoPeriodic& a, const PointInfoPeriodic& b)
{
    return a.preperiod   == b.preperiod
        && a.period      == b.period
        && a.multiplier  == b.multiplier
        && a.final_error == b.final_error;
}

bool operator==(const PointInfo& a, const PointInfo& b)
{
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case PointKind::Bounded:
        case PointKind::Wandering:
            return true;
        case PointKind::Escaping:
            return a.potential == b.potential;
        case PointKind::Periodic:
            return same_periodic(a.periodic, b.periodic);
        case PointKind::PeriodicKnownPotential:
            return a.known.period     == b.known.period
                && a.known.multiplier == b.known.multiplier
                && a.known.potential  == b.known.potential;
        case PointKind::MarkedPoint:
            return same_periodic(a.periodic, b.periodic)
                && a.class_id          == b.class_id
                && a.num_point_classes == b.num_point_classes;
    }
    return false;
}

static std::string format_cplx(Cplx z)
{
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%.*f %c %.*fi",
                  DISPLAY_PREC, z.real(),
                  z.imag() < 0.0 ? '-' : '+',
                  DISPLAY_PREC, std::abs(z.imag()));
    return buf;
}

static std::string describe_cycle(const PointInfoPeriodic& p)
{
    char buf[128];
    std::snprintf(buf, sizeof(buf),
                  "Cycle detected after %u iterations.\nPeriod: %u\nMultiplier: ",
                  p.preperiod, p.period);
    return buf + format_cplx(p.multiplier);
}

std::string describe(const PointInfo& info)
{
    char buf[128];
    switch (info.kind) {
        case PointKind::Escaping:
            std::snprintf(buf, sizeof(buf), "Escaped, potential: %.*f",
                          DISPLAY_PREC, info.potential);
            return buf;
        case PointKind::Periodic:
            return describe_cycle(info.periodic);
        case PointKind::MarkedPoint:
            std::snprintf(buf, sizeof(buf), "\nMarked point class: %u of %u",
                          static_cast<unsigned>(info.class_id), info.num_point_classes);
            return describe_cycle(info.periodic) + buf;
        case PointKind::PeriodicKnownPotential:
            std::snprintf(buf, sizeof(buf),
                          "Cycle detected.\nPeriod: %u\nPotential: %.*f\nMultiplier: ",
                          info.known.period, DISPLAY_PREC, info.known.potential);
            return buf + format_cplx(info.known.multiplier);
        case PointKind::Bounded:
            return "Bounded (no cycle detected or period too high)";
        case PointKind::Wandering:
            return "Wandering (appears to escape very slowly)";
    }
    return "Unknown";
}
