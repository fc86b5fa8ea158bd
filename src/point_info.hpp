#pragma once

#include "types.hpp"

#include <string>

// ---------------------------------------------------------------------------
// Per-pixel classification
// ---------------------------------------------------------------------------
struct PointInfoPeriodic {
    Period preperiod   = 0;
    Period period      = 0;
    Cplx   multiplier  = 0.0;
    Real   final_error = 0.0;
};

struct PointInfoKnownPotential {
    Period period     = 0;
    Cplx   multiplier = 0.0;
    Real   potential  = 0.0;
};

enum class PointKind : uint8_t {
    Bounded                = 0,
    Wandering              = 1,
    Escaping               = 2,
    Periodic               = 3,
    PeriodicKnownPotential = 4,
    MarkedPoint            = 5,
};

// Exactly one kind holds; only the fields belonging to it are meaningful.
//   Escaping               : potential
//   Periodic               : periodic
//   PeriodicKnownPotential : known
//   MarkedPoint            : periodic, class_id, num_point_classes
struct PointInfo {
    PointKind               kind              = PointKind::Bounded;
    Real                    potential         = 0.0;
    PointInfoPeriodic       periodic;
    PointInfoKnownPotential known;
    uint8_t                 class_id          = 0;
    uint32_t                num_point_classes = 0;

    static PointInfo bounded()   { return PointInfo{}; }
    static PointInfo wandering() { PointInfo p; p.kind = PointKind::Wandering; return p; }

    static PointInfo escaping(Real potential)
    {
        PointInfo p;
        p.kind      = PointKind::Escaping;
        p.potential = potential;
        return p;
    }

    static PointInfo periodic_point(const PointInfoPeriodic& info)
    {
        PointInfo p;
        p.kind     = PointKind::Periodic;
        p.periodic = info;
        return p;
    }

    static PointInfo known_potential(const PointInfoKnownPotential& info)
    {
        PointInfo p;
        p.kind  = PointKind::PeriodicKnownPotential;
        p.known = info;
        return p;
    }

    static PointInfo marked_point(const PointInfoPeriodic& info,
                                  uint8_t class_id, uint32_t num_classes)
    {
        PointInfo p;
        p.kind              = PointKind::MarkedPoint;
        p.periodic          = info;
        p.class_id          = class_id;
        p.num_point_classes = num_classes;
        return p;
    }
};

// Exact field-by-field comparison.
bool operator==(const PointInfo& a, const PointInfo& b);
inline bool operator!=(const PointInfo& a, const PointInfo& b) { return !(a == b); }

// Human-readable summary for interactive inspection.
std::string describe(const PointInfo& info);

// ---------------------------------------------------------------------------
// Terminal state of an orbit computation, before encoding
// ---------------------------------------------------------------------------
enum class EscapeKind : uint8_t {
    Bounded        = 0,
    Escaped        = 1,
    Periodic       = 2,
    KnownPotential = 3,
};

struct EscapeResult {
    EscapeKind              kind        = EscapeKind::Bounded;
    IterCount               iters       = 0;    // Escaped: map applications
    Cplx                    final_value = 0.0;
    PointInfoPeriodic       periodic;           // Periodic
    PointInfoKnownPotential known;              // KnownPotential

    static EscapeResult bounded(Cplx z)
    {
        EscapeResult r;
        r.final_value = z;
        return r;
    }

    static EscapeResult escaped(IterCount iters, Cplx z)
    {
        EscapeResult r;
        r.kind        = EscapeKind::Escaped;
        r.iters       = iters;
        r.final_value = z;
        return r;
    }

    static EscapeResult periodic_cycle(const PointInfoPeriodic& info, Cplx z)
    {
        EscapeResult r;
        r.kind        = EscapeKind::Periodic;
        r.periodic    = info;
        r.final_value = z;
        return r;
    }

    static EscapeResult known_potential(const PointInfoKnownPotential& info)
    {
        EscapeResult r;
        r.kind  = EscapeKind::KnownPotential;
        r.known = info;
        return r;
    }
};
