#include "newton.hpp"

const char* newton_status_message(NewtonStatus status)
{
    switch (status) {
        case NewtonStatus::Converged:        return "";
        case NewtonStatus::FailedToConverge: return "Newton's method failed to converge";
        case NewtonStatus::NanEncountered:   return "Newton's method encountered a non-finite value";
    }
    return "Unknown Newton status";
}
