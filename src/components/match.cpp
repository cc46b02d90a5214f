#include "gunpong/components/match.hpp"

namespace Components {

std::string phaseName(Phase phase) {
    switch (phase) {
        case Phase::Start:    return "START";
        case Phase::Ongoing:  return "ONGOING";
        case Phase::LeftWin:  return "LEFT_WIN";
        case Phase::RightWin: return "RIGHT_WIN";
        default: return "UNKNOWN";
    }
}

} // namespace Components
