#include "trajectory.hpp"

namespace lifeplan {

std::string to_string(MilestoneKind kind) {
    switch (kind) {
        case MilestoneKind::DebtPayoff: return "debt_payoff";
        case MilestoneKind::GoalAchieved: return "goal_achieved";
        case MilestoneKind::GoalMissed: return "goal_missed";
        case MilestoneKind::RetirementReady: return "retirement_ready";
        case MilestoneKind::PmiRemoved: return "pmi_removed";
        case MilestoneKind::NetWorthMilestone: return "net_worth_milestone";
    }
    return "net_worth_milestone";
}

const TrajectoryYear* Trajectory::find_year(int year) const {
    for (const auto& entry : years) {
        if (entry.year == year) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace lifeplan
