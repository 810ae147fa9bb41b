#include "types.h"

namespace fsched
{

    const char *to_string(JobStatus s)
    {
        switch (s)
        {
        case JobStatus::Unscheduled: return "unscheduled";
        case JobStatus::Scheduled: return "scheduled";
        case JobStatus::AtRisk: return "at_risk";
        case JobStatus::Completed: return "completed";
        case JobStatus::Cancelled: return "cancelled";
        }
        return "unscheduled";
    }

    const char *to_string(Priority p)
    {
        switch (p)
        {
        case Priority::Low: return "low";
        case Priority::Medium: return "medium";
        case Priority::High: return "high";
        case Priority::Urgent: return "urgent";
        case Priority::Emergency: return "emergency";
        }
        return "medium";
    }

    const char *to_string(ObjectiveKind k)
    {
        switch (k)
        {
        case ObjectiveKind::MinimizeTravelTime: return "minimize_travel_time";
        case ObjectiveKind::MaximizeUtilization: return "maximize_utilization";
        case ObjectiveKind::BalanceWorkload: return "balance_workload";
        case ObjectiveKind::MinimizeCost: return "minimize_cost";
        case ObjectiveKind::MaximizeCustomerSatisfaction: return "maximize_customer_satisfaction";
        }
        return "minimize_travel_time";
    }

    const char *to_string(UnscheduledReason r)
    {
        switch (r)
        {
        case UnscheduledReason::NoCandidate: return "no_candidate";
        case UnscheduledReason::NoSlot: return "no_slot";
        case UnscheduledReason::TravelTimeExceeded: return "travel_time_exceeded";
        }
        return "no_candidate";
    }

    const char *to_string(DisruptionType t)
    {
        switch (t)
        {
        case DisruptionType::TrafficDelay: return "traffic_delay";
        case DisruptionType::Weather: return "weather";
        case DisruptionType::EmergencyInsertion: return "emergency_insertion";
        case DisruptionType::ResourceUnavailable: return "resource_unavailable";
        case DisruptionType::CustomerReschedule: return "customer_reschedule";
        case DisruptionType::EquipmentFailure: return "equipment_failure";
        }
        return "traffic_delay";
    }

    const char *to_string(Severity s)
    {
        switch (s)
        {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
        }
        return "medium";
    }

    const char *to_string(RunStatus s)
    {
        switch (s)
        {
        case RunStatus::Queued: return "Queued";
        case RunStatus::Running: return "Running";
        case RunStatus::Completed: return "Completed";
        case RunStatus::Failed: return "Failed";
        case RunStatus::Cancelled: return "Cancelled";
        }
        return "Queued";
    }

} // namespace fsched
