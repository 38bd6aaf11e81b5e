#include "facewatch/emission_controller.hpp"

#include <iomanip>
#include <iostream>

namespace facewatch {

const char* proposal_to_string(Proposal p) {
    switch (p) {
        case Proposal::Submitted: return "submitted";
        case Proposal::UploadDelayed: return "upload_delayed";
        case Proposal::Rejected: return "rejected";
        default: return "cooling_down";
    }
}

EmissionController::EmissionController(CooldownGate& cooldown, UploadScheduler& scheduler)
    : cooldown_(cooldown), scheduler_(scheduler) {}

ProposalResult EmissionController::propose(EventKind kind, TimePoint now,
                                           const RecordFactory& make_record) {
    if (!cooldown_.may_emit(kind, now)) {
        return ProposalResult{Proposal::CoolingDown, Seconds(0.0)};
    }

    const UploadStatus gate = scheduler_.upload_status(now);
    if (!gate.can_upload_now) {
        std::cout << "[" << event_kind_to_string(kind) << "] detected but upload delayed by "
                  << std::fixed << std::setprecision(1) << gate.remaining_delay.count()
                  << " seconds\n";
        return ProposalResult{Proposal::UploadDelayed, gate.remaining_delay};
    }

    SubmitResult submitted = scheduler_.submit(make_record(), now);
    if (submitted.outcome == SubmitOutcome::Rejected) {
        return ProposalResult{Proposal::Rejected, submitted.remaining_delay};
    }
    cooldown_.record_emit(kind, now);
    return ProposalResult{Proposal::Submitted, submitted.remaining_delay};
}

}  // namespace facewatch
