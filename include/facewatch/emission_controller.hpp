#pragma once

#include <functional>

#include "facewatch/cooldown_gate.hpp"
#include "facewatch/event_store.hpp"
#include "facewatch/upload_scheduler.hpp"

namespace facewatch {

enum class Proposal { Submitted, CoolingDown, UploadDelayed, Rejected };

const char* proposal_to_string(Proposal p);

struct ProposalResult {
    Proposal outcome{Proposal::CoolingDown};
    Seconds remaining_delay{0.0};
};

// Decides whether a detection becomes a persisted event. Both the per-kind
// cooldown and the shared upload gate must be open; when only the gate is
// closed the cooldown timer is left alone so the same condition is retried
// on a later tick.
class EmissionController {
public:
    using RecordFactory = std::function<EventRecord()>;

    EmissionController(CooldownGate& cooldown, UploadScheduler& scheduler);

    // make_record is only invoked when the event is actually submitted.
    ProposalResult propose(EventKind kind, TimePoint now, const RecordFactory& make_record);

private:
    CooldownGate& cooldown_;
    UploadScheduler& scheduler_;
};

}  // namespace facewatch
