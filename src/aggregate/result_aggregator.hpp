#pragma once

#include "core/errors/audit_errors.hpp"
#include "pipeline/pipeline_state.hpp"
#include "protocol/audit_record.hpp"

namespace webaudit::aggregate {

// Builds the final record from a finished run. Only a Done state qualifies;
// anything else is an error, never a partial record.
class ResultAggregator {
public:
    core::errors::Result<protocol::AuditRecord> build(const pipeline::PipelineState& state) const;
};

}  // namespace webaudit::aggregate
