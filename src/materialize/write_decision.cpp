#include <bankgen/materialize/write_decision.hpp>

namespace bankgen {

auto decide_write(const TableSpec& spec, TargetKind target, bool table_exists) -> WriteDecision {
    WriteDecision decision;
    if (spec.partitioned) {
        decision.layout = storage::Layout::partition_by(std::string(kExecutionDateColumn));
    } else if (spec.bucketed) {
        decision.layout = storage::Layout::bucket_by(std::string(kBucketColumn), spec.num_buckets);
    }
    if (target == TargetKind::Catalog && table_exists) {
        decision.mode = storage::WriteMode::Append;
    }
    return decision;
}

}  // namespace bankgen
