#include "shardsim/pipeline/config.hpp"

namespace shardsim::pipeline {

using namespace shardsim::core;

Status validate_run_config(const RunConfig& cfg) noexcept {
    Status s = shardsim::erasure::codec_validate_params(cfg.codec);
    if (!is_ok(s)) {
        return s;
    }
    if (cfg.workers == 0 || cfg.workers > kMaxWorkers) {
        return make_status(StatusDomain::Pipeline, StatusCode::Invalid, cfg.workers);
    }
    if (cfg.pool.disks.empty()) {
        return make_status(StatusDomain::Placement, StatusCode::Invalid);
    }
    for (const std::string& disk : cfg.pool.disks) {
        if (disk.empty() || disk.find('/') != std::string::npos) {
            return make_status(StatusDomain::Placement, StatusCode::Invalid);
        }
    }
    if (cfg.input_path.empty()) {
        return make_status(StatusDomain::Input, StatusCode::Invalid);
    }
    return ok_status();
}

} // namespace shardsim::pipeline
