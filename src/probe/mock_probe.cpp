/**
 * @file mock_probe.cpp
 * @brief MockProbe implementation: scripted readings for testing.
 */

#include "probe/probe.hpp"

#include <numeric>

namespace fleet_usage {

MockProbe::MockProbe(std::string hostname, size_t core_count)
    : hostname_(std::move(hostname)), per_core_(core_count, 0.0f) {
    // Sensible defaults resembling a small workstation
    memory_.total = 16ULL * 1024 * 1024 * 1024;  // 16 GB
    memory_.used = 4ULL * 1024 * 1024 * 1024;    // 4 GB
}

Result<void> MockProbe::refresh() {
    if (refresh_error_) {
        return Error{ErrorKind::Probe, *refresh_error_};
    }
    ++refresh_count_;
    return Result<void>{};
}

std::vector<ProcessReading> MockProbe::processes() const {
    if (!warmed_up()) {
        auto cold = processes_;
        for (auto& reading : cold) reading.cpu_percent = 0.0f;
        return cold;
    }
    return processes_;
}

std::vector<float> MockProbe::per_core_percent() const {
    if (!warmed_up()) return std::vector<float>(per_core_.size(), 0.0f);
    return per_core_;
}

float MockProbe::global_cpu_percent() const {
    if (!warmed_up() || per_core_.empty()) return 0.0f;
    return std::accumulate(per_core_.begin(), per_core_.end(), 0.0f)
           / static_cast<float>(per_core_.size());
}

std::optional<std::string> MockProbe::user_name(Uid uid) {
    auto it = users_.find(uid);
    if (it == users_.end()) return std::nullopt;
    return it->second;
}

void MockProbe::add_process(ProcessReading reading) {
    processes_.push_back(std::move(reading));
}

void MockProbe::add_user(Uid uid, std::string name) {
    users_.insert_or_assign(uid, std::move(name));
}

void MockProbe::set_per_core(std::vector<float> percent) {
    per_core_ = std::move(percent);
}

void MockProbe::set_memory(uint64_t used, uint64_t total) {
    memory_.used = used;
    memory_.total = total;
}

void MockProbe::set_load_average(LoadAverage load) {
    load_avg_ = load;
}

void MockProbe::fail_refresh(std::string message) {
    refresh_error_ = std::move(message);
}

}  // namespace fleet_usage
