/**
 * @file snapshot_codec.cpp
 * @brief Snapshot serialization using nlohmann/json.
 */

#include "model/snapshot_codec.hpp"

#include "model/owner.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace fleet_usage {

using nlohmann::json;

// ADL hooks for nlohmann/json. from_json throws on missing or mistyped
// fields; the decode_* entry points convert that into an Error.

void to_json(json& j, const OwnerTag& owner) {
    j = json{{"kind", to_string(owner.kind)}, {"name", owner.name}};
}

void from_json(const json& j, OwnerTag& owner) {
    auto kind_text = j.at("kind").get<std::string>();
    auto kind = parse_owner_kind(kind_text);
    if (!kind) {
        throw std::invalid_argument("unknown owner kind '" + kind_text + "'");
    }
    owner.kind = *kind;
    owner.name = j.value("name", std::string{});
}

void to_json(json& j, const MachineIdentity& identity) {
    j = json{{"hostname", identity.hostname},
             {"room", identity.room},
             {"owner", identity.owner}};
}

void from_json(const json& j, MachineIdentity& identity) {
    j.at("hostname").get_to(identity.hostname);
    j.at("room").get_to(identity.room);
    j.at("owner").get_to(identity.owner);
}

void to_json(json& j, const Sample& sample) {
    j = json{{"process_name", sample.process_name},
             {"user", sample.user},
             {"cpu_percent", sample.cpu_percent}};
}

void from_json(const json& j, Sample& sample) {
    j.at("process_name").get_to(sample.process_name);
    j.at("user").get_to(sample.user);
    j.at("cpu_percent").get_to(sample.cpu_percent);
}

void to_json(json& j, const LoadAverage& load) {
    j = json{{"one", load.one}, {"five", load.five}, {"fifteen", load.fifteen}};
}

void from_json(const json& j, LoadAverage& load) {
    j.at("one").get_to(load.one);
    j.at("five").get_to(load.five);
    j.at("fifteen").get_to(load.fifteen);
}

void to_json(json& j, const MemoryUsage& memory) {
    j = json{{"used", memory.used}, {"total", memory.total}};
}

void from_json(const json& j, MemoryUsage& memory) {
    j.at("used").get_to(memory.used);
    j.at("total").get_to(memory.total);
}

void to_json(json& j, const Snapshot& snapshot) {
    j = json{{"hostname", snapshot.hostname},
             {"global_cpu_percent", snapshot.global_cpu_percent},
             {"per_core_percent", snapshot.per_core_percent},
             {"load_avg", snapshot.load_avg},
             {"memory", snapshot.memory},
             {"samples", snapshot.samples}};
}

void from_json(const json& j, Snapshot& snapshot) {
    j.at("hostname").get_to(snapshot.hostname);
    j.at("global_cpu_percent").get_to(snapshot.global_cpu_percent);
    j.at("per_core_percent").get_to(snapshot.per_core_percent);
    j.at("load_avg").get_to(snapshot.load_avg);
    j.at("memory").get_to(snapshot.memory);
    j.at("samples").get_to(snapshot.samples);
}

void to_json(json& j, const ClusterEntry& entry) {
    j = json{{"identity", entry.identity}, {"snapshot", entry.snapshot}};
}

void from_json(const json& j, ClusterEntry& entry) {
    j.at("identity").get_to(entry.identity);
    j.at("snapshot").get_to(entry.snapshot);
}

void to_json(json& j, const ClusterSnapshot& cluster) {
    j = json{{"timestamp", cluster.timestamp}, {"entries", cluster.entries}};
}

void from_json(const json& j, ClusterSnapshot& cluster) {
    j.at("timestamp").get_to(cluster.timestamp);
    j.at("entries").get_to(cluster.entries);
}

namespace {

std::string dump(const json& j, bool pretty) {
    return j.dump(pretty ? 2 : -1, ' ', false, json::error_handler_t::replace);
}

template <typename T>
Result<T> decode(std::string_view text, std::string_view what) {
    try {
        return json::parse(text).get<T>();
    } catch (const json::exception& err) {
        return Error{ErrorKind::Deserialization,
                     "could not parse " + std::string{what} + ": " + err.what()};
    } catch (const std::invalid_argument& err) {
        return Error{ErrorKind::Deserialization,
                     "could not parse " + std::string{what} + ": " + err.what()};
    }
}

}  // anonymous namespace

std::string encode_snapshot(const Snapshot& snapshot, bool pretty) {
    return dump(json(snapshot), pretty);
}

std::string encode_cluster_snapshot(const ClusterSnapshot& cluster, bool pretty) {
    return dump(json(cluster), pretty);
}

Result<Snapshot> decode_snapshot(std::string_view text) {
    return decode<Snapshot>(text, "snapshot");
}

Result<ClusterSnapshot> decode_cluster_snapshot(std::string_view text) {
    return decode<ClusterSnapshot>(text, "cluster snapshot");
}

}  // namespace fleet_usage
