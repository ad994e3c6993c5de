#include "navigator/beacon_registry.h"

#include <atomic>

using namespace message_objects;

namespace navigator {

const BLEBeacon* RegistrySnapshot::find(const BeaconId& id) const {
    auto it = beacons.find(id);
    return it == beacons.end() ? nullptr : &it->second;
}

BeaconRegistry::BeaconRegistry()
    : current_(std::make_shared<const RegistrySnapshot>()) {}

BeaconRegistry::BeaconRegistry(const config::SiteConfig& site) : BeaconRegistry() {
    reload(site);
}

std::optional<BLEBeacon> BeaconRegistry::lookup(const BeaconId& id) const {
    auto current = snapshot();
    if (const BLEBeacon* beacon = current->find(id)) {
        return *beacon;
    }
    return std::nullopt;
}

void BeaconRegistry::reload(const std::vector<BLEBeacon>& beacons,
                            const config::SignalSettings& settings) {
    config::SiteConfig site;
    site.beacons = beacons;
    site.settings = settings;
    reload(site);
}

void BeaconRegistry::reload(const config::SiteConfig& site) {
    config::validate(site);

    std::lock_guard<std::mutex> lock(reload_mutex_);
    auto previous = snapshot();

    auto next = std::make_shared<RegistrySnapshot>();
    next->propagationFactor = site.settings.signalPropagationFactor;
    next->beaconCount = site.beacons.size();
    next->generation = previous->generation + 1;
    for (const auto& beacon : site.beacons) {
        next->beacons.emplace(beacon.id_, beacon);
        if (beacon.altId_) {
            next->beacons.emplace(*beacon.altId_, beacon);
        }
    }

    std::shared_ptr<const RegistrySnapshot> published = std::move(next);
    std::atomic_store(&current_, published);
}

std::shared_ptr<const RegistrySnapshot> BeaconRegistry::snapshot() const {
    return std::atomic_load(&current_);
}

std::size_t BeaconRegistry::size() const {
    return snapshot()->beaconCount;
}

double BeaconRegistry::propagationFactor() const {
    return snapshot()->propagationFactor;
}

}  // namespace navigator
