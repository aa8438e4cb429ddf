#include "chaosmine/core/enum_strings.h"

namespace chaosmine {

std::string event_type_to_string(EventType t) {
  switch (t) {
    case EventType::SolarFlare: return "solar_flare";
    case EventType::GravitationalWave: return "gravitational_wave";
    case EventType::CosmicRayBurst: return "cosmic_ray_burst";
    case EventType::VoidRift: return "void_rift";
  }
  return "solar_flare";
}

std::optional<EventType> event_type_from_string(const std::string& s) {
  if (s == "solar_flare") return EventType::SolarFlare;
  if (s == "gravitational_wave") return EventType::GravitationalWave;
  if (s == "cosmic_ray_burst") return EventType::CosmicRayBurst;
  if (s == "void_rift") return EventType::VoidRift;
  return std::nullopt;
}

std::string burn_source_to_string(BurnSource s) {
  switch (s) {
    case BurnSource::Mining: return "mining";
    case BurnSource::RigPurchase: return "rig_purchase";
    case BurnSource::FacilityUpgrade: return "facility_upgrade";
    case BurnSource::RigRepair: return "rig_repair";
    case BurnSource::ShieldPurchase: return "shield_purchase";
    case BurnSource::EarlyClaim: return "early_claim";
  }
  return "mining";
}

std::optional<BurnSource> burn_source_from_string(const std::string& s) {
  if (s == "mining") return BurnSource::Mining;
  if (s == "rig_purchase") return BurnSource::RigPurchase;
  if (s == "facility_upgrade") return BurnSource::FacilityUpgrade;
  if (s == "rig_repair") return BurnSource::RigRepair;
  if (s == "shield_purchase") return BurnSource::ShieldPurchase;
  if (s == "early_claim") return BurnSource::EarlyClaim;
  return std::nullopt;
}

} // namespace chaosmine
