#include "chaosmine/core/config.h"

namespace chaosmine {

std::vector<EraConfig> default_era_table() {
  std::vector<EraConfig> eras;
  eras.push_back(EraConfig{"dawn", 1'296'000, 15'000, 1, 21'600});
  eras.push_back(EraConfig{"expansion", 2'592'000, 12'500, 2, 10'800});
  eras.push_back(EraConfig{"turbulence", 5'184'000, 10'000, 3, 7'200});
  // Last era: duration is ignored, it lasts forever.
  eras.push_back(EraConfig{"entropy", 0, 8'000, 5, 3'600});
  return eras;
}

std::vector<ZoneConfig> default_zone_table() {
  // Damage multipliers in EventType order:
  // solar_flare, gravitational_wave, cosmic_ray_burst, void_rift.
  std::vector<ZoneConfig> zones;
  zones.push_back(ZoneConfig{"Solar Flats", 1'000, 0, {{12'000, 8'000, 8'000, 8'000}}});
  zones.push_back(ZoneConfig{"Graviton Fields", 0, 1'500, {{9'000, 12'000, 9'000, 9'000}}});
  zones.push_back(ZoneConfig{"Dark Forest", 0, 0, {{10'000, 10'000, 10'000, 10'000}}});
  zones.push_back(ZoneConfig{"Nebula Depths", 800, 0, {{10'000, 10'000, 11'000, 10'000}}});
  zones.push_back(ZoneConfig{"Kuiper Expanse", 0, 500, {{9'000, 9'500, 9'500, 9'500}}});
  zones.push_back(ZoneConfig{"Trisolaran Reach", 2'000, -1'000, {{13'000, 13'000, 13'000, 13'000}}});
  zones.push_back(ZoneConfig{"Pocket Rim", 0, 0, {{10'000, 10'000, 8'800, 10'000}}});
  zones.push_back(ZoneConfig{"Singer Void", 2'500, 0, {{15'000, 15'000, 15'000, 20'000}}});
  return zones;
}

std::vector<QuirkDef> default_quirk_table() {
  std::vector<QuirkDef> quirks;

  QuirkDef solar;
  solar.id = 1;
  solar.name = "solar_tuned";
  solar.zone_mask = 0b0000'0001;
  solar.in_zone_bps = 15'000;
  quirks.push_back(solar);

  QuirkDef cryo;
  cryo.id = 2;
  cryo.name = "cryo_cooled";
  cryo.default_bps = 9'000;
  cryo.zone_mask = 0b0001'0000;
  cryo.in_zone_bps = 13'000;
  quirks.push_back(cryo);

  QuirkDef entropy;
  entropy.id = 3;
  entropy.name = "entropy_harvester";
  entropy.default_bps = 8'000;
  entropy.min_era = 3;
  entropy.era_bps = 20'000;
  quirks.push_back(entropy);

  QuirkDef swarm;
  swarm.id = 4;
  swarm.name = "swarm_linked";
  swarm.pooled_bps = 12'500;
  quirks.push_back(swarm);

  QuirkDef overclocked;
  overclocked.id = 5;
  overclocked.name = "overclocked";
  overclocked.default_bps = 15'000;
  quirks.push_back(overclocked);

  QuirkDef unstable;
  unstable.id = 6;
  unstable.name = "unstable";
  unstable.default_bps = 5'000;
  quirks.push_back(unstable);

  return quirks;
}

} // namespace chaosmine
