#pragma once

#include <eoslink/config.hpp>
#include <eoslink/console.hpp>
#include <eoslink/error.hpp>
#include <eoslink/fwd.hpp>
#include <eoslink/logger.hpp>
#include <eoslink/osc.hpp>
#include <eoslink/programmer.hpp>
#include <eoslink/records.hpp>

// ─── Usage ───────────────────────────────────────────────────────────────────
//
//   eoslink::SessionConfig config;
//   config.load(eoslink::SessionConfig::default_path());
//   auto console = eoslink::Console::connect(config);
//   if (!console) return 1;
//
//   auto cue = console->get_cue({1, 10.0});
//   eoslink::Programmer(*console).block_cue({1, 10.0});
