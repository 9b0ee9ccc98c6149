#pragma once
#include <vector>
#include <string>
#include <cstddef>
#include "InMemoryStore.hpp"
#include "../core/SchedulerConfig.hpp"

struct CatalogSummary {
    std::size_t items = 0;
    std::size_t edges = 0;
    std::size_t goals = 0;
    std::size_t skipped = 0;
};

// Storage handles catalog, config and per-learner encrypted state files.
//
// Catalog (plain text, one record per line, '#' starts a comment):
//   item <id> <foundational> <influence> <difficulty> [canonical_order]
//   edge <parent> <child> [kind]
//   goal <id> <group> <item,item,...>
//
// Learner state (encrypted binary):
//   Header: 8 bytes ASCII "PWSTATE\n" (magic + version)
//   Salt:   crypto_pwhash_SALTBYTES, key = crypto_pwhash(passphrase, salt)
//   Nonce:  crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes; plain text lines
//     memory <item> <energy> <next_due>
//     arm <goal_group> <profile> <successes> <failures>
//
// sodium_init() must have succeeded before any learner state call.

class Storage {
public:
    // CATALOG (text)
    static bool loadCatalog(InMemoryStore& store, const std::string& filename,
                            CatalogSummary* summary = nullptr);
    static CatalogSummary parseCatalog(const std::string& text, InMemoryStore& store);

    // CONFIG (text, "key:value"); a missing file keeps the defaults
    static bool loadConfig(SchedulerConfig& config, const std::string& filename);

    // LEARNER STATE (encrypted)
    static bool saveLearnerState(const LearnerState& state, const std::string& filename,
                                 const std::string& passphrase);
    static bool loadLearnerState(LearnerState& state, const std::string& filename,
                                 const std::string& passphrase);

    static std::string serializeLearner(const LearnerState& state);
    static LearnerState parseLearner(const std::string& plain);

    static bool deriveKey(const std::string& passphrase, const std::vector<unsigned char>& salt,
                          std::vector<unsigned char>& key);
};
