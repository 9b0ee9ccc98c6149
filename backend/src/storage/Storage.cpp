#include "Storage.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstring>
#include <iterator>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "PWSTATE\n";

static std::vector<std::string> splitWords(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string w;
    while (iss >> w) out.push_back(w);
    return out;
}

static std::vector<std::string> splitList(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string t;
    while (std::getline(iss, t, ',')) {
        while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
        while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

static bool toDouble(const std::string& s, double& out) {
    try {
        std::size_t used = 0;
        out = std::stod(s, &used);
        return used == s.size();
    }
    catch (const std::exception&) {
        return false;
    }
}

static bool toLong(const std::string& s, long long& out) {
    try {
        std::size_t used = 0;
        out = std::stoll(s, &used);
        return used == s.size();
    }
    catch (const std::exception&) {
        return false;
    }
}

static std::string stripComment(const std::string& line) {
    auto pos = line.find('#');
    return pos == std::string::npos ? line : line.substr(0, pos);
}

/* -------------------------
   Catalog
   ------------------------- */

CatalogSummary Storage::parseCatalog(const std::string& text, InMemoryStore& store) {
    CatalogSummary summary;
    std::istringstream iss(text);
    std::string raw;
    long long lineNo = 0;

    while (std::getline(iss, raw)) {
        ++lineNo;
        std::vector<std::string> w = splitWords(stripComment(raw));
        if (w.empty()) continue;

        if (w[0] == "item" && w.size() >= 2 && w.size() <= 6) {
            CandidateItem item;
            item.id = w[1];
            item.canonical_order = lineNo;

            // absent scores stay 0.0
            double* fields[3] = { &item.foundational_score, &item.influence_score, &item.difficulty_score };
            bool ok = true;
            for (std::size_t i = 2; i < w.size() && i < 5; ++i) {
                ok = ok && toDouble(w[i], *fields[i - 2]);
            }
            if (ok && w.size() == 6) ok = toLong(w[5], item.canonical_order);

            if (ok) {
                store.addItem(item);
                ++summary.items;
                continue;
            }
        }
        else if (w[0] == "edge" && (w.size() == 3 || w.size() == 4)) {
            PrerequisiteEdge edge;
            edge.parent = w[1];
            edge.child = w[2];
            edge.kind = parseEdgeKind(w.size() == 4 ? w[3] : "");
            store.addEdge(edge);
            ++summary.edges;
            continue;
        }
        else if (w[0] == "goal" && w.size() == 4) {
            Goal goal;
            goal.id = w[1];
            goal.goal_group = w[2];
            goal.item_ids = splitList(w[3]);
            store.addGoal(goal);
            ++summary.goals;
            continue;
        }

        spdlog::warn("Catalog line {} malformed; skipped: '{}'", lineNo, raw);
        ++summary.skipped;
    }

    return summary;
}

bool Storage::loadCatalog(InMemoryStore& store, const std::string& filename, CatalogSummary* summary) {
    spdlog::info("Loading catalog from '{}'", filename);
    std::ifstream in(filename);
    if (!in) {
        spdlog::error("Failed to open catalog '{}'", filename);
        return false;
    }

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CatalogSummary s = parseCatalog(text, store);
    if (summary) *summary = s;

    spdlog::info("Loaded catalog: {} items, {} edges, {} goals ({} lines skipped)",
        s.items, s.edges, s.goals, s.skipped);
    return true;
}

bool Storage::loadConfig(SchedulerConfig& config, const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        spdlog::info("No config file '{}'; using defaults", filename);
        return true;
    }

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    SchedulerConfig candidate = config;
    candidate.deserialize(text);
    try {
        candidate.validate();
    }
    catch (const ConfigError& e) {
        spdlog::error("Config '{}' rejected: {}", filename, e.what());
        return false;
    }

    config = candidate;
    spdlog::info("Loaded config from '{}'", filename);
    return true;
}

/* -------------------------
   Learner state
   ------------------------- */

std::string Storage::serializeLearner(const LearnerState& state) {
    std::ostringstream oss;
    oss.precision(17);
    for (const auto& m : state.memory) {
        oss << "memory " << m.item_id << " " << m.energy << " " << m.next_due << "\n";
    }
    for (const auto& a : state.arms) {
        oss << "arm " << a.goal_group << " " << toString(a.arm.profile) << " "
            << a.arm.successes << " " << a.arm.failures << "\n";
    }
    return oss.str();
}

LearnerState Storage::parseLearner(const std::string& plain) {
    LearnerState state;
    std::istringstream iss(plain);
    std::string line;

    while (std::getline(iss, line)) {
        std::vector<std::string> w = splitWords(line);
        if (w.empty()) continue;

        if (w[0] == "memory" && w.size() == 4) {
            MemoryRecord r;
            r.item_id = w[1];
            long long due = 0;
            if (toDouble(w[2], r.energy) && toLong(w[3], due)) {
                r.next_due = static_cast<std::time_t>(due);
                state.memory.push_back(r);
                continue;
            }
        }
        else if (w[0] == "arm" && w.size() == 5) {
            auto profile = parseProfileName(w[2]);
            ArmRecord r;
            r.goal_group = w[1];
            if (profile && toDouble(w[3], r.arm.successes) && toDouble(w[4], r.arm.failures)) {
                r.arm.profile = *profile;
                state.arms.push_back(r);
                continue;
            }
        }

        spdlog::warn("Learner state line not understood; skipped");
    }
    return state;
}

bool Storage::deriveKey(const std::string& passphrase, const std::vector<unsigned char>& salt,
                        std::vector<unsigned char>& key)
{
    spdlog::debug("Deriving state key (not logging passphrase or salt)");
    if (salt.size() != crypto_pwhash_SALTBYTES) {
        spdlog::error("Invalid salt size");
        return false;
    }

    key.assign(crypto_secretbox_KEYBYTES, 0);
    if (crypto_pwhash(key.data(), key.size(),
        passphrase.c_str(), passphrase.size(),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during key derivation");
        sodium_memzero(key.data(), key.size());
        key.clear();
        return false;
    }
    return true;
}

bool Storage::saveLearnerState(const LearnerState& state, const std::string& filename,
                               const std::string& passphrase)
{
    spdlog::info("Saving learner state ({} memory rows, {} arms) to '{}'",
        state.memory.size(), state.arms.size(), filename);

    std::vector<unsigned char> salt(crypto_pwhash_SALTBYTES);
    randombytes_buf(salt.data(), salt.size());

    std::vector<unsigned char> key;
    if (!deriveKey(passphrase, salt, key)) return false;

    std::string plain = serializeLearner(state);
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    int rc = crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data());
    sodium_memzero(key.data(), key.size());
    if (rc != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for encrypted write", filename);
        return false;
    }

    out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
    out.write(reinterpret_cast<const char*>(salt.data()), salt.size());
    out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
    if (!out) {
        spdlog::error("Write to '{}' failed", filename);
        return false;
    }
    return true;
}

bool Storage::loadLearnerState(LearnerState& state, const std::string& filename,
                               const std::string& passphrase)
{
    spdlog::info("Loading learner state from '{}'", filename);
    state = LearnerState{};

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("State file '{}' not found; treating as empty", filename);
        return true;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

    std::vector<unsigned char> salt(crypto_pwhash_SALTBYTES);
    in.read(reinterpret_cast<char*>(salt.data()), salt.size());
    if (in.gcount() != static_cast<std::streamsize>(salt.size())) {
        spdlog::error("Failed to read salt");
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> key;
    if (!deriveKey(passphrase, salt, key)) return false;

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    int rc = crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(),
                                        nonce, key.data());
    sodium_memzero(key.data(), key.size());
    if (rc != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupted file)");
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    state = parseLearner(plain_str);

    spdlog::info("Loaded {} memory rows and {} arms", state.memory.size(), state.arms.size());
    return true;
}
