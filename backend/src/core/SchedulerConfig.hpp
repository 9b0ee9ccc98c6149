#pragma once
#include <string>
#include <cstddef>
#include <stdexcept>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/*
  Tunables of the scheduling pipeline. Passed by value into the gate,
  composer and bandit optimizer so tests can exercise boundary values.

  Text form is one "key:value" per line; see serialize().
*/
struct SchedulerConfig {
    // Prerequisite gate
    double mastery_threshold = 0.3;

    // Revision mode: difficulty buckets and their session shares
    double easy_upper = 0.4;      // difficulty < easy_upper is Easy
    double medium_upper = 0.7;    // difficulty < medium_upper is Medium, else Hard
    double revision_easy = 0.6;
    double revision_medium = 0.3;
    double revision_hard = 0.1;

    // Mixed-learning mode: mastery band shares
    double mix_new = 0.10;
    double mix_almost_mastered = 0.10;
    double mix_almost_there = 0.50;
    double mix_struggling = 0.20;
    double mix_really_struggling = 0.10;
    std::size_t min_new_per_session = 1;

    // Composer reads only the top head_slice_factor * sessionSize ranked items
    std::size_t head_slice_factor = 3;

    // Bandit: share of the chosen profile when blending with the safe default
    double blend_ratio = 0.8;

    // Id lookups are split into batches of this size
    std::size_t fetch_chunk_size = 500;
    // and at most this many batches are in flight at once
    std::size_t max_inflight = 8;

    // Throws ConfigError when a value is out of range.
    void validate() const;

    std::string serialize() const;
    // Keys not present keep their current value.
    void deserialize(const std::string& data);
};
