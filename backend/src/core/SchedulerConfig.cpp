#include "SchedulerConfig.hpp"
#include <cctype>
#include <cmath>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {

bool sumsToOne(double sum) {
    return std::fabs(sum - 1.0) < 0.01;
}

void requireUnit(const char* key, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw ConfigError(std::string(key) + " must be in [0, 1]");
    }
}

std::string trim(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

} // namespace

void SchedulerConfig::validate() const {
    requireUnit("mastery_threshold", mastery_threshold);
    requireUnit("easy_upper", easy_upper);
    requireUnit("medium_upper", medium_upper);
    if (easy_upper > medium_upper) {
        throw ConfigError("easy_upper must not exceed medium_upper");
    }

    requireUnit("revision_easy", revision_easy);
    requireUnit("revision_medium", revision_medium);
    requireUnit("revision_hard", revision_hard);
    if (!sumsToOne(revision_easy + revision_medium + revision_hard)) {
        throw ConfigError("revision ratios must sum to 1");
    }

    requireUnit("mix_new", mix_new);
    requireUnit("mix_almost_mastered", mix_almost_mastered);
    requireUnit("mix_almost_there", mix_almost_there);
    requireUnit("mix_struggling", mix_struggling);
    requireUnit("mix_really_struggling", mix_really_struggling);
    if (!sumsToOne(mix_new + mix_almost_mastered + mix_almost_there +
                   mix_struggling + mix_really_struggling)) {
        throw ConfigError("mixed-learning ratios must sum to 1");
    }

    requireUnit("blend_ratio", blend_ratio);
    if (head_slice_factor == 0) throw ConfigError("head_slice_factor must be positive");
    if (fetch_chunk_size == 0) throw ConfigError("fetch_chunk_size must be positive");
    if (max_inflight == 0) throw ConfigError("max_inflight must be positive");
}

std::string SchedulerConfig::serialize() const {
    std::ostringstream oss;
    oss << "mastery_threshold:" << mastery_threshold << "\n"
        << "easy_upper:" << easy_upper << "\n"
        << "medium_upper:" << medium_upper << "\n"
        << "revision_easy:" << revision_easy << "\n"
        << "revision_medium:" << revision_medium << "\n"
        << "revision_hard:" << revision_hard << "\n"
        << "mix_new:" << mix_new << "\n"
        << "mix_almost_mastered:" << mix_almost_mastered << "\n"
        << "mix_almost_there:" << mix_almost_there << "\n"
        << "mix_struggling:" << mix_struggling << "\n"
        << "mix_really_struggling:" << mix_really_struggling << "\n"
        << "min_new_per_session:" << min_new_per_session << "\n"
        << "head_slice_factor:" << head_slice_factor << "\n"
        << "blend_ratio:" << blend_ratio << "\n"
        << "fetch_chunk_size:" << fetch_chunk_size << "\n"
        << "max_inflight:" << max_inflight << "\n";
    return oss.str();
}

void SchedulerConfig::deserialize(const std::string& data) {
    std::istringstream iss(data);
    std::string line;

    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find(':');
        if (pos == std::string::npos) {
            spdlog::warn("Config line without ':' ignored: '{}'", line);
            continue;
        }

        std::string key = trim(line.substr(0, pos));
        std::string valStr = trim(line.substr(pos + 1));

        try {
            if (key == "mastery_threshold") mastery_threshold = std::stod(valStr);
            else if (key == "easy_upper") easy_upper = std::stod(valStr);
            else if (key == "medium_upper") medium_upper = std::stod(valStr);
            else if (key == "revision_easy") revision_easy = std::stod(valStr);
            else if (key == "revision_medium") revision_medium = std::stod(valStr);
            else if (key == "revision_hard") revision_hard = std::stod(valStr);
            else if (key == "mix_new") mix_new = std::stod(valStr);
            else if (key == "mix_almost_mastered") mix_almost_mastered = std::stod(valStr);
            else if (key == "mix_almost_there") mix_almost_there = std::stod(valStr);
            else if (key == "mix_struggling") mix_struggling = std::stod(valStr);
            else if (key == "mix_really_struggling") mix_really_struggling = std::stod(valStr);
            else if (key == "min_new_per_session") min_new_per_session = std::stoul(valStr);
            else if (key == "head_slice_factor") head_slice_factor = std::stoul(valStr);
            else if (key == "blend_ratio") blend_ratio = std::stod(valStr);
            else if (key == "fetch_chunk_size") fetch_chunk_size = std::stoul(valStr);
            else if (key == "max_inflight") max_inflight = std::stoul(valStr);
            else spdlog::warn("Unknown config key '{}' ignored", key);
        }
        catch (const std::exception& e) {
            spdlog::warn("Config value for '{}' not understood ('{}'): {}", key, valStr, e.what());
        }
    }
}
