#include "bone_name_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <unordered_map>
#include <unordered_set>

#include "log.hpp"

namespace {

const std::vector<std::string> KEYWORDS = {
    "hip", "hips", "pelvis", "spine", "chest", "neck", "head", "shoulder",
    "arm", "forearm", "hand", "thumb", "index", "middle", "ring", "pinky",
    "leg", "upleg", "knee", "foot", "toe", "eye", "ear", "nose", "left", "right",
};

const double MIN_FUZZY_SCORE = 0.5;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Trailing digits, e.g. "2" for "lefthandindex2"
std::string digitSuffix(const std::string& s) {
    std::size_t i = s.size();
    while (i > 0 && std::isdigit(static_cast<unsigned char>(s[i - 1]))) --i;
    return s.substr(i);
}

std::vector<std::string> nameVariants(const std::string& canonical) {
    return {canonical, "mixamorig" + canonical, "mixamorig_" + canonical, "mixamorig:" + canonical};
}

}  // namespace

std::string normalizeBoneName(const std::string& name) {
    std::string out = toLower(name);
    const std::string prefix = "mixamorig";
    for (auto pos = out.find(prefix); pos != std::string::npos; pos = out.find(prefix)) {
        out.erase(pos, prefix.size());
    }
    out.erase(std::remove_if(out.begin(), out.end(),
                             [](char c) { return c == '_' || c == '-' || c == ' ' || c == ':'; }),
              out.end());
    return out;
}

std::vector<std::string> boneKeywords(const std::string& normalized) {
    std::vector<std::string> found;
    for (const auto& k : KEYWORDS) {
        if (normalized.find(k) != std::string::npos) {
            found.push_back(k);
        }
    }
    return found;
}

BoneNameMap resolveBoneNames(const std::vector<std::string>& rigNames) {
    BoneNameMap resolved;
    std::unordered_set<std::string> used;

    std::unordered_map<std::string, std::string> exact;
    std::unordered_map<std::string, std::string> lower;
    for (const auto& name : rigNames) {
        exact.emplace(name, name);
        lower.emplace(toLower(name), name);
    }

    // Pass 1: exact, prefixed and case-insensitive names
    for (std::size_t i = 0; i < BONE_COUNT; ++i) {
        for (const auto& candidate : nameVariants(boneName(boneAt(i)))) {
            const std::string* hit = nullptr;
            auto e = exact.find(candidate);
            if (e != exact.end()) {
                hit = &e->second;
            } else {
                auto l = lower.find(toLower(candidate));
                if (l != lower.end()) hit = &l->second;
            }
            if (hit && !used.count(*hit)) {
                resolved[i] = *hit;
                used.insert(*hit);
                break;
            }
        }
    }

    // Pass 2: keyword match for whatever is left
    for (std::size_t i = 0; i < BONE_COUNT; ++i) {
        if (!resolved[i].empty()) continue;

        const std::string canonical = normalizeBoneName(boneName(boneAt(i)));
        const auto keywords = boneKeywords(canonical);
        if (keywords.empty()) continue;
        const std::string suffix = digitSuffix(canonical);

        double best_score = MIN_FUZZY_SCORE;
        std::size_t best_extra = 0;
        const std::string* best = nullptr;
        for (const auto& name : rigNames) {
            if (used.count(name)) continue;
            const std::string candidate = normalizeBoneName(name);
            if (digitSuffix(candidate) != suffix) continue;

            std::size_t matched = 0;
            for (const auto& k : keywords) {
                if (candidate.find(k) != std::string::npos) ++matched;
            }
            if (matched != keywords.size()) continue;

            // Prefer the candidate with the fewest extra characters
            const double score = static_cast<double>(matched) / keywords.size();
            const std::size_t extra = candidate.size() > canonical.size() ? candidate.size() - canonical.size()
                                                                          : canonical.size() - candidate.size();
            if (score > best_score || (best && score == best_score && extra < best_extra)) {
                best_score = score;
                best_extra = extra;
                best = &name;
            }
        }

        if (best) {
            LOG_INFO("[Retarget] Fuzzy match: \"" << boneName(boneAt(i)) << "\" -> \"" << *best << "\"");
            resolved[i] = *best;
            used.insert(*best);
        }
    }

    std::size_t count = 0;
    for (std::size_t i = 0; i < BONE_COUNT; ++i) {
        if (resolved[i].empty()) {
            LOG_VERBOSE("[Retarget] Missing bone for " << boneName(boneAt(i)));
        } else {
            ++count;
        }
    }
    LOG_INFO("[Retarget] Resolved " << count << "/" << BONE_COUNT << " bones");
    return resolved;
}
