#pragma once

// C++ Standard Library
#include <array>
#include <string>
#include <vector>

// built by me
#include "canonical_pose.hpp"

// Canonical bone -> rig bone name, empty where nothing matched.
using BoneNameMap = std::array<std::string, BONE_COUNT>;

// Lowercase, drops "mixamorig" and the separators _ - : and space.
std::string normalizeBoneName(const std::string& name);

// Body-part words found in an already normalized name.
std::vector<std::string> boneKeywords(const std::string& normalized);

// Resolves rig bone names onto the canonical vocabulary. Tries the exact name,
// the Mixamo prefixed variants, a case-insensitive compare and finally a
// keyword match. Each rig bone is used at most once.
BoneNameMap resolveBoneNames(const std::vector<std::string>& rigNames);
