#include "scene_skeleton.hpp"

#include <stdexcept>

#include "bone_name_resolver.hpp"

int SceneSkeleton::addBone(const std::string& name,
                           const std::string& parent,
                           const Eigen::Vector3d& localPosition,
                           const Eigen::Quaterniond& localRotation,
                           double localScale) {
    if (indexByName.count(name)) {
        throw std::invalid_argument("Duplicate bone name: " + name);
    }
    int parent_index = -1;
    if (!parent.empty()) {
        parent_index = indexOf(parent);
        if (parent_index < 0) {
            throw std::invalid_argument("Unknown parent bone '" + parent + "' for " + name);
        }
    }

    Node n;
    n.name = name;
    n.parent = parent_index;
    n.localPosition = localPosition;
    n.localRotation = localRotation.normalized();
    n.localScale = localScale;

    const int index = static_cast<int>(nodes.size());
    nodes.push_back(n);
    if (parent_index >= 0) {
        nodes[parent_index].children.push_back(index);
    }
    indexByName[name] = index;
    handles.push_back(std::make_unique<NodeHandle>(*this, index));

    updateNode(index);
    return index;
}

void SceneSkeleton::updateNode(int index) {
    Node& n = nodes[index];
    if (n.parent < 0) {
        n.worldPosition = n.localPosition;
        n.worldRotation = n.localRotation;
        n.worldScale = n.localScale;
        return;
    }
    const Node& p = nodes[n.parent];
    n.worldRotation = (p.worldRotation * n.localRotation).normalized();
    n.worldPosition = p.worldPosition + p.worldRotation * (n.localPosition * p.worldScale);
    n.worldScale = p.worldScale * n.localScale;
}

void SceneSkeleton::updateWorld() {
    // Parents always precede children
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        updateNode(static_cast<int>(i));
    }
}

void SceneSkeleton::updateSubtree(int index) {
    updateNode(index);
    for (int child : nodes[index].children) {
        updateSubtree(child);
    }
}

int SceneSkeleton::indexOf(const std::string& name) const {
    auto it = indexByName.find(name);
    return it == indexByName.end() ? -1 : it->second;
}

std::vector<std::string> SceneSkeleton::boneNames() const {
    std::vector<std::string> names;
    names.reserve(nodes.size());
    for (const auto& n : nodes) {
        names.push_back(n.name);
    }
    return names;
}

BoneHandle* SceneSkeleton::handle(const std::string& name) {
    const int index = indexOf(name);
    return index < 0 ? nullptr : handles[index].get();
}

SkeletonBinding SceneSkeleton::bindCanonical() {
    const BoneNameMap names = resolveBoneNames(boneNames());
    SkeletonBinding binding = emptyBinding();
    for (std::size_t i = 0; i < BONE_COUNT; ++i) {
        if (!names[i].empty()) {
            binding[i] = handle(names[i]);
        }
    }
    return binding;
}

Eigen::Quaterniond SceneSkeleton::NodeHandle::parentWorldRotation() const {
    const int parent = owner.nodes[index].parent;
    if (parent < 0) {
        return Eigen::Quaterniond::Identity();
    }
    return owner.nodes[parent].worldRotation;
}

std::unique_ptr<SceneSkeleton> SceneSkeleton::makeTPoseHumanoid(double unitScale,
                                                                const std::string& prefix,
                                                                double armatureScale) {
    struct BoneSpec {
        const char* name;
        const char* parent;
        double x, y, z;
    };

    // Centre line
    const std::vector<BoneSpec> centre = {
        {"Hips", "", 0, 100, 0},
        {"Spine", "Hips", 0, 10, 0},
        {"Spine1", "Spine", 0, 10, 0},
        {"Spine2", "Spine1", 0, 10, 0},
        {"Neck", "Spine2", 0, 15, 0},
        {"Head", "Neck", 0, 10, 0},
        {"HeadTop_End", "Head", 0, 18, 0},
        {"Nose", "Head", 0, 4, 9},
    };

    // Left side; the right side mirrors x
    const std::vector<BoneSpec> side = {
        {"Eye", "Head", 3.5, 7, 8},
        {"Ear", "Head", 7.5, 4, 0},
        {"Shoulder", "Spine2", 6, 12, 0},
        {"Arm", "Shoulder", 10, 0, 0},
        {"ForeArm", "Arm", 28, 0, 0},
        {"Hand", "ForeArm", 26, 0, 0},
        {"HandThumb1", "Hand", 2.5, -0.5, 3},
        {"HandThumb2", "HandThumb1", 3, 0, 1},
        {"HandThumb3", "HandThumb2", 2.5, 0, 0.5},
        {"HandThumb4", "HandThumb3", 2, 0, 0},
        {"HandIndex1", "Hand", 9, 0, 2.5},
        {"HandIndex2", "HandIndex1", 4, 0, 0},
        {"HandIndex3", "HandIndex2", 2.5, 0, 0},
        {"HandIndex4", "HandIndex3", 2, 0, 0},
        {"HandMiddle1", "Hand", 9.5, 0, 0.5},
        {"HandMiddle2", "HandMiddle1", 4.5, 0, 0},
        {"HandMiddle3", "HandMiddle2", 3, 0, 0},
        {"HandMiddle4", "HandMiddle3", 2, 0, 0},
        {"HandRing1", "Hand", 9, 0, -1.5},
        {"HandRing2", "HandRing1", 4, 0, 0},
        {"HandRing3", "HandRing2", 2.5, 0, 0},
        {"HandRing4", "HandRing3", 2, 0, 0},
        {"HandPinky1", "Hand", 8, 0, -3.5},
        {"HandPinky2", "HandPinky1", 3, 0, 0},
        {"HandPinky3", "HandPinky2", 2, 0, 0},
        {"HandPinky4", "HandPinky3", 1.5, 0, 0},
        {"UpLeg", "Hips", 9, -5, 0},
        {"Leg", "UpLeg", 0, -42, 0},
        {"Foot", "Leg", 0, -43, 0},
        {"ToeBase", "Foot", 0, -8, 12},
        {"Toe_End", "ToeBase", 0, 0, 8},
    };

    auto skeleton = std::make_unique<SceneSkeleton>();
    std::string root;
    if (armatureScale != 1.0) {
        root = "Armature";
        skeleton->addBone(root, "", Eigen::Vector3d::Zero(), Eigen::Quaterniond::Identity(), armatureScale);
    }
    for (const auto& b : centre) {
        const std::string parent = b.parent[0] ? prefix + b.parent : root;
        skeleton->addBone(prefix + b.name, parent, Eigen::Vector3d(b.x, b.y, b.z) * unitScale);
    }
    for (const char* s : {"Left", "Right"}) {
        const double mirror = std::string(s) == "Left" ? 1.0 : -1.0;
        for (const auto& b : side) {
            // Spine2 and Head are centre bones, everything else is sided
            const std::string parent_name = b.parent;
            const bool centre_parent = parent_name == "Spine2" || parent_name == "Head" || parent_name == "Hips";
            const std::string parent = prefix + (centre_parent ? parent_name : std::string(s) + parent_name);
            skeleton->addBone(prefix + s + b.name, parent, Eigen::Vector3d(b.x * mirror, b.y, b.z) * unitScale);
        }
    }
    return skeleton;
}
