#pragma once

// C++ Standard Library
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Third-party libraries
#include <Eigen/Core>
#include <Eigen/Geometry>

// built by me
#include "bone_handle.hpp"

// Small in-memory bone hierarchy. Nodes are stored parents first, so a single
// forward pass updates every world transform.
class SceneSkeleton {
public:
    struct Node {
        std::string name;
        int parent = -1;
        std::vector<int> children;
        Eigen::Vector3d localPosition = Eigen::Vector3d::Zero();
        Eigen::Quaterniond localRotation = Eigen::Quaterniond::Identity();
        double localScale = 1.0;  // uniform, applies to the children's offsets
        Eigen::Vector3d worldPosition = Eigen::Vector3d::Zero();
        Eigen::Quaterniond worldRotation = Eigen::Quaterniond::Identity();
        double worldScale = 1.0;
    };

    SceneSkeleton() = default;
    SceneSkeleton(const SceneSkeleton&) = delete;
    SceneSkeleton& operator=(const SceneSkeleton&) = delete;

    // Throws std::invalid_argument for a duplicate name or unknown parent.
    // An empty parent name adds a root.
    int addBone(const std::string& name,
                const std::string& parent,
                const Eigen::Vector3d& localPosition,
                const Eigen::Quaterniond& localRotation = Eigen::Quaterniond::Identity(),
                double localScale = 1.0);

    void updateWorld();
    void updateSubtree(int index);

    int indexOf(const std::string& name) const;
    const Node& node(int index) const { return nodes.at(index); }
    std::size_t size() const { return nodes.size(); }
    std::vector<std::string> boneNames() const;

    // nullptr for an unknown name
    BoneHandle* handle(const std::string& name);

    // Canonical binding through resolveBoneNames().
    SkeletonBinding bindCanonical();

    // Mixamo style T-pose: faces +Z, left side on +X, Y up, centimetres at
    // unitScale 1. Every canonical bone exists, named prefix + canonical name.
    // An armatureScale other than 1 parents the Hips to an "Armature" root with
    // that scale, the way FBX imports wrap a centimetre rig for a metre scene.
    static std::unique_ptr<SceneSkeleton> makeTPoseHumanoid(double unitScale = 1.0,
                                                            const std::string& prefix = "mixamorig:",
                                                            double armatureScale = 1.0);

private:
    class NodeHandle : public BoneHandle {
    public:
        NodeHandle(SceneSkeleton& owner, int index) : owner(owner), index(index) {}

        Eigen::Vector3d worldPosition() const override { return owner.nodes[index].worldPosition; }
        Eigen::Quaterniond worldRotation() const override { return owner.nodes[index].worldRotation; }
        Eigen::Vector3d localPosition() const override { return owner.nodes[index].localPosition; }
        Eigen::Quaterniond localRotation() const override { return owner.nodes[index].localRotation; }
        void setLocalPosition(const Eigen::Vector3d& position) override { owner.nodes[index].localPosition = position; }
        void setLocalRotation(const Eigen::Quaterniond& rotation) override {
            owner.nodes[index].localRotation = rotation.normalized();
        }
        Eigen::Quaterniond parentWorldRotation() const override;
        void propagateToChildren() override { owner.updateSubtree(index); }

    private:
        SceneSkeleton& owner;
        int index;
    };

    void updateNode(int index);

    std::vector<Node> nodes;
    std::vector<std::unique_ptr<NodeHandle>> handles;
    std::unordered_map<std::string, int> indexByName;
};
