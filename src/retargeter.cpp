#include "retargeter.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>

#include "log.hpp"
#include "vector_math.hpp"

namespace {

constexpr double MIN_LEG_LENGTH = 0.01;
constexpr double UNIT_SCALE_TOLERANCE = 1e-6;
constexpr double MIN_SWIVEL_NORMAL_SQ = 0.01;
constexpr double EAR_VISIBILITY_RATIO = 0.7;
constexpr double EAR_MAX_UP_DOT = 0.7;
constexpr double EYE_CONFIDENCE_SCALE = 0.8;
constexpr double SHOULDER_CONFIDENCE = 0.5;
constexpr double MAX_SHOULDER_BLEND = 0.5;

void appendFingerLinks(std::vector<Retargeter::BoneLink>& links, Side side) {
    const BoneId hand = side == Side::Left ? BoneId::LeftHand : BoneId::RightHand;
    for (Finger f : {Finger::Thumb, Finger::Index, Finger::Middle, Finger::Ring, Finger::Pinky}) {
        links.emplace_back(hand, fingerBone(side, f, 1));
        for (int segment = 1; segment < 4; ++segment) {
            links.emplace_back(fingerBone(side, f, segment), fingerBone(side, f, segment + 1));
        }
    }
}

double average(std::initializer_list<double> values) {
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

}  // namespace

std::optional<Eigen::Vector3d> Retargeter::BindInfo::childDirection(BoneId child) const {
    for (const auto& [id, dir] : childDirections) {
        if (id == child) return dir;
    }
    return std::nullopt;
}

const std::vector<Retargeter::BoneLink>& Retargeter::chainLinks() {
    static const std::vector<BoneLink> links = [] {
        std::vector<BoneLink> l;
        l.emplace_back(BoneId::Neck, BoneId::Head);
        l.emplace_back(BoneId::LeftArm, BoneId::LeftForeArm);
        l.emplace_back(BoneId::LeftForeArm, BoneId::LeftHand);
        appendFingerLinks(l, Side::Left);
        l.emplace_back(BoneId::RightArm, BoneId::RightForeArm);
        l.emplace_back(BoneId::RightForeArm, BoneId::RightHand);
        appendFingerLinks(l, Side::Right);
        l.emplace_back(BoneId::LeftUpLeg, BoneId::LeftLeg);
        l.emplace_back(BoneId::LeftLeg, BoneId::LeftFoot);
        l.emplace_back(BoneId::LeftFoot, BoneId::LeftToeBase);
        l.emplace_back(BoneId::LeftToeBase, BoneId::LeftToeEnd);
        l.emplace_back(BoneId::RightUpLeg, BoneId::RightLeg);
        l.emplace_back(BoneId::RightLeg, BoneId::RightFoot);
        l.emplace_back(BoneId::RightFoot, BoneId::RightToeBase);
        l.emplace_back(BoneId::RightToeBase, BoneId::RightToeEnd);
        return l;
    }();
    return links;
}

const std::vector<Retargeter::BoneLink>& Retargeter::standardLinks() {
    static const std::vector<BoneLink> links = [] {
        std::vector<BoneLink> l;
        appendFingerLinks(l, Side::Left);
        appendFingerLinks(l, Side::Right);
        l.emplace_back(BoneId::LeftFoot, BoneId::LeftToeBase);
        l.emplace_back(BoneId::LeftToeBase, BoneId::LeftToeEnd);
        l.emplace_back(BoneId::RightFoot, BoneId::RightToeBase);
        l.emplace_back(BoneId::RightToeBase, BoneId::RightToeEnd);
        return l;
    }();
    return links;
}

Retargeter::Retargeter(const SkeletonBinding& binding, const RetargetConfig& config)
    : binding(binding), config(config), smoothingEngine(config.smoothing) {
    for (std::size_t i = 0; i < BONE_COUNT; ++i) {
        const std::string name = boneName(boneAt(i));
        armChainBone[i] = name.find("Arm") != std::string::npos || name.find("Hand") != std::string::npos;
    }
    computeBindPose();
}

// ---------------------------------------------------------------------------
// Bind pose

const Retargeter::BindInfo* Retargeter::bind(BoneId id) const {
    const BindInfo& info = bindPose[boneIndex(id)];
    return info.valid ? &info : nullptr;
}

void Retargeter::computeBindPose() {
    for (std::size_t i = 0; i < BONE_COUNT; ++i) {
        const BoneHandle* b = binding[i];
        if (!b) continue;
        BindInfo& info = bindPose[i];
        info.valid = true;
        info.position = b->worldPosition();
        info.rotation = vecmath::normalizeOrIdentity(b->worldRotation());
        info.localPosition = b->localPosition();
        info.localRotation = vecmath::normalizeOrIdentity(b->localRotation());
    }

    for (const auto& [parent, child] : chainLinks()) {
        BindInfo& p = bindPose[boneIndex(parent)];
        const BindInfo* c = bind(child);
        if (!p.valid || !c) continue;
        const Eigen::Vector3d dir = c->position - p.position;
        if (dir.squaredNorm() < vecmath::EPSILON * vecmath::EPSILON) continue;
        p.childDirections.emplace_back(child, dir.normalized());
    }

    detectAxes();
    computeHipsBasis();
    computeModelLegLength();
    computeSpineBasis();
    computeHeadBasis();

    if (!hipsBindBasis) {
        LOG_WARN("[Retargeter] Hips/Spine/UpLeg bones missing or degenerate, hips rotation disabled");
    }
    if (!spineBindBasis) {
        LOG_WARN("[Retargeter] Spine/Neck/Arm bones missing or degenerate, spine rotation disabled");
    }
    LOG_INFO("[Retargeter] Bound skeleton: leg length " << modelLegLength
             << ", " << (verticalAxis == Axis::Z ? "Z" : "Y") << "-up, up sign " << upSign);
}

void Retargeter::computeHipsBasis() {
    const BindInfo* hips = bind(BoneId::Hips);
    const BindInfo* spine = bind(BoneId::Spine);
    const BindInfo* left = bind(BoneId::LeftUpLeg);
    const BindInfo* right = bind(BoneId::RightUpLeg);
    if (!hips || !spine || !left || !right) return;

    hipsBindBasis = vecmath::basisFromUpRight(spine->position - hips->position, left->position - right->position);
    // Root translation is written to the hips, so calibrate in hips local units
    rootMotionEstimator.setModelHipSpan((left->position - right->position).norm() * hipsLocalScale);
}

void Retargeter::computeSpineBasis() {
    const BindInfo* spine = bind(BoneId::Spine);
    const BindInfo* neck = bind(BoneId::Neck);
    const BindInfo* left = bind(BoneId::LeftArm);
    const BindInfo* right = bind(BoneId::RightArm);
    if (!spine || !neck || !left || !right || !bind(BoneId::Hips)) return;

    spineBindBasis = vecmath::basisFromUpRight(neck->position - spine->position, left->position - right->position);
}

void Retargeter::computeHeadBasis() {
    const BindInfo* head = bind(BoneId::Head);
    const BindInfo* neck = bind(BoneId::Neck);
    if (!head || !neck) return;

    const Eigen::Vector3d up = head->position - neck->position;
    if (up.squaredNorm() < vecmath::EPSILON) return;

    // Right hint: eyes, then shoulders, then the X axis
    Eigen::Vector3d right = Eigen::Vector3d::UnitX();
    const BindInfo* leftEye = bind(BoneId::LeftEye);
    const BindInfo* rightEye = bind(BoneId::RightEye);
    const BindInfo* leftArm = bind(BoneId::LeftArm);
    const BindInfo* rightArm = bind(BoneId::RightArm);
    if (leftEye && rightEye && (leftEye->position - rightEye->position).squaredNorm() > vecmath::EPSILON) {
        right = leftEye->position - rightEye->position;
    } else if (leftArm && rightArm && (leftArm->position - rightArm->position).squaredNorm() > vecmath::EPSILON) {
        right = leftArm->position - rightArm->position;
    } else if (std::abs(right.dot(up.normalized())) > 0.9) {
        right = Eigen::Vector3d::UnitZ();
    }

    headBindBasis = vecmath::basisFromUpRight(up, right);
}

void Retargeter::detectAxes() {
    const BindInfo* hips = bind(BoneId::Hips);
    if (!hips) return;

    const Eigen::Vector3d& p = hips->localPosition;
    const double absX = std::abs(p.x());
    const double absY = std::abs(p.y());
    const double absZ = std::abs(p.z());
    if (absZ > absY && absZ > absX) {
        verticalAxis = Axis::Z;
        upSign = p.z() == 0 ? -1.0 : (p.z() > 0 ? 1.0 : -1.0);
    } else {
        verticalAxis = Axis::Y;
        upSign = p.y() == 0 ? 1.0 : (p.y() > 0 ? 1.0 : -1.0);
    }

    // A scaled parent shows up as local and world offsets of different length.
    // Assumes that parent sits at the origin, as an armature node does.
    hipsLocalScale = 1.0;
    const double worldLength = hips->position.norm();
    const double localLength = p.norm();
    if (config.autoScaleMetricLegLength && worldLength > vecmath::EPSILON && localLength > vecmath::EPSILON) {
        const double ratio = localLength / worldLength;
        if (std::abs(ratio - 1.0) > UNIT_SCALE_TOLERANCE) hipsLocalScale = ratio;
    }
}

void Retargeter::computeModelLegLength() {
    const BindInfo* hips = bind(BoneId::Hips);
    const BindInfo* leftKnee = bind(BoneId::LeftLeg);
    const BindInfo* rightKnee = bind(BoneId::RightLeg);
    const BindInfo* leftFoot = bind(BoneId::LeftFoot);
    const BindInfo* rightFoot = bind(BoneId::RightFoot);

    if (hips) {
        modelLegLength = std::abs(verticalValue(hips->position));
    }
    if (hips && leftKnee && rightKnee && leftFoot && rightFoot) {
        const double left = (hips->position - leftKnee->position).norm() +
                            (leftKnee->position - leftFoot->position).norm();
        const double right = (hips->position - rightKnee->position).norm() +
                             (rightKnee->position - rightFoot->position).norm();
        const double avg = (left + right) * 0.5;
        if (avg > MIN_LEG_LENGTH) modelLegLength = avg;
    }

    if (modelLegLength < MIN_LEG_LENGTH) {
        LOG_WARN("[Retargeter] Could not measure leg length, using 1.0");
        modelLegLength = 1.0;
        return;
    }
    // Measured in world units, used to place the hips locally
    modelLegLength *= hipsLocalScale;
}

double Retargeter::verticalValue(const Eigen::Vector3d& v) const {
    return verticalAxis == Axis::Z ? v.z() : v.y();
}

double Retargeter::forwardValue(const Eigen::Vector3d& v) const {
    return verticalAxis == Axis::Z ? v.y() : v.z();
}

// ---------------------------------------------------------------------------
// Per frame

void Retargeter::applyPose(const CanonicalPose& pose,
                           const Eigen::MatrixXd& imageLandmarks,
                           int width,
                           int height,
                           std::optional<double> timestamp) {
    state = State::Bound;
    if (pose.empty()) return;

    try {
        touched.reset();

        if (width != rootMotionEstimator.getWidth() || height != rootMotionEstimator.getHeight()) {
            rootMotionEstimator.reset(width, height);
        }

        positionHips(pose, imageLandmarks);
        handleHips(pose);
        handleSpine(pose);

        handleLimb(pose, BoneId::LeftArm, BoneId::LeftForeArm, BoneId::LeftHand,
                   BoneId::LeftHandMiddle1, config.armSwivelWeight);
        handleLimb(pose, BoneId::RightArm, BoneId::RightForeArm, BoneId::RightHand,
                   BoneId::RightHandMiddle1, config.armSwivelWeight);
        handleLimb(pose, BoneId::LeftUpLeg, BoneId::LeftLeg, BoneId::LeftFoot, std::nullopt, config.legSwivelWeight);
        handleLimb(pose, BoneId::RightUpLeg, BoneId::RightLeg, BoneId::RightFoot, std::nullopt, config.legSwivelWeight);

        handleHand(pose, BoneId::LeftHand, BoneId::LeftForeArm, BoneId::LeftHandIndex1, BoneId::LeftHandPinky1);
        handleHand(pose, BoneId::RightHand, BoneId::RightForeArm, BoneId::RightHandIndex1, BoneId::RightHandPinky1);

        handleHead(pose);

        for (const auto& [parent, child] : standardLinks()) {
            alignBone(parent, child, pose);
        }

        if (timestamp && config.enableRotationSmoothing) {
            applySmoothing(*timestamp);
        }
    } catch (const std::exception& e) {
        LOG_WARN("[Retargeter] Error in applyPose: " << e.what());
    }
}

void Retargeter::positionHips(const CanonicalPose& pose, const Eigen::MatrixXd& imageLandmarks) {
    BoneHandle* hipBone = bone(BoneId::Hips);
    const BindInfo* hipsBind = bind(BoneId::Hips);
    const auto& pHips = pose[BoneId::Hips];
    const auto& pLeftFoot = pose[BoneId::LeftFoot];
    const auto& pRightFoot = pose[BoneId::RightFoot];
    if (!hipBone || !hipsBind || !pHips || !pLeftFoot || !pRightFoot) return;

    const auto& pLeftKnee = pose[BoneId::LeftLeg];
    const auto& pRightKnee = pose[BoneId::RightLeg];
    double observedLegLength = 1.0;
    if (pLeftKnee && pRightKnee) {
        const double left = (pHips->position - pLeftKnee->position).norm() +
                            (pLeftKnee->position - pLeftFoot->position).norm();
        const double right = (pHips->position - pRightKnee->position).norm() +
                             (pRightKnee->position - pRightFoot->position).norm();
        observedLegLength = (left + right) * 0.5;
    }
    const double scale = modelLegLength / (observedLegLength > MIN_LEG_LENGTH ? observedLegLength : 1.0);

    // Lowest foot or toe is the floor; pose space is always Y-up
    double floorY = std::min(pLeftFoot->position.y(), pRightFoot->position.y());
    for (BoneId toe : {BoneId::LeftToeBase, BoneId::RightToeBase}) {
        const auto& p = pose[toe];
        if (p) floorY = std::min(floorY, p->position.y());
    }

    const double rawHeight = std::abs(pHips->position.y() - floorY) * scale;
    double targetHeight = std::max(rawHeight, modelLegLength * config.minHipHeightRatio) * upSign;
    if (upSign < 0 && targetHeight > 0) targetHeight = 0;
    if (upSign > 0 && targetHeight < 0) targetHeight = 0;

    double targetSide = hipsBind->localPosition.x();
    double targetForward = forwardValue(hipsBind->localPosition);
    if (config.enableRootMotion && imageLandmarks.rows() > 0) {
        const auto translation = rootMotionEstimator.computeTranslation(imageLandmarks);
        if (translation) {
            targetSide += translation->x();
            targetForward += translation->z();
        }
    }

    const double alpha = config.hipsDamping;
    Eigen::Vector3d pos = hipBone->localPosition();
    pos.x() = vecmath::lerp(pos.x(), targetSide, alpha);
    if (verticalAxis == Axis::Y) {
        pos.y() = vecmath::lerp(pos.y(), targetHeight, alpha);
        pos.z() = vecmath::lerp(pos.z(), targetForward, alpha);
    } else {
        pos.z() = vecmath::lerp(pos.z(), targetHeight, alpha);
        pos.y() = vecmath::lerp(pos.y(), targetForward, alpha);
    }
    hipBone->setLocalPosition(pos);
    hipBone->propagateToChildren();
}

void Retargeter::handleHips(const CanonicalPose& pose) {
    const BindInfo* hipsBind = bind(BoneId::Hips);
    const auto& pHips = pose[BoneId::Hips];
    const auto& pSpine = pose[BoneId::Spine];
    const auto& pLeft = pose[BoneId::LeftUpLeg];
    const auto& pRight = pose[BoneId::RightUpLeg];
    if (!bone(BoneId::Hips) || !hipsBind || !hipsBindBasis || !pHips || !pSpine || !pLeft || !pRight) return;

    const double avgVisibility = average({pHips->visibility, pLeft->visibility, pRight->visibility});
    if (avgVisibility < config.visibilityThreshold * 0.5) {
        LOG_VERBOSE("[Retargeter] Hips skipped, visibility " << avgVisibility);
        return;
    }

    const Eigen::Vector3d up = pSpine->position - pHips->position;
    Eigen::Vector3d right = vecmath::normalizeOrKeep(pLeft->position - pRight->position);

    // Weak hips: lean on the shoulder line for the right vector
    const auto& pLeftArm = pose[BoneId::LeftArm];
    const auto& pRightArm = pose[BoneId::RightArm];
    if (pLeftArm && pRightArm && avgVisibility < config.visibilityThreshold) {
        const double shoulderVisibility = (pLeftArm->visibility + pRightArm->visibility) * 0.5;
        if (shoulderVisibility > avgVisibility) {
            const double blend = std::clamp((shoulderVisibility - avgVisibility) / (1.0 - avgVisibility),
                                            0.0, MAX_SHOULDER_BLEND);
            const Eigen::Vector3d shoulderRight = vecmath::normalizeOrKeep(pLeftArm->position - pRightArm->position);
            right = right * (1.0 - blend) + shoulderRight * blend;
        }
    }

    const auto target = vecmath::basisFromUpRight(up, right);
    if (!target) return;

    const Eigen::Quaterniond delta = vecmath::multiply(*target, vecmath::inverse(*hipsBindBasis));
    const Eigen::Quaterniond targetWorld = vecmath::multiply(delta, hipsBind->rotation);
    const double weight = config.torsoBaseWeight + config.torsoVisibilityWeight * std::clamp(avgVisibility, 0.0, 1.0);
    applyWorldRotation(BoneId::Hips, targetWorld, weight);
}

void Retargeter::handleSpine(const CanonicalPose& pose) {
    const BindInfo* spineBind = bind(BoneId::Spine);
    const auto& pNeck = pose[BoneId::Neck];
    const auto& pLeftArm = pose[BoneId::LeftArm];
    const auto& pRightArm = pose[BoneId::RightArm];
    const auto& pSpine = pose[BoneId::Spine];
    if (!bone(BoneId::Spine) || !spineBind || !spineBindBasis || !pNeck || !pLeftArm || !pRightArm || !pSpine) return;

    const double avgVisibility = average({pNeck->visibility, pLeftArm->visibility, pRightArm->visibility});
    if (avgVisibility < config.visibilityThreshold * 0.5) return;

    const auto target = vecmath::basisFromUpRight(pNeck->position - pSpine->position,
                                                  pLeftArm->position - pRightArm->position);
    if (!target) return;

    const Eigen::Quaterniond delta = vecmath::multiply(*target, vecmath::inverse(*spineBindBasis));
    const Eigen::Quaterniond targetWorld = vecmath::multiply(delta, spineBind->rotation);
    const double weight = config.torsoBaseWeight + config.torsoVisibilityWeight * std::clamp(avgVisibility, 0.0, 1.0);
    applyWorldRotation(BoneId::Spine, targetWorld, weight);

    // The upper spine relaxes toward its bind pose so the bend spreads out
    for (BoneId id : {BoneId::Spine1, BoneId::Spine2}) {
        const BindInfo* b = bind(id);
        if (b) slerpLocalRotation(id, b->localRotation, config.spineRelaxWeight);
    }
}

void Retargeter::handleLimb(const CanonicalPose& pose, BoneId start, BoneId mid, BoneId end,
                            std::optional<BoneId> fingerTip, double swivelWeight) {
    alignBone(start, mid, pose);
    const bool swivelled = handleSwivel(pose, start, mid, end, swivelWeight);
    // After the swivel, which carries the lower bone along
    alignBone(mid, end, pose);
    if (!swivelled || !fingerTip) return;

    const auto& pMid = pose[mid];
    const auto& pEnd = pose[end];
    const auto& pFinger = pose[*fingerTip];
    const BindInfo* bMid = bind(mid);
    const BindInfo* bEnd = bind(end);
    const BindInfo* bFinger = bind(*fingerTip);
    if (pFinger && bFinger && pFinger->visibility >= config.visibilityThreshold) {
        handleForearmTwist(mid, *pMid, *pEnd, *pFinger, *bMid, *bEnd, *bFinger);
    }
}

bool Retargeter::handleSwivel(const CanonicalPose& pose, BoneId start, BoneId mid, BoneId end, double weight) {
    const auto& pStart = pose[start];
    const auto& pMid = pose[mid];
    const auto& pEnd = pose[end];
    const BindInfo* bStart = bind(start);
    const BindInfo* bMid = bind(mid);
    const BindInfo* bEnd = bind(end);
    if (!pStart || !pMid || !pEnd || !bStart || !bMid || !bEnd) return false;

    // Match the plane through start, mid and end
    const Eigen::Vector3d pVec1 = vecmath::normalizeOrKeep(pMid->position - pStart->position);
    const Eigen::Vector3d pVec2 = vecmath::normalizeOrKeep(pEnd->position - pMid->position);
    Eigen::Vector3d pNormal = pVec1.cross(pVec2);
    if (pNormal.squaredNorm() < MIN_SWIVEL_NORMAL_SQ) return false;
    pNormal.normalize();

    const Eigen::Vector3d bVec1 = vecmath::normalizeOrKeep(bMid->position - bStart->position);
    const Eigen::Vector3d bVec2 = vecmath::normalizeOrKeep(bEnd->position - bMid->position);
    Eigen::Vector3d bNormal = bVec1.cross(bVec2);
    if (bNormal.squaredNorm() < MIN_SWIVEL_NORMAL_SQ) return false;
    bNormal.normalize();

    const Eigen::Vector3d pOrtho = pVec1.cross(pNormal).normalized();
    const Eigen::Vector3d bOrtho = bVec1.cross(bNormal).normalized();
    const Eigen::Quaterniond pBasis = vecmath::fromOrthonormalBasis(pOrtho, pVec1, pNormal);
    const Eigen::Quaterniond bBasis = vecmath::fromOrthonormalBasis(bOrtho, bVec1, bNormal);

    const Eigen::Quaterniond delta = vecmath::multiply(pBasis, vecmath::inverse(bBasis));
    applyWorldRotation(start, vecmath::multiply(delta, bStart->rotation), weight);
    return true;
}

void Retargeter::handleForearmTwist(BoneId mid, const PosePoint& pMid, const PosePoint& pEnd, const PosePoint& pFinger,
                                    const BindInfo& bMid, const BindInfo& bEnd, const BindInfo& bFinger) {
    const Eigen::Vector3d pForearm = vecmath::normalizeOrKeep(pEnd.position - pMid.position);
    const Eigen::Vector3d pFingerDir = vecmath::normalizeOrKeep(pFinger.position - pEnd.position);
    Eigen::Vector3d pTwistNormal = pForearm.cross(pFingerDir);
    if (pTwistNormal.squaredNorm() < vecmath::EPSILON) return;
    pTwistNormal.normalize();

    const Eigen::Vector3d bForearm = vecmath::normalizeOrKeep(bEnd.position - bMid.position);
    const Eigen::Vector3d bFingerDir = vecmath::normalizeOrKeep(bFinger.position - bEnd.position);
    Eigen::Vector3d bTwistNormal = bForearm.cross(bFingerDir);
    if (bTwistNormal.squaredNorm() < vecmath::EPSILON) return;
    bTwistNormal.normalize();

    const Eigen::Vector3d pOrtho = pTwistNormal.cross(pForearm).normalized();
    const Eigen::Vector3d bOrtho = bTwistNormal.cross(bForearm).normalized();
    const Eigen::Quaterniond pBasis = vecmath::fromOrthonormalBasis(pTwistNormal, pForearm, pOrtho);
    const Eigen::Quaterniond bBasis = vecmath::fromOrthonormalBasis(bTwistNormal, bForearm, bOrtho);

    const Eigen::Quaterniond delta = vecmath::multiply(pBasis, vecmath::inverse(bBasis));
    applyWorldRotation(mid, vecmath::multiply(delta, bMid.rotation), config.forearmTwistWeight);
}

void Retargeter::handleHand(const CanonicalPose& pose, BoneId hand, BoneId forearm, BoneId index, BoneId pinky) {
    const auto& pHand = pose[hand];
    const auto& pForeArm = pose[forearm];
    const auto& pIndex = pose[index];
    const auto& pPinky = pose[pinky];
    const BindInfo* bHand = bind(hand);
    const BindInfo* bForeArm = bind(forearm);
    const BindInfo* bIndex = bind(index);
    const BindInfo* bPinky = bind(pinky);
    if (!bone(hand) || !pHand || !pForeArm || !pIndex || !pPinky ||
        !bHand || !bForeArm || !bIndex || !bPinky) {
        return;
    }
    if (pHand->visibility < config.visibilityThreshold) return;

    // Y toward the fingers, Z the palm normal, X = Y x Z
    auto palmBasis = [](const Eigen::Vector3d& wrist, const Eigen::Vector3d& elbow,
                        const Eigen::Vector3d& indexPos, const Eigen::Vector3d& pinkyPos)
        -> std::optional<Eigen::Quaterniond> {
        const Eigen::Vector3d fingerDir = vecmath::normalizeOrKeep(indexPos - wrist);
        const Eigen::Vector3d pinkyDir = vecmath::normalizeOrKeep(pinkyPos - wrist);
        const Eigen::Vector3d y = vecmath::normalizeOrKeep((fingerDir + pinkyDir) * 0.5);

        Eigen::Vector3d z = vecmath::normalizeOrKeep(fingerDir.cross(pinkyDir));
        if (z.squaredNorm() < vecmath::EPSILON) {
            const Eigen::Vector3d forearmDir = vecmath::normalizeOrKeep(wrist - elbow);
            z = vecmath::normalizeOrKeep(y.cross(forearmDir));
        }
        if (z.squaredNorm() < vecmath::EPSILON || y.squaredNorm() < vecmath::EPSILON) return std::nullopt;

        const Eigen::Vector3d x = vecmath::normalizeOrKeep(y.cross(z));
        return vecmath::fromOrthonormalBasis(x, y, z);
    };

    const auto target = palmBasis(pHand->position, pForeArm->position, pIndex->position, pPinky->position);
    const auto bindBasis = palmBasis(bHand->position, bForeArm->position, bIndex->position, bPinky->position);
    if (!target || !bindBasis) return;

    const Eigen::Quaterniond delta = vecmath::multiply(*target, vecmath::inverse(*bindBasis));
    applyWorldRotation(hand, vecmath::multiply(delta, bHand->rotation), config.handWeight);
}

void Retargeter::handleHead(const CanonicalPose& pose) {
    const auto& pHead = pose[BoneId::Head];
    const auto& pNeck = pose[BoneId::Neck];
    const BindInfo* headBind = bind(BoneId::Head);
    const BindInfo* neckBind = bind(BoneId::Neck);
    if (!bone(BoneId::Head) || !pHead || !pNeck || !headBind || !neckBind) return;
    if (!headBindBasis) {
        alignBone(BoneId::Neck, BoneId::Head, pose);
        return;
    }

    const auto& pLeftEar = pose[BoneId::LeftEar];
    const auto& pRightEar = pose[BoneId::RightEar];
    const auto& pLeftEye = pose[BoneId::LeftEye];
    const auto& pRightEye = pose[BoneId::RightEye];
    const auto& pLeftArm = pose[BoneId::LeftArm];
    const auto& pRightArm = pose[BoneId::RightArm];

    double avgVisibility = pHead->visibility;
    if (pLeftEar && pRightEar) {
        avgVisibility = (avgVisibility + (pLeftEar->visibility + pRightEar->visibility) * 0.5) * 0.5;
    }
    if (avgVisibility < config.visibilityThreshold * 0.5) {
        alignBone(BoneId::Neck, BoneId::Head, pose);
        return;
    }

    const Eigen::Vector3d headUp = pHead->position - pNeck->position;
    if (headUp.squaredNorm() < vecmath::EPSILON) {
        alignBone(BoneId::Neck, BoneId::Head, pose);
        return;
    }
    const Eigen::Vector3d up = headUp.normalized();

    // Right vector: ears, then eyes, then shoulders
    std::optional<Eigen::Vector3d> headRight;
    double confidence = 0.0;
    const double thr = config.visibilityThreshold;

    if (pLeftEar && pRightEar &&
        pLeftEar->visibility > thr * EAR_VISIBILITY_RATIO && pRightEar->visibility > thr * EAR_VISIBILITY_RATIO) {
        const Eigen::Vector3d ears = pLeftEar->position - pRightEar->position;
        // Ears lined up with the neck axis are a tracking error
        if (ears.squaredNorm() > vecmath::EPSILON && std::abs(ears.normalized().dot(up)) < EAR_MAX_UP_DOT) {
            headRight = ears;
            confidence = (pLeftEar->visibility + pRightEar->visibility) * 0.5;
        }
    }
    if (!headRight && pLeftEye && pRightEye && pLeftEye->visibility > thr && pRightEye->visibility > thr) {
        headRight = pLeftEye->position - pRightEye->position;
        confidence = (pLeftEye->visibility + pRightEye->visibility) * 0.5 * EYE_CONFIDENCE_SCALE;
    }
    if (!headRight && pLeftArm && pRightArm && pLeftArm->visibility > thr && pRightArm->visibility > thr) {
        headRight = pLeftArm->position - pRightArm->position;
        confidence = SHOULDER_CONFIDENCE;
    }

    const auto target = headRight ? vecmath::basisFromUpRight(up, *headRight) : std::nullopt;
    if (!target) {
        alignBone(BoneId::Neck, BoneId::Head, pose);
        return;
    }

    // A face turned away from the bind forward is most likely a flip
    const Eigen::Vector3d forward = *target * Eigen::Vector3d::UnitZ();
    const Eigen::Vector3d bindForward = *headBindBasis * Eigen::Vector3d::UnitZ();
    if (forward.dot(bindForward) < config.headFlipDot) {
        LOG_VERBOSE("[Retargeter] Head flip suspected, lowering confidence");
        confidence *= config.headFlipPenalty;
    }

    const Eigen::Quaterniond delta = vecmath::multiply(*target, vecmath::inverse(*headBindBasis));
    const double weight = config.headBaseWeight + config.headConfidenceWeight * std::clamp(confidence, 0.0, 1.0);
    applyWorldRotation(BoneId::Head, vecmath::multiply(delta, headBind->rotation), weight);

    if (bone(BoneId::Neck)) {
        applyWorldRotation(BoneId::Neck, vecmath::multiply(delta, neckBind->rotation), weight * config.neckShare);
    }
}

void Retargeter::alignBone(BoneId parent, BoneId child, const CanonicalPose& pose) {
    const auto& pParent = pose[parent];
    const auto& pChild = pose[child];
    const BindInfo* b = bind(parent);
    if (!bone(parent) || !pParent || !pChild || !b) return;
    if (pParent->visibility < config.visibilityThreshold) return;

    const auto bindDir = b->childDirection(child);
    if (!bindDir) return;

    const Eigen::Vector3d targetDir = pChild->position - pParent->position;
    if (targetDir.squaredNorm() == 0.0) return;

    const Eigen::Quaterniond delta = vecmath::fromUnitVectors(*bindDir, targetDir.normalized());
    const double weight = armChainBone[boneIndex(parent)] ? config.armAlignWeight : config.alignWeight;
    applyWorldRotation(parent, vecmath::multiply(delta, b->rotation), weight);
}

void Retargeter::applyWorldRotation(BoneId id, const Eigen::Quaterniond& targetWorld, double t) {
    BoneHandle* b = bone(id);
    if (!b) return;
    const Eigen::Quaterniond local =
        vecmath::normalizeOrIdentity(vecmath::inverse(b->parentWorldRotation()) * targetWorld);
    slerpLocalRotation(id, local, t);
}

void Retargeter::slerpLocalRotation(BoneId id, const Eigen::Quaterniond& targetLocal, double t) {
    BoneHandle* b = bone(id);
    if (!b) return;
    b->setLocalRotation(vecmath::slerp(b->localRotation(), targetLocal, t));
    b->propagateToChildren();
    touched.set(boneIndex(id));
}

void Retargeter::applySmoothing(double t) {
    for (std::size_t i = 0; i < BONE_COUNT; ++i) {
        if (!touched.test(i)) continue;
        BoneHandle* b = binding[i];
        b->setLocalRotation(smoothingEngine.smoothRotation(boneAt(i), t, b->localRotation()));
        b->propagateToChildren();
    }
}

void Retargeter::smoothPose(CanonicalPose& pose, double t) {
    smoothingEngine.smoothPose(pose, t);
}

void Retargeter::resetSmoothing() {
    smoothingEngine.reset();
}

void Retargeter::resetRootMotion() {
    rootMotionEstimator.reset(rootMotionEstimator.getWidth(), rootMotionEstimator.getHeight());
}
