#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "bone_name_resolver.hpp"

namespace
{

const std::string& resolvedName(const BoneNameMap& map, BoneId id)
{
  return map[boneIndex(id)];
}

}  // namespace

TEST(BoneNameResolver, NormalizeStripsPrefixAndSeparators)
{
  EXPECT_EQ(normalizeBoneName("mixamorig:Left_Hand-Index 1"), "lefthandindex1");
  EXPECT_EQ(normalizeBoneName("MixamoRig_Hips"), "hips");
  EXPECT_EQ(normalizeBoneName("Spine2"), "spine2");
}

TEST(BoneNameResolver, KeywordsFoundInName)
{
  const auto keywords = boneKeywords("lefthandindex2");
  const std::vector<std::string> expected = {"hand", "index", "left"};
  EXPECT_EQ(keywords, expected);
  EXPECT_TRUE(boneKeywords("root").empty());
}

TEST(BoneNameResolver, PrefixedMixamoNames)
{
  const std::vector<std::string> rig = {
    "mixamorig:Hips", "mixamorig:Spine", "mixamorig:LeftArm", "mixamorig:HeadTop_End", "mixamorig:RightToe_End"};
  const BoneNameMap map = resolveBoneNames(rig);

  EXPECT_EQ(resolvedName(map, BoneId::Hips), "mixamorig:Hips");
  EXPECT_EQ(resolvedName(map, BoneId::Spine), "mixamorig:Spine");
  EXPECT_EQ(resolvedName(map, BoneId::LeftArm), "mixamorig:LeftArm");
  EXPECT_EQ(resolvedName(map, BoneId::HeadTopEnd), "mixamorig:HeadTop_End");
  EXPECT_EQ(resolvedName(map, BoneId::RightToeEnd), "mixamorig:RightToe_End");
  EXPECT_TRUE(resolvedName(map, BoneId::Spine1).empty());
}

TEST(BoneNameResolver, OtherPrefixStylesAndCase)
{
  const std::vector<std::string> rig = {"mixamorig_Hips", "mixamorigSpine", "NECK", "lefthand"};
  const BoneNameMap map = resolveBoneNames(rig);

  EXPECT_EQ(resolvedName(map, BoneId::Hips), "mixamorig_Hips");
  EXPECT_EQ(resolvedName(map, BoneId::Spine), "mixamorigSpine");
  EXPECT_EQ(resolvedName(map, BoneId::Neck), "NECK");
  EXPECT_EQ(resolvedName(map, BoneId::LeftHand), "lefthand");
}

TEST(BoneNameResolver, FuzzyMatchRespectsDigitSuffix)
{
  const std::vector<std::string> rig = {
    "Character1_Hips", "Character1_Spine", "Character1_LeftHandIndex2", "Character1_LeftHand"};
  const BoneNameMap map = resolveBoneNames(rig);

  EXPECT_EQ(resolvedName(map, BoneId::Hips), "Character1_Hips");
  EXPECT_EQ(resolvedName(map, BoneId::Spine), "Character1_Spine");
  EXPECT_EQ(resolvedName(map, BoneId::LeftHand), "Character1_LeftHand");
  EXPECT_EQ(resolvedName(map, BoneId::LeftHandIndex2), "Character1_LeftHandIndex2");
  EXPECT_TRUE(resolvedName(map, BoneId::LeftHandIndex1).empty());
  EXPECT_TRUE(resolvedName(map, BoneId::Spine1).empty());
}

TEST(BoneNameResolver, EachRigBoneUsedOnce)
{
  const std::vector<std::string> rig = {"Bip_Spine"};
  const BoneNameMap map = resolveBoneNames(rig);

  int uses = 0;
  for (const auto& name : map) {
    if (name == "Bip_Spine") ++uses;
  }
  EXPECT_EQ(uses, 1);
  EXPECT_EQ(resolvedName(map, BoneId::Spine), "Bip_Spine");
}

TEST(BoneNameResolver, EmptyRigResolvesNothing)
{
  const BoneNameMap map = resolveBoneNames({});
  for (const auto& name : map) {
    EXPECT_TRUE(name.empty());
  }
}
