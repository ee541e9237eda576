// tests/unit/check/test_constant_classification.cpp - Unit tests for convention selection
//
// Covers is_heuristically_constant() on plain fact snapshots and
// convention_for() on declarations built in a DeclContext.
//

#include <gtest/gtest.h>

#include <optional>

#include "namecheck/check/naming_rules.hpp"
#include "namecheck/test_support/decl_builders.hpp"

using namespace namecheck;
using namespace namecheck::test_support;

namespace
{

ConstantFacts facts(
  DeclKind kind, std::optional<DeclKind> enclosing, ModifierSet mods = {},
  bool has_constant = false)
{
  ConstantFacts f;
  f.kind = kind;
  f.enclosingKind = enclosing;
  f.modifiers = mods;
  f.hasConstantValue = has_constant;
  return f;
}

}  // namespace

// ============================================================================
// is_heuristically_constant
// ============================================================================

TEST(ConstantClassificationTest, InterfaceMembersAreConstants)
{
  EXPECT_TRUE(is_heuristically_constant(facts(DeclKind::Field, DeclKind::Interface)));
  EXPECT_TRUE(is_heuristically_constant(
    facts(DeclKind::Field, DeclKind::Interface, {Modifier::Private})));
}

TEST(ConstantClassificationTest, PublicStaticFinalFieldIsConstant)
{
  EXPECT_TRUE(is_heuristically_constant(facts(DeclKind::Field, DeclKind::Class, k_public_static_final)));

  ModifierSet with_extra = k_public_static_final;
  with_extra.insert(Modifier::Transient);
  EXPECT_TRUE(is_heuristically_constant(facts(DeclKind::Field, DeclKind::Class, with_extra)));
}

TEST(ConstantClassificationTest, PartialModifierSetsAreNotEnough)
{
  EXPECT_FALSE(is_heuristically_constant(
    facts(DeclKind::Field, DeclKind::Class, {Modifier::Static, Modifier::Final})));
  EXPECT_FALSE(is_heuristically_constant(
    facts(DeclKind::Field, DeclKind::Class, {Modifier::Public, Modifier::Final})));
  EXPECT_FALSE(is_heuristically_constant(
    facts(DeclKind::Field, DeclKind::Class, {Modifier::Private, Modifier::Static, Modifier::Final})));
}

TEST(ConstantClassificationTest, ModifierRuleOnlyAppliesToFields)
{
  EXPECT_FALSE(is_heuristically_constant(
    facts(DeclKind::LocalVariable, DeclKind::Method, k_public_static_final)));
  EXPECT_FALSE(is_heuristically_constant(
    facts(DeclKind::Parameter, DeclKind::Method, k_public_static_final)));
}

TEST(ConstantClassificationTest, KnownConstantValueMakesAConstant)
{
  EXPECT_TRUE(is_heuristically_constant(facts(DeclKind::LocalVariable, DeclKind::Method, {}, true)));
  EXPECT_TRUE(is_heuristically_constant(facts(DeclKind::Field, DeclKind::Class, {}, true)));
}

TEST(ConstantClassificationTest, PlainVariablesAreNotConstants)
{
  EXPECT_FALSE(is_heuristically_constant(facts(DeclKind::Field, DeclKind::Class)));
  EXPECT_FALSE(is_heuristically_constant(facts(DeclKind::Field, std::nullopt)));
  EXPECT_FALSE(is_heuristically_constant(facts(DeclKind::Parameter, DeclKind::Method)));
}

TEST(ConstantClassificationTest, AnnotationTypeIsNotTreatedAsInterface)
{
  EXPECT_FALSE(is_heuristically_constant(facts(DeclKind::Field, DeclKind::AnnotationType)));
}

TEST(ConstantClassificationTest, FactsAreSnapshottedFromDecl)
{
  DeclContext ctx;
  Decl * root = build(ctx, iface("Limits", {field("max", k_public_static_final, true)}));
  const Decl & member = *root->children[0];

  const ConstantFacts f = ConstantFacts::of(member);
  EXPECT_EQ(f.kind, DeclKind::Field);
  ASSERT_TRUE(f.enclosingKind.has_value());
  EXPECT_EQ(*f.enclosingKind, DeclKind::Interface);
  EXPECT_EQ(f.modifiers, k_public_static_final);
  EXPECT_TRUE(f.hasConstantValue);
}

// ============================================================================
// convention_for
// ============================================================================

TEST(ConventionForTest, TypesUseUpperCamelCase)
{
  DeclContext ctx;
  for (const DeclKind kind :
       {DeclKind::Class, DeclKind::Interface, DeclKind::Enum, DeclKind::AnnotationType,
        DeclKind::Record}) {
    Decl * d = ctx.create(kind, "Thing");
    EXPECT_EQ(convention_for(*d), ConventionKind::UpperCamelCase) << to_string(kind);
  }
}

TEST(ConventionForTest, OnlyOrdinaryMethodsAreChecked)
{
  DeclContext ctx;
  EXPECT_EQ(convention_for(*ctx.create(DeclKind::Method, "run")), ConventionKind::LowerCamelCase);
  EXPECT_EQ(convention_for(*ctx.create(DeclKind::Constructor, "Parser")), std::nullopt);
  EXPECT_EQ(convention_for(*ctx.create(DeclKind::StaticInit, "")), std::nullopt);
  EXPECT_EQ(convention_for(*ctx.create(DeclKind::InstanceInit, "")), std::nullopt);
}

TEST(ConventionForTest, EnumConstantsAlwaysUseAllCaps)
{
  DeclContext ctx;
  Decl * root = build(ctx, enm("Color", {enum_constant("red")}));
  EXPECT_EQ(convention_for(*root->children[0]), ConventionKind::AllCapsUnderscore);
}

TEST(ConventionForTest, VariablesDependOnClassification)
{
  DeclContext ctx;
  Decl * root = build(
    ctx, cls(
           "Parser", {field("count"), field("MAX_SIZE", k_public_static_final),
                      method("parse", {param("input"), local("LIMIT", true)})}));

  EXPECT_EQ(convention_for(*root->children[0]), ConventionKind::LowerCamelCase);
  EXPECT_EQ(convention_for(*root->children[1]), ConventionKind::AllCapsUnderscore);

  const Decl & parse = *root->children[2];
  EXPECT_EQ(convention_for(*parse.children[0]), ConventionKind::LowerCamelCase);
  EXPECT_EQ(convention_for(*parse.children[1]), ConventionKind::AllCapsUnderscore);
}

TEST(ConventionForTest, TypeParametersAndPackagesAreNotChecked)
{
  DeclContext ctx;
  EXPECT_EQ(convention_for(*ctx.create(DeclKind::TypeParameter, "T")), std::nullopt);
  EXPECT_EQ(convention_for(*ctx.create(DeclKind::Package, "com.example")), std::nullopt);
}

// ============================================================================
// shares_enclosing_type_name
// ============================================================================

TEST(ConstructorLookalikeTest, MethodNamedLikeItsType)
{
  DeclContext ctx;
  Decl * root = build(ctx, cls("Parser", {method("Parser"), method("parse"), ctor("Parser")}));

  EXPECT_TRUE(shares_enclosing_type_name(*root->children[0]));
  EXPECT_FALSE(shares_enclosing_type_name(*root->children[1]));
  EXPECT_FALSE(shares_enclosing_type_name(*root->children[2]));
}

TEST(ConstructorLookalikeTest, TopLevelMethodHasNoType)
{
  DeclContext ctx;
  Decl * m = ctx.create(DeclKind::Method, "run");
  EXPECT_FALSE(shares_enclosing_type_name(*m));
}
