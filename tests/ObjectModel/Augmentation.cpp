// Augmentation.cpp - static storage, constants, deletion and raw classes

#include <catch2/catch_test_macros.hpp>

#include <NGIN/ObjectModel/ObjectModel.hpp>

#include <string>

TEST_CASE("StaticMemberIsSharedByClassAndInstances", "[objectmodel][Augmentation]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Augment.Registry"}
                 .Encapsulate()
                 .Declare(Static("count").Types<int>().Default(Any{0}))
                 .Declare(Method("bump", 0, [](Self &self, std::span<const Any>) -> Expected<Any> {
                              auto n = self.GetAs<int>("count");
                              if (!n)
                                return std::unexpected(n.error());
                              if (auto r = self.Set("count", Any{*n + 1}); !r)
                                return std::unexpected(r.error());
                              return Any{*n + 1};
                            })
                              .AsStatic())
                 .Define();
  REQUIRE(cls.has_value());

  auto a = cls->New();
  auto b = cls->New();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());

  REQUIRE(a->Set("count", Any{3}).has_value());
  CHECK(b->GetAs<int>("count").value() == 3);
  CHECK(cls->GetAs<int>("count").value() == 3);

  // Static methods run without an instance.
  CHECK(cls->Invoke("bump").has_value());
  CHECK(b->InvokeAs<int>("bump").value() == 5);
  CHECK(a->GetAs<int>("count").value() == 5);

  auto bad = cls->Set("count", Any{std::string{"many"}});
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().code == ErrorCode::InvalidValue);
  CHECK(cls->GetAs<int>("count").value() == 5);
}

TEST_CASE("SelfInStaticMethodHasNoInstance", "[objectmodel][Augmentation]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Augment.Factory"}
                 .Encapsulate()
                 .Declare(Static("made").WithVisibility(Visibility::Private).Default(Any{0}))
                 .Declare(Method("has_instance", 0, [](Self &self, std::span<const Any>) -> Expected<Any> {
                              return Any{self.This().IsValid()};
                            })
                              .AsStatic())
                 .Declare(Method("class_name", 0, [](Self &self, std::span<const Any>) -> Expected<Any> {
                              return Any{std::string{self.GetClass().Name()}};
                            })
                              .AsStatic())
                 .Define();
  REQUIRE(cls.has_value());

  CHECK_FALSE(cls->Invoke("has_instance").value().Cast<bool>());
  CHECK(cls->Invoke("class_name").value().Cast<std::string>() == "Augment.Factory");

  auto hidden = cls->Get("made");
  REQUIRE_FALSE(hidden.has_value());
  CHECK(hidden.error().rule == AccessRule::Private);
  CHECK(cls->GetAs<int>("made", cls->Context()).value() == 0);
}

TEST_CASE("DeferredConstantCommitsOncePerOwner", "[objectmodel][Augmentation]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Augment.Shade"}.Encapsulate().Declare(Constant("shade")).Define();
  REQUIRE(cls.has_value());

  auto early = cls->New();
  REQUIRE(early.has_value());
  REQUIRE(early->Set("shade", Any{std::string{"dark"}}).has_value());
  auto again = early->Set("shade", Any{std::string{"pale"}});
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error().rule == AccessRule::Constant);

  // The class-level value is a separate owner.
  REQUIRE(cls->Set("shade", Any{std::string{"light"}}).has_value());
  CHECK_FALSE(cls->Set("shade", Any{std::string{"other"}}).has_value());
  CHECK(early->GetAs<std::string>("shade").value() == "dark");

  auto late = cls->New();
  REQUIRE(late.has_value());
  CHECK(late->GetAs<std::string>("shade").value() == "light");
  CHECK_FALSE(late->Set("shade", Any{std::string{"dark"}}).has_value());
}

TEST_CASE("ConstantsCannotBeDeleted", "[objectmodel][Augmentation]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Augment.Pi"}.Encapsulate().Declare(Constant("pi", Any{3.14})).Define();
  REQUIRE(cls.has_value());
  auto obj = cls->New();
  REQUIRE(obj.has_value());

  auto d = obj->Delete("pi");
  REQUIRE_FALSE(d.has_value());
  CHECK(d.error().rule == AccessRule::Constant);
  CHECK_FALSE(cls->Delete("pi").has_value());
  CHECK(obj->GetAs<double>("pi").value() == 3.14);
}

TEST_CASE("DeletingVariableClearsItsValue", "[objectmodel][Augmentation]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Augment.Slot"}
                 .Encapsulate()
                 .Declare(Variable("v").Types<int>().Default(Any{1}))
                 .Declare(Static("shared").Default(Any{2}))
                 .Define();
  REQUIRE(cls.has_value());
  auto obj = cls->New();
  REQUIRE(obj.has_value());

  REQUIRE(obj->Delete("v").has_value());
  auto v = obj->Get("v");
  REQUIRE_FALSE(v.has_value());
  CHECK(v.error().code == ErrorCode::NotFound);
  CHECK(v.error().member == "v");
  CHECK(cls->FindMember("v").has_value());
  REQUIRE(obj->Set("v", Any{4}).has_value());
  CHECK(obj->GetAs<int>("v").value() == 4);

  REQUIRE(cls->Delete("shared").has_value());
  CHECK(obj->Get("shared").error().code == ErrorCode::NotFound);
}

TEST_CASE("UnsetMemberReadsAsAbsent", "[objectmodel][Augmentation]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Augment.Blank"}
                 .Encapsulate()
                 .Declare(Variable("label").Types<std::string>())
                 .Declare(Static("tally"))
                 .Declare(Constant("serial"))
                 .Define();
  REQUIRE(cls.has_value());
  auto obj = cls->New();
  REQUIRE(obj.has_value());

  CHECK(obj->Get("label").error().code == ErrorCode::NotFound);
  CHECK(cls->Get("tally").error().code == ErrorCode::NotFound);
  CHECK(obj->Get("serial").error().code == ErrorCode::NotFound);

  auto labelled = InterfaceBuilder{"Augment.Labelled"}.Member("label").Define();
  REQUIRE(labelled.has_value());
  CHECK_FALSE(InstanceOf(*obj, *labelled).value());

  REQUIRE(obj->Set("label", Any{std::string{"x"}}).has_value());
  CHECK(obj->GetAs<std::string>("label").value() == "x");
  CHECK(InstanceOf(*obj, *labelled).value());
}

TEST_CASE("MemberTableIsClosedAfterDefinition", "[objectmodel][Augmentation]")
{
  using namespace NGIN::ObjectModel;

  ClassBuilder builder{"Augment.Closed"};
  builder.Encapsulate().Declare(Variable("a"));
  auto cls = builder.Define();
  REQUIRE(cls.has_value());

  auto again = builder.Declare(Variable("b")).Define();
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error().fault == DefinitionFault::MemberTableClosed);
  CHECK_FALSE(cls->FindMember("b").has_value());

  auto added = cls->Set("b", Any{1});
  REQUIRE_FALSE(added.has_value());
  CHECK(added.error().code == ErrorCode::Definition);
  CHECK(added.error().fault == DefinitionFault::MemberTableClosed);
}

TEST_CASE("RawClassKeepsOrdinaryDynamicAttributes", "[objectmodel][Augmentation]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Augment.Raw"}
                 .Declare(Private("hidden").Default(Any{1}))
                 .Declare(Constant("fixed", Any{2}))
                 .Declare(Method("m", 0, [](Self &, std::span<const Any>) -> Expected<Any> { return Any{3}; }))
                 .Define();
  REQUIRE(cls.has_value());
  auto obj = cls->New();
  REQUIRE(obj.has_value());

  CHECK(obj->GetAs<int>("hidden").value() == 1);
  REQUIRE(obj->Set("extra", Any{std::string{"free"}}).has_value());
  CHECK(obj->GetAs<std::string>("extra").value() == "free");
  REQUIRE(obj->Delete("extra").has_value());
  CHECK(obj->Get("extra").error().code == ErrorCode::NotFound);

  CHECK(obj->Set("fixed", Any{5}).error().rule == AccessRule::Constant);
  CHECK(obj->Set("m", Any{5}).error().rule == AccessRule::Method);
}

TEST_CASE("EncapsulateIsIdempotent", "[objectmodel][Augmentation]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Augment.Twice"}.Encapsulate().Encapsulate().Declare(Private("p").Default(Any{1})).Define();
  REQUIRE(cls.has_value());
  CHECK(cls->IsEncapsulated());
  auto obj = cls->New();
  REQUIRE(obj.has_value());
  CHECK(obj->Get("p").error().rule == AccessRule::Private);
  CHECK(obj->GetAs<int>("p", cls->Context()).value() == 1);
}

TEST_CASE("SubclassRedeclarationShadowsParentDescriptor", "[objectmodel][Augmentation]")
{
  using namespace NGIN::ObjectModel;

  auto base = ClassBuilder{"Augment.Base"}.Encapsulate().Declare(Private("x").Types<int>().Default(Any{1})).Define();
  REQUIRE(base.has_value());
  auto derived = ClassBuilder{"Augment.Derived"}.Extends(*base).Encapsulate().Declare(Public("x").Types<std::string>()).Define();
  REQUIRE(derived.has_value());

  auto own = derived->FindMember("x");
  REQUIRE(own.has_value());
  CHECK(own->visibility == Visibility::Public);
  CHECK(own->owner == derived->Handle());
  auto parents = base->FindMember("x");
  REQUIRE(parents.has_value());
  CHECK(parents->visibility == Visibility::Private);
  CHECK(parents->owner == base->Handle());

  auto obj = derived->New();
  REQUIRE(obj.has_value());
  REQUIRE(obj->Set("x", Any{std::string{"s"}}).has_value());
  CHECK(obj->GetAs<std::string>("x").value() == "s");
}

namespace AugmentDemo
{
  using namespace NGIN::ObjectModel;

  Expected<Any> GetX(Self &self, std::span<const Any>)
  {
    return self.Get("x");
  }

  Expected<Any> SetX(Self &self, std::span<const Any> args)
  {
    if (auto r = self.Set("x", args[0]); !r)
      return std::unexpected(r.error());
    return Any::MakeVoid();
  }
} // namespace AugmentDemo

TEST_CASE("BaseMethodsKeepTheirPrivateMemberAfterRedeclaration", "[objectmodel][Augmentation]")
{
  using namespace NGIN::ObjectModel;

  auto base = ClassBuilder{"Augment.Holder"}
                  .Encapsulate()
                  .Declare(Private("x").Types<int>().Default(Any{1}))
                  .Declare(Method("get_x", 0, &AugmentDemo::GetX))
                  .Declare(Method("set_x", 1, &AugmentDemo::SetX))
                  .Define();
  REQUIRE(base.has_value());
  auto privateChild = ClassBuilder{"Augment.PrivateHolder"}.Extends(*base).Declare(Private("x").Default(Any{std::string{"child"}})).Define();
  auto publicChild = ClassBuilder{"Augment.PublicHolder"}.Extends(*base).Declare(Public("x").Types<std::string>().Default(Any{std::string{"open"}})).Define();
  REQUIRE(privateChild.has_value());
  REQUIRE(publicChild.has_value());

  auto hidden = privateChild->New();
  REQUIRE(hidden.has_value());
  CHECK(hidden->InvokeAs<int>("get_x").value() == 1);
  CHECK(hidden->GetAs<std::string>("x", privateChild->Context()).value() == "child");
  CHECK(hidden->Get("x").error().rule == AccessRule::Private);

  auto exposed = publicChild->New();
  REQUIRE(exposed.has_value());
  CHECK(exposed->InvokeAs<int>("get_x").value() == 1);
  CHECK(exposed->GetAs<std::string>("x").value() == "open");

  // Each declaration keeps its own storage and its own type.
  REQUIRE(exposed->InvokeAs<void>("set_x", 5).has_value());
  CHECK(exposed->InvokeAs<int>("get_x").value() == 5);
  CHECK(exposed->GetAs<std::string>("x").value() == "open");
  CHECK(exposed->InvokeAs<void>("set_x", std::string{"five"}).error().code == ErrorCode::InvalidValue);

  // A grandchild still carries the base's entry.
  auto grandchild = ClassBuilder{"Augment.GrandHolder"}.Extends(*publicChild).Define();
  REQUIRE(grandchild.has_value());
  auto deep = grandchild->New();
  REQUIRE(deep.has_value());
  CHECK(deep->InvokeAs<int>("get_x").value() == 1);
  CHECK(deep->GetAs<std::string>("x").value() == "open");
}
