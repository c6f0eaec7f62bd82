// Interfaces.cpp - interface contracts, explicit and structural conformance

#include <catch2/catch_test_macros.hpp>

#include <NGIN/ObjectModel/ObjectModel.hpp>

#include <string>

namespace InterfaceDemo
{
  using namespace NGIN::ObjectModel;

  Expected<Any> Speak(Self &, std::span<const Any>)
  {
    return Any{std::string{"hello"}};
  }

  Expected<Any> Echo(Self &, std::span<const Any> args)
  {
    return args[0];
  }
} // namespace InterfaceDemo

TEST_CASE("DerivedInterfaceUnionsRequirements", "[objectmodel][Interfaces]")
{
  using namespace NGIN::ObjectModel;

  auto speaker = InterfaceBuilder{"Iface.Speaker"}.Method("speak", 0).Hidden("tone").Method("_helper", 0).Define();
  REQUIRE(speaker.has_value());
  CHECK(speaker->RequiredCount() == 1);
  CHECK_FALSE(speaker->FindRequirement("tone").has_value());
  CHECK_FALSE(speaker->FindRequirement("_helper").has_value());

  auto echo = InterfaceBuilder{"Iface.Echoer"}.Extends(*speaker).Method("echo", 1).Member("volume").Define();
  REQUIRE(echo.has_value());
  CHECK(echo->RequiredCount() == 3);
  CHECK(echo->ParentCount() == 1);
  CHECK(echo->ParentAt(0) == *speaker);
  CHECK(echo->IsDerivedFrom(*speaker));
  CHECK_FALSE(speaker->IsDerivedFrom(*echo));

  auto req = echo->FindRequirement("echo");
  REQUIRE(req.has_value());
  CHECK(req->kind == RequirementKind::Method);
  CHECK(req->arity == 1);
  auto vol = echo->FindRequirement("volume");
  REQUIRE(vol.has_value());
  CHECK(vol->kind == RequirementKind::Data);

  CHECK(GetInterface("Iface.Echoer").value() == *echo);
  CHECK_FALSE(FindInterface("Iface.Nobody").has_value());
  CHECK(GetInterface("Iface.Nobody").error().code == ErrorCode::NotFound);
}

TEST_CASE("ImplementsRejectsMissingMember", "[objectmodel][Interfaces]")
{
  using namespace NGIN::ObjectModel;

  auto speaker = InterfaceBuilder{"Iface.Speaker2"}.Method("speak", 0).Define();
  REQUIRE(speaker.has_value());

  auto mute = ClassBuilder{"Iface.Mute"}.Implements(*speaker).Define();
  REQUIRE_FALSE(mute.has_value());
  CHECK(mute.error().code == ErrorCode::Definition);
  CHECK(mute.error().fault == DefinitionFault::MissingInterfaceMember);
  CHECK(mute.error().member == "speak");
  CHECK(mute.error().interfaceName == "Iface.Speaker2");
  CHECK(mute.error().className == "Iface.Mute");

  auto wrongArity = ClassBuilder{"Iface.Mumbler"}
                        .Implements(*speaker)
                        .Declare(Method("speak", 1, &InterfaceDemo::Echo))
                        .Define();
  REQUIRE_FALSE(wrongArity.has_value());
  CHECK(wrongArity.error().fault == DefinitionFault::MissingInterfaceMember);

  auto dataOnly = ClassBuilder{"Iface.Statue"}.Implements(*speaker).Declare(Variable("speak")).Define();
  REQUIRE_FALSE(dataOnly.has_value());
  CHECK(dataOnly.error().fault == DefinitionFault::MissingInterfaceMember);
}

TEST_CASE("ImplementsAcceptsInheritedMembers", "[objectmodel][Interfaces]")
{
  using namespace NGIN::ObjectModel;

  auto speaker = InterfaceBuilder{"Iface.Speaker3"}.Method("speak", 0).Member("name").Define();
  REQUIRE(speaker.has_value());
  auto base = ClassBuilder{"Iface.Animal"}.Encapsulate().Declare(Method("speak", 0, &InterfaceDemo::Speak)).Define();
  REQUIRE(base.has_value());
  auto dog = ClassBuilder{"Iface.Dog"}.Extends(*base).Implements(*speaker).Declare(Constant("name", Any{std::string{"Rex"}})).Define();
  REQUIRE(dog.has_value());
  CHECK(dog->IsEncapsulated());
  CHECK(dog->InterfaceCount() == 1);
  CHECK(dog->InterfaceAt(0) == *speaker);

  auto obj = dog->New();
  REQUIRE(obj.has_value());
  CHECK(InstanceOf(*obj, *speaker, false).value());
  CHECK(InstanceOf(*obj, *speaker).value());
}

TEST_CASE("DuckTypingFollowsTheExternalSurface", "[objectmodel][Interfaces]")
{
  using namespace NGIN::ObjectModel;

  auto speaker = InterfaceBuilder{"Iface.Speaker4"}.Method("speak", 0).Define();
  REQUIRE(speaker.has_value());

  auto duck = ClassBuilder{"Iface.Duck"}.Encapsulate().Declare(Method("speak", 0, &InterfaceDemo::Speak)).Define();
  auto shy = ClassBuilder{"Iface.Shy"}
                 .Implements(*speaker)
                 .Declare(Method("speak", 0, &InterfaceDemo::Speak).WithVisibility(Visibility::Private))
                 .Define();
  auto echo = ClassBuilder{"Iface.Parrot"}.Encapsulate().Declare(Method("speak", 1, &InterfaceDemo::Echo)).Define();
  auto stone = ClassBuilder{"Iface.Stone"}.Encapsulate().Define();
  REQUIRE(duck.has_value());
  REQUIRE(shy.has_value());
  REQUIRE(echo.has_value());
  REQUIRE(stone.has_value());

  auto d = duck->New();
  auto s = shy->New();
  auto p = echo->New();
  auto st = stone->New();
  REQUIRE(d.has_value());
  REQUIRE(s.has_value());
  REQUIRE(p.has_value());
  REQUIRE(st.has_value());

  // Structural conformance without a declaration.
  CHECK(InstanceOf(*d, *speaker).value());
  CHECK_FALSE(InstanceOf(*d, *speaker, false).value());

  // Declared, but the member is private: duck typing sees it as absent.
  CHECK_FALSE(InstanceOf(*s, *speaker).value());
  CHECK(InstanceOf(*s, *speaker, false).value());

  CHECK_FALSE(InstanceOf(*p, *speaker).value());
  CHECK_FALSE(InstanceOf(*st, *speaker).value());
}

TEST_CASE("ExactConformanceHonoursInterfaceAndClassLineage", "[objectmodel][Interfaces]")
{
  using namespace NGIN::ObjectModel;

  auto base = InterfaceBuilder{"Iface.Base5"}.Method("speak", 0).Define();
  REQUIRE(base.has_value());
  auto derived = InterfaceBuilder{"Iface.Derived5"}.Extends(*base).Define();
  REQUIRE(derived.has_value());

  auto parent = ClassBuilder{"Iface.Parent5"}.Implements(*derived).Declare(Method("speak", 0, &InterfaceDemo::Speak)).Define();
  REQUIRE(parent.has_value());
  auto child = ClassBuilder{"Iface.Child5"}.Extends(*parent).Encapsulate().Define();
  REQUIRE(child.has_value());

  auto obj = child->New();
  REQUIRE(obj.has_value());
  CHECK(InstanceOf(*obj, *derived, false).value());
  CHECK(InstanceOf(*obj, *base, false).value());

  auto other = InterfaceBuilder{"Iface.Other5"}.Define();
  REQUIRE(other.has_value());
  CHECK_FALSE(InstanceOf(*obj, *other, false).value());
  // No requirements: everything conforms structurally.
  CHECK(InstanceOf(*obj, *other).value());
}

TEST_CASE("InstanceOfClassIsLineageMembership", "[objectmodel][Interfaces]")
{
  using namespace NGIN::ObjectModel;

  auto animal = ClassBuilder{"Iface.Animal6"}.Define();
  REQUIRE(animal.has_value());
  auto cat = ClassBuilder{"Iface.Cat6"}.Extends(*animal).Define();
  REQUIRE(cat.has_value());
  auto rock = ClassBuilder{"Iface.Rock6"}.Define();
  REQUIRE(rock.has_value());

  auto c = cat->New();
  REQUIRE(c.has_value());
  CHECK(InstanceOf(*c, *cat).value());
  CHECK(InstanceOf(*c, *animal).value());
  CHECK_FALSE(InstanceOf(*c, *rock).value());

  CHECK(InstanceOf(Any{*c}, *animal).value());
  CHECK_FALSE(InstanceOf(Any{7}, *animal).value());
}

TEST_CASE("InstanceOfRejectsMalformedArguments", "[objectmodel][Interfaces]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Iface.Thing7"}.Define();
  REQUIRE(cls.has_value());
  auto obj = cls->New();
  REQUIRE(obj.has_value());

  auto stale = InstanceOf(*obj, Interface{});
  REQUIRE_FALSE(stale.has_value());
  CHECK(stale.error().code == ErrorCode::InvalidArgument);
  CHECK_FALSE(InstanceOf(Object{}, *cls).has_value());
  CHECK_FALSE(InstanceOf(*obj, Class{}).has_value());
}

TEST_CASE("InterfaceDefinitionErrors", "[objectmodel][Interfaces]")
{
  using namespace NGIN::ObjectModel;

  auto dup = InterfaceBuilder{"Iface.Dup"}.Method("a", 0).Member("a").Define();
  REQUIRE_FALSE(dup.has_value());
  CHECK(dup.error().fault == DefinitionFault::DuplicateMember);

  auto orphan = InterfaceBuilder{"Iface.Orphan"}.Extends(Interface{}).Define();
  REQUIRE_FALSE(orphan.has_value());
  CHECK(orphan.error().fault == DefinitionFault::UnknownParent);

  InterfaceBuilder once{"Iface.Once"};
  REQUIRE(once.Define().has_value());
  auto twice = once.Define();
  REQUIRE_FALSE(twice.has_value());
  CHECK(twice.error().fault == DefinitionFault::MemberTableClosed);
}
