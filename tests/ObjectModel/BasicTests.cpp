/// @file BasicTests.cpp
/// @brief Smoke tests for NGIN.ObjectModel.

#include <catch2/catch_test_macros.hpp>
#include <NGIN/ObjectModel/ObjectModel.hpp>

#include <string>

TEST_CASE("LibraryNameReturnsModuleIdentifier", "[objectmodel][Basics]")
{
  CHECK(NGIN::ObjectModel::LibraryName() == std::string_view{"NGIN.ObjectModel"});
}

TEST_CASE("DefinedClassExposesDeclaredDefaults", "[objectmodel][Basics]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Basics.Point"}
                 .Encapsulate()
                 .Declare(Variable("x").Types<int>().Default(Any{0}))
                 .Declare(Public("label").Types<std::string>().Default(Any{std::string{"origin"}}))
                 .Define();
  REQUIRE(cls.has_value());
  CHECK(cls->Name() == "Basics.Point");
  CHECK(cls->IsEncapsulated());
  CHECK_FALSE(cls->IsAbstract());
  CHECK_FALSE(cls->IsFinal());
  CHECK_FALSE(cls->Parent().has_value());
  CHECK(cls->MemberCount() == 2);

  auto obj = cls->New();
  REQUIRE(obj.has_value());
  CHECK(obj->GetClass() == *cls);
  CHECK(obj->InstanceId() != 0);

  auto x = obj->GetAs<int>("x");
  REQUIRE(x.has_value());
  CHECK(*x == 0);
  auto label = obj->GetAs<std::string>("label");
  REQUIRE(label.has_value());
  CHECK(*label == "origin");

  REQUIRE(obj->Set("x", Any{5}).has_value());
  CHECK(obj->GetAs<int>("x").value() == 5);
}

TEST_CASE("InstancesHaveDistinctStorageAndIdentity", "[objectmodel][Basics]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Basics.Counter"}.Encapsulate().Declare(Variable("n").Types<int>().Default(Any{1})).Define();
  REQUIRE(cls.has_value());
  auto a = cls->New();
  auto b = cls->New();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  CHECK_FALSE(*a == *b);
  CHECK(a->InstanceId() != b->InstanceId());

  REQUIRE(a->Set("n", Any{10}).has_value());
  CHECK(a->GetAs<int>("n").value() == 10);
  CHECK(b->GetAs<int>("n").value() == 1);
}

TEST_CASE("ConstructorReceivesArgumentsThroughSelf", "[objectmodel][Basics]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Basics.Pair"}
                 .Encapsulate()
                 .Declare(Private("first").Types<int>())
                 .Declare(Private("second").Types<int>())
                 .Declare(Method("sum", 0, [](Self &self, std::span<const Any>) -> Expected<Any> {
                   auto a = self.GetAs<int>("first");
                   auto b = self.GetAs<int>("second");
                   if (!a)
                     return std::unexpected(a.error());
                   if (!b)
                     return std::unexpected(b.error());
                   return Any{*a + *b};
                 }))
                 .Constructor(2, [](Self &self, std::span<const Any> args) -> Expected<Any> {
                   if (auto r = self.Set("first", args[0]); !r)
                     return std::unexpected(r.error());
                   if (auto r = self.Set("second", args[1]); !r)
                     return std::unexpected(r.error());
                   return Any::MakeVoid();
                 })
                 .Define();
  REQUIRE(cls.has_value());

  auto obj = cls->Create(3, 4);
  REQUIRE(obj.has_value());
  auto sum = obj->InvokeAs<int>("sum");
  REQUIRE(sum.has_value());
  CHECK(*sum == 7);
}

TEST_CASE("ConstructorArityIsChecked", "[objectmodel][Basics]")
{
  using namespace NGIN::ObjectModel;

  auto withCtor = ClassBuilder{"Basics.OneArg"}
                      .Constructor(1, [](Self &, std::span<const Any>) -> Expected<Any> { return Any::MakeVoid(); })
                      .Define();
  REQUIRE(withCtor.has_value());
  auto bad = withCtor->Create(1, 2);
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().code == ErrorCode::InvalidArgument);

  auto noCtor = ClassBuilder{"Basics.NoArg"}.Define();
  REQUIRE(noCtor.has_value());
  CHECK(noCtor->New().has_value());
  auto extra = noCtor->Create(1);
  REQUIRE_FALSE(extra.has_value());
  CHECK(extra.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("SubclassInheritsConstructorAndMembers", "[objectmodel][Basics]")
{
  using namespace NGIN::ObjectModel;

  auto base = ClassBuilder{"Basics.Shape"}
                  .Encapsulate()
                  .Declare(Variable("sides").Types<int>())
                  .Constructor(1, [](Self &self, std::span<const Any> args) -> Expected<Any> {
                    if (auto r = self.Set("sides", args[0]); !r)
                      return std::unexpected(r.error());
                    return Any::MakeVoid();
                  })
                  .Define();
  REQUIRE(base.has_value());
  auto derived = ClassBuilder{"Basics.Square"}.Extends(*base).Encapsulate().Declare(Variable("edge").Default(Any{1.5})).Define();
  REQUIRE(derived.has_value());
  CHECK(derived->IsSubclassOf(*base));
  CHECK_FALSE(base->IsSubclassOf(*derived));
  REQUIRE(derived->Parent().has_value());
  CHECK(*derived->Parent() == *base);
  CHECK(derived->MemberCount() == 1);

  auto sq = derived->Create(4);
  REQUIRE(sq.has_value());
  CHECK(sq->GetAs<int>("sides").value() == 4);
  CHECK(sq->GetAs<double>("edge").value() == 1.5);
}

TEST_CASE("InvokingDataMemberIsRejected", "[objectmodel][Basics]")
{
  using namespace NGIN::ObjectModel;

  auto cls = ClassBuilder{"Basics.Plain"}.Encapsulate().Declare(Variable("v").Default(Any{1})).Define();
  REQUIRE(cls.has_value());
  auto obj = cls->New();
  REQUIRE(obj.has_value());
  auto r = obj->Invoke("v");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("DefaultObjectIsInvalid", "[objectmodel][Basics]")
{
  using namespace NGIN::ObjectModel;

  Object none;
  CHECK_FALSE(none.IsValid());
  CHECK(none.InstanceId() == 0);
  auto r = none.Get("anything");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidArgument);
  CHECK_FALSE(Class{}.IsValid());
  CHECK(Class{}.New().error().code == ErrorCode::InvalidArgument);
}
