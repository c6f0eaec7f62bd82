// ModuleInitTests.cpp - module attribution and one-shot initialization

#include <catch2/catch_test_macros.hpp>

#include <NGIN/ObjectModel/ObjectModel.hpp>

TEST_CASE("ModuleRegistrationAttributesDefinitions", "[objectmodel][ModuleInit]")
{
  using namespace NGIN::ObjectModel;

  ModuleRegistration module{"Orchard.Plugin"};
  CHECK(module.ModuleName() == "Orchard.Plugin");
  CHECK(module.GetModuleId() == NGIN::Hashing::FNV1a64("Orchard.Plugin", 14));

  auto iface = module.DefineInterface("Orchard.Ripe").Method("ripen", 0).Define();
  REQUIRE(iface.has_value());
  CHECK(iface->GetModuleId() == module.GetModuleId());

  auto cls = module.DefineClass("Orchard.Pear").Define();
  REQUIRE(cls.has_value());
  CHECK(cls->GetModuleId() == module.GetModuleId());

  auto local = ClassBuilder{"Orchard.Local"}.Define();
  REQUIRE(local.has_value());
  CHECK(local->GetModuleId() == 0);
}

TEST_CASE("EnsureModuleInitializedRetriesUntilSuccess", "[objectmodel][ModuleInit]")
{
  using namespace NGIN::ObjectModel;

  int calls = 0;
  bool succeed = false;
  auto init = [&](ModuleRegistration &module) {
    ++calls;
    if (!succeed)
      return false;
    return module.DefineClass("Orchard.Once").Define().has_value();
  };

  CHECK_FALSE(EnsureModuleInitialized("Orchard.Retry", init));
  CHECK(calls == 1);
  succeed = true;
  CHECK(EnsureModuleInitialized("Orchard.Retry", init));
  CHECK(calls == 2);
  CHECK(EnsureModuleInitialized("Orchard.Retry", init));
  CHECK(calls == 2);
  CHECK(FindClass("Orchard.Once").has_value());
}

TEST_CASE("EnsureModuleInitializedAcceptsVoidCallables", "[objectmodel][ModuleInit]")
{
  using namespace NGIN::ObjectModel;

  int calls = 0;
  auto init = [&](ModuleRegistration &) { ++calls; };
  CHECK(EnsureModuleInitialized("Orchard.Void", init));
  CHECK(EnsureModuleInitialized("Orchard.Void", init));
  CHECK(calls == 1);
}
