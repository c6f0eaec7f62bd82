#include <NGIN/ObjectModel/ObjectModel.hpp>

#include <iostream>
#include <string>

namespace Demo
{
  using namespace NGIN::ObjectModel;

  Expected<Any> Init(Self &self, std::span<const Any> args)
  {
    if (auto r = self.Invoke("set_weight", args); !r)
      return std::unexpected(r.error());
    return Any::MakeVoid();
  }

  Expected<Any> GetWeight(Self &self, std::span<const Any>)
  {
    return self.Get("weight");
  }

  Expected<Any> SetWeight(Self &self, std::span<const Any> args)
  {
    if (auto r = self.Set("weight", args[0]); !r)
      return std::unexpected(r.error());
    return Any::MakeVoid();
  }

  Expected<Any> Describe(Self &self, std::span<const Any>)
  {
    auto w = self.Invoke("get_weight");
    if (!w)
      return std::unexpected(w.error());
    auto color = self.GetAs<std::string>("color");
    if (!color)
      return std::unexpected(color.error());
    return Any{*color + " apple, " + std::to_string(w->Cast<float>()) + " kg"};
  }

  void Report(const char *what, const Error &error)
  {
    std::cout << what << " => " << FormatError(error) << "\n";
  }
} // namespace Demo

int main()
{
  using namespace NGIN::ObjectModel;
  std::cout << "Library: " << LibraryName() << "\n";

  auto apple = ClassBuilder{"Demo.Apple"}
                   .Encapsulate()
                   .Declare(Private("weight").Types<float>())
                   .Declare(Method("get_weight", 0, &Demo::GetWeight).WithVisibility(Visibility::Protected))
                   .Declare(Method("set_weight", 1, &Demo::SetWeight).WithVisibility(Visibility::Protected))
                   .Constructor(1, &Demo::Init)
                   .Define();
  if (!apple)
  {
    Demo::Report("define Apple", apple.error());
    return 1;
  }

  auto green = ClassBuilder{"Demo.GreenApple"}
                   .Extends(*apple)
                   .Final()
                   .Declare(Constant("color", Any{std::string{"green"}}))
                   .Declare(Method("describe", 0, &Demo::Describe))
                   .Define();
  if (!green)
  {
    Demo::Report("define GreenApple", green.error());
    return 1;
  }

  // 2.0 is a double; the float-typed weight coerces it.
  auto obj = green->Create(2.0);
  if (!obj)
  {
    Demo::Report("GreenApple(2.0)", obj.error());
    return 1;
  }
  std::cout << "describe() => " << obj->InvokeAs<std::string>("describe").value() << "\n";

  if (auto r = obj->Get("weight"); !r)
    Demo::Report("apple.weight", r.error());
  if (auto r = obj->Invoke("get_weight"); !r)
    Demo::Report("apple.get_weight()", r.error());
  if (auto r = obj->Set("color", Any{std::string{"red"}}); !r)
    Demo::Report("apple.color = red", r.error());
  if (auto r = green->Create(std::string{"two"}); !r)
    Demo::Report("GreenApple('two')", r.error());
  if (auto r = ClassBuilder{"Demo.Crabapple"}.Extends(*green).Define(); !r)
    Demo::Report("subclass GreenApple", r.error());

  auto edible = InterfaceBuilder{"Demo.Edible"}.Method("describe", 0).Define();
  if (edible)
    std::cout << "InstanceOf(apple, Edible) => " << std::boolalpha << InstanceOf(*obj, *edible).value() << "\n";
  return 0;
}
