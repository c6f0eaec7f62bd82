#include <iostream>

#include <NGIN/Benchmark.hpp>
#include <NGIN/ObjectModel/ObjectModel.hpp>

using namespace NGIN;

namespace BenchDemo
{
  using namespace NGIN::ObjectModel;

  Expected<Any> Add(Self &self, std::span<const Any> args)
  {
    auto n = self.GetAs<int>("n");
    if (!n)
      return std::unexpected(n.error());
    return Any{*n + args[0].Cast<int>()};
  }

  ExpectedClass Define(std::string_view name, bool encapsulated)
  {
    ClassBuilder b{name};
    if (encapsulated)
      b.Encapsulate();
    return b.Declare(Variable("n").Types<int>().Default(Any{5}))
        .Declare(Private("hidden").Default(Any{0}))
        .Declare(Method("add", 1, &Add))
        .Define();
  }
}

int main()
{
  using namespace NGIN::ObjectModel;

  auto raw = BenchDemo::Define("Bench.Raw", false).value();
  auto sealed = BenchDemo::Define("Bench.Sealed", true).value();
  auto rawObj = raw.New().value();
  auto sealedObj = sealed.New().value();
  auto iface = InterfaceBuilder{"Bench.Adder"}.Method("add", 1).Member("n").Define().value();

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += rawObj.GetAs<int>("n").value();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Raw Get n 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += sealedObj.GetAs<int>("n").value();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Encapsulated Get n 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Any val{42};
    ctx.start();
    for (int i=0;i<20000;++i) {
      (void)sealedObj.Set("n", val);
    }
    ctx.stop(); }, "Encapsulated Set n int 20k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Any val{42.0}; // coerced from double to int
    ctx.start();
    for (int i=0;i<20000;++i) {
      (void)sealedObj.Set("n", val);
    }
    ctx.stop(); }, "Encapsulated Set n (conv double->int) 20k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int denied = 0;
    for (int i=0;i<20000;++i) {
      denied += sealedObj.Get("hidden").has_value() ? 0 : 1;
    }
    ctx.doNotOptimize(denied);
    ctx.stop(); }, "Denied private Get 20k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += sealedObj.InvokeAs<int>("add", 7).value();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Invoke add(int) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int hits = 0;
    for (int i=0;i<10000;++i) {
      hits += InstanceOf(sealedObj, iface).value() ? 1 : 0;
    }
    ctx.doNotOptimize(hits);
    ctx.stop(); }, "InstanceOf duck-typed 10k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
