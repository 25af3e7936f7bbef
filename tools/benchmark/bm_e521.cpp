#include <benchmark/benchmark.h>

#include <e521/crypto/base.h>

using namespace e521::crypto;

static void BM_FieldMul(benchmark::State& state) {
  const mod_t& p = e521_curve_t::p();
  bn_t a = p.rand();
  bn_t b = p.rand();
  for (auto _ : state) MODULO(p) {
      benchmark::DoNotOptimize(a * b);
    }
}
BENCHMARK(BM_FieldMul)->Name("E521/Field/Multiply");

static void BM_FieldInv(benchmark::State& state) {
  const mod_t& p = e521_curve_t::p();
  bn_t a = p.rand();
  for (auto _ : state) {
    benchmark::DoNotOptimize(p.inv(a));
  }
}
BENCHMARK(BM_FieldInv)->Name("E521/Field/Inverse");

static void BM_FieldSqrt(benchmark::State& state) {
  const mod_t& p = e521_curve_t::p();
  bn_t a = p.rand();
  bn_t v = p.mul(a, a);
  bn_t r;
  for (auto _ : state) {
    benchmark::DoNotOptimize(p.sqrt(v, false, r));
  }
}
BENCHMARK(BM_FieldSqrt)->Name("E521/Field/Sqrt");

static void BM_FromX(benchmark::State& state) {
  e521_point_t P;
  for (auto _ : state) {
    benchmark::DoNotOptimize(e521_point_t::from_x(bn_t(4), false, P));
  }
}
BENCHMARK(BM_FromX)->Name("E521/Point/FromX");

static void BM_Add(benchmark::State& state) {
  const e521_point_t& G = e521_curve_t::generator();
  e521_point_t P = e521_curve_t::mul_generator(bn_t::rand(e521_curve_t::order()));
  e521_point_t R;
  for (auto _ : state) {
    benchmark::DoNotOptimize(e521_point_t::add(G, P, R));
  }
}
BENCHMARK(BM_Add)->Name("E521/Point/Add");

static void BM_Mul(benchmark::State& state, error_t (*mul)(const bn_t&, const e521_point_t&, e521_point_t&)) {
  bn_t s = bn_t::rand(e521_curve_t::order());
  const e521_point_t& G = e521_curve_t::generator();
  e521_point_t R;
  for (auto _ : state) {
    benchmark::DoNotOptimize(mul(s, G, R));
  }
}
BENCHMARK_CAPTURE(BM_Mul, double_and_add, e521_point_t::mul_double_and_add)
    ->Name("E521/Point/Multiply_DoubleAndAdd")
    ->Unit(benchmark::kMillisecond);
BENCHMARK_CAPTURE(BM_Mul, ladder, e521_point_t::mul_ladder)
    ->Name("E521/Point/Multiply_Ladder")
    ->Unit(benchmark::kMillisecond);

static void BM_MulNaive(benchmark::State& state) {
  bn_t s(int(state.range(0)));
  const e521_point_t& G = e521_curve_t::generator();
  e521_point_t R;
  for (auto _ : state) {
    benchmark::DoNotOptimize(e521_point_t::mul_naive(s, G, R));
  }
}
BENCHMARK(BM_MulNaive)->Name("E521/Point/Multiply_Naive")->RangeMultiplier(4)->Range(16, 1024);

static void BM_SubgroupCheck(benchmark::State& state) {
  const e521_point_t& G = e521_curve_t::generator();
  for (auto _ : state) {
    benchmark::DoNotOptimize(G.is_in_subgroup());
  }
}
BENCHMARK(BM_SubgroupCheck)->Name("E521/Point/IsInSubgroup")->Unit(benchmark::kMillisecond);
