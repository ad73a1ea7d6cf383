#include "fxr/curve/curve.hpp"
#include "fxr/config/forex_config.hpp"
#include "fxr/core/grid.hpp"
#include <cmath>
#include <cassert>
#include <iostream>
#include <vector>
#include <algorithm>
#include <cstddef>

// Récepteur qui enregistre l’ordre des appels
struct RecordingSink : fxr::curve::CurveSink {
  std::vector<char> calls;
  double level = std::nan("");
  double marker = std::nan("");
  std::vector<fxr::curve::CurvePoint> pts;

  void direct_level(double y) override { calls.push_back('D'); level = y; }
  void sample(double r, double y) override { calls.push_back('S'); pts.push_back({r, y}); }
  void break_even(double r) override { calls.push_back('B'); marker = r; }
};

template <class F>
static bool throws_invalid(F&& f) {
  try { f(); } catch (const fxr::market::InvalidInput&) { return true; }
  return false;
}

int main() {
  const double B = 100000.0, D = 1.41, H = 89.1;
  const std::size_t N = fxr::config::kCurveSamples;
  assert(N == 100);

  // 1) Nombre de points et bornes exactes
  const auto c = fxr::curve::generate_curve(B, D, H, 60.0, 85.0);
  assert(c.samples.size() == N);
  assert(c.samples.front().rate == 60.0);
  assert(c.samples.back().rate  == 85.0);
  for (std::size_t i = 1; i < N; ++i) assert(c.samples[i].rate > c.samples[i-1].rate);
  // pas uniforme (max - min) / 99
  const double step = 25.0 / 99.0;
  for (std::size_t i = 1; i < N; ++i)
    assert(std::abs((c.samples[i].rate - c.samples[i-1].rate) - step) < 1e-9);

  // 2) Niveau direct constant, point mort identique à compare()
  assert(c.direct_yield == B / D);
  assert(c.break_even_rate == H / D);
  assert(c.break_even_in_range());

  // 3) Linéarité : pente constante = budget / home_to_intermediate_rate
  const double slope = B / H;
  assert(c.slope == slope);
  for (std::size_t i = 0; i < N; ++i)
    for (std::size_t j = i + 1; j < N; j += 7) {
      const auto& p = c.samples[i];
      const auto& q = c.samples[j];
      const double s = (q.indirect_yield - p.indirect_yield) / (q.rate - p.rate);
      assert(std::abs(s - slope) <= 1e-9 * slope);
    }

  // 4) Plage dégénérée : 100 points confondus, pas d’erreur
  const auto flat = fxr::curve::generate_curve(B, D, H, 70.0, 70.0);
  assert(flat.samples.size() == N);
  assert(std::all_of(flat.samples.begin(), flat.samples.end(),
                     [](const fxr::curve::CurvePoint& p){ return p.rate == 70.0; }));
  assert(flat.samples.front().indirect_yield == flat.samples.back().indirect_yield);

  // 5) Point mort hors plage : toujours renseigné
  const auto hi = fxr::curve::generate_curve(B, D, H, 70.0, 85.0);
  assert(hi.break_even_rate == H / D);
  assert(!hi.break_even_in_range());

  // 6) Entrées invalides
  assert(throws_invalid([&]{ fxr::curve::generate_curve(B, D, H, 85.0, 60.0); }));
  assert(throws_invalid([&]{ fxr::curve::generate_curve(0.0, D, H, 60.0, 85.0); }));
  assert(throws_invalid([&]{ fxr::curve::generate_curve(B, D, H, -1.0, 85.0); }));
  assert(throws_invalid([&]{ fxr::curve::generate_curve(B, D, 0.0, 60.0, 85.0); }));

  // 7) Récepteur : niveau, 100 points, puis point mort
  RecordingSink sink;
  fxr::curve::emit_curve(c, sink);
  assert(sink.calls.size() == N + 2);
  assert(sink.calls.front() == 'D');
  assert(sink.calls.back()  == 'B');
  assert(std::count(sink.calls.begin(), sink.calls.end(), 'S') == static_cast<std::ptrdiff_t>(N));
  assert(sink.level  == c.direct_yield);
  assert(sink.marker == c.break_even_rate);
  assert(sink.pts.front().rate == 60.0 && sink.pts.back().rate == 85.0);

  // 8) Grille générique
  const auto g = fxr::core::linspace(0.0, 1.0, 5);
  assert(g.size() == 5 && g[0] == 0.0 && g[2] == 0.5 && g[4] == 1.0);
  assert(fxr::core::linspace(3.0, 9.0, 1).front() == 3.0);
  assert(fxr::core::linspace(3.0, 9.0, 0).empty());
  // les échantillons de la courbe sont exactement cette grille
  const auto grid = fxr::core::linspace(60.0, 85.0, N);
  assert(grid.size() == c.samples.size());
  for (std::size_t i = 0; i < N; ++i) assert(c.samples[i].rate == grid[i]);

  // 9) Déterminisme
  const auto c2 = fxr::curve::generate_curve(B, D, H, 60.0, 85.0);
  for (std::size_t i = 0; i < N; ++i) {
    assert(c2.samples[i].rate == c.samples[i].rate);
    assert(c2.samples[i].indirect_yield == c.samples[i].indirect_yield);
  }

  std::cout << "Curve OK.\n";
  return 0;
}
