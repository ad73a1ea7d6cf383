#include "fxr/io/curve_csv.hpp"
#include <iostream>
#include <sstream>
#include <fstream>
#include <cassert>
#include <string>
#include <vector>
#include <cstdio>
#include <stdexcept>
using namespace std;

static vector<string> lines_of(const string& s) {
  vector<string> out;
  istringstream is(s);
  string l;
  while (getline(is, l)) out.push_back(l);
  return out;
}

int main(int argc, char** argv) {
  const auto curve = fxr::curve::generate_curve(100000.0, 1.41, 89.1, 60.0, 85.0);

  // 1) Sortie en mémoire
  ostringstream os;
  fxr::io::CsvCurveSink sink(os);
  fxr::curve::emit_curve(curve, sink);
  assert(sink.rows_written() == 100);

  const auto L = lines_of(os.str());
  assert(L.size() == 3 + 100);
  assert(L[0] == "# direct_yield=70921.9858156028");
  assert(L[1] == "# break_even_rate=63.1914893617");
  assert(L[2] == "rate,indirect_yield,direct_yield");
  assert(L[3].rfind("60.0000000000,", 0) == 0);
  assert(L.back().rfind("85.0000000000,", 0) == 0);
  assert(L[3].find(",70921.9858156028") != string::npos);

  // 2) Fichier
  const string path = (argc > 1 ? argv[1] : "test_curve_csv_out.csv");
  fxr::io::write_curve_csv(path, curve);
  {
    ifstream in(path);
    assert(in.good());
    stringstream buf; buf << in.rdbuf();
    assert(buf.str() == os.str());
  }
  std::remove(path.c_str());

  // 3) Chemin impossible -> runtime_error
  bool threw = false;
  try {
    fxr::io::write_curve_csv("/nonexistent_dir_fxr/out.csv", curve);
  } catch (const std::runtime_error& e) {
    threw = true;
    cerr << "[expected] " << e.what() << "\n";
  }
  assert(threw);

  cout << "Curve CSV OK.\n";
  return 0;
}
