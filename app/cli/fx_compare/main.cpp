#include <fxr/config/forex_config.hpp>
#include <fxr/market/conversion_inputs.hpp>
#include <fxr/routing/comparator.hpp>
#include <fxr/routing/report.hpp>
#include <fxr/curve/curve.hpp>
#include <fxr/io/curve_csv.hpp>

#include <iostream>
#include <iomanip>
#include <optional>
#include <string>
#include <stdexcept>

static void print_usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " [budget direct_rate home_to_intermediate i2f_min i2f_max]"
            << " [--rate R] [--csv FILE] [--precision N]\n"
            << "If no positional arguments are provided, runs the default scenario\n"
            << "(100000 1.41 89.1 60 85).\n";
}

int main(int argc, char** argv) {
  fxr::config::ForexConfig cfg;
  std::optional<double> rate_override;
  std::string csv_file;

  // Séparation positionnels / flags
  int n_pos = 0;
  double pos[5] = {0, 0, 0, 0, 0};

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--rate" && i + 1 < argc) {
        rate_override = std::stod(argv[++i]);
      } else if (arg == "--csv" && i + 1 < argc) {
        csv_file = argv[++i];
      } else if (arg.rfind("--csv=", 0) == 0) {
        csv_file = arg.substr(6);
      } else if (arg == "--precision" && i + 1 < argc) {
        cfg.precision = std::stoi(argv[++i]);
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
      } else {
        if (n_pos >= 5) { print_usage(argv[0]); return 1; }
        pos[n_pos++] = std::stod(arg);
      }
    }
  } catch (const std::logic_error&) { // stod/stoi : invalid_argument, out_of_range
    print_usage(argv[0]);
    return 1;
  }

  if (n_pos != 0 && n_pos != 5) {
    print_usage(argv[0]);
    return 1;
  }
  if (n_pos == 5) {
    cfg.budget                    = pos[0];
    cfg.direct_rate               = pos[1];
    cfg.home_to_intermediate_rate = pos[2];
    cfg.i2f_min                   = pos[3];
    cfg.i2f_max                   = pos[4];
  }

  try {
    // Validation unique, avant tout calcul
    const fxr::market::ConversionInputs in(cfg.budget, cfg.direct_rate,
                                           cfg.home_to_intermediate_rate);
    const fxr::market::RateRange range(cfg.i2f_min, cfg.i2f_max);

    const double rate = rate_override ? *rate_override : fxr::market::midpoint(range);
    const auto res   = fxr::routing::compare(in, rate);
    const auto curve = fxr::curve::generate_curve(in, range);

    std::cout << "budget=" << cfg.budget
              << " direct_rate=" << cfg.direct_rate
              << " home_to_intermediate=" << cfg.home_to_intermediate_rate
              << " i2f_range=[" << range.min << ", " << range.max << "]"
              << " i2f_rate=" << rate << "\n\n";

    std::cout << std::left << std::setw(34) << "Scenario" << "Value\n";
    std::cout << "------------------------------------------------\n";
    for (const auto& row : fxr::routing::result_rows(res)) {
      std::cout << std::left << std::setw(34) << row.label
                << fxr::routing::format_value(row.value, cfg.precision) << "\n";
    }
    std::cout << "\n";

    const auto best = fxr::routing::better_route(res);
    std::cout << "better route  : " << fxr::routing::to_string(best) << "\n"
              << "break-even    : " << fxr::routing::format_value(curve.break_even_rate, 2)
              << (curve.break_even_in_range() ? " (inside sampled range)"
                                              : " (outside sampled range)") << "\n"
              << "curve samples : " << curve.samples.size() << "\n";

    if (!csv_file.empty()) {
      try {
        fxr::io::write_curve_csv(csv_file, curve);
      } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 2;
      }
      std::cout << "curve written to: " << csv_file << "\n";
    }
  } catch (const fxr::market::InvalidInput& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
