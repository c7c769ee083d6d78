// SPDX-License-Identifier: MIT

#include "qthought/experiments.hpp"
#include <chrono>
#include <iostream>

using namespace qth;

int main(){
  auto interp = make_copenhagen();
  auto p = frauchiger_renner_protocol();
  auto t0 = std::chrono::steady_clock::now();
  auto tables = derive_fr_tables(p, interp);
  auto t1 = std::chrono::steady_clock::now();
  auto r = run_frauchiger_renner(1000, 42, interp, tables);
  auto t2 = std::chrono::steady_clock::now();
  std::chrono::duration<double> inf = t1 - t0, runs = t2 - t1;
  std::cout << "Inference seconds: " << inf.count() << "\n";
  std::cout << "1000 trials seconds: " << runs.count() << " (" << r.contradictions << " contradictions)\n";
  return 0;
}
