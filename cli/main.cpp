// SPDX-License-Identifier: MIT

#include "qthought/errors.hpp"
#include "qthought/experiments.hpp"
#include "qthought/quantum_tree.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>

#ifndef QTH_VERSION
#define QTH_VERSION "0.1.0"
#endif

using namespace qth;

static bool load_config_kv(const std::string& path, std::map<std::string,std::string>& kv){
  std::ifstream in(path);
  if(!in) return false;
  std::string line;
  while(std::getline(in,line)){
    if(line.empty()||line[0]=='#') continue;
    auto p=line.find('=');
    if(p==std::string::npos) continue;
    kv[line.substr(0,p)]=line.substr(p+1);
  }
  return true;
}

struct CliOptions {
  uint64_t seed = 12345;
  std::size_t trials = 10000;
  double tolerance = kDefaultTolerance;
  bool verbose = false;
  bool tables = false;
};

static void usage() {
  std::cout << "qthought-cli [--version|--build-info] bell [--seed S] [--verbose] [--config file]\n";
  std::cout << "qthought-cli fr [--trials N] [--seed S] [--tolerance T] [--tables] [--verbose] [--config file]\n";
  std::cout << "qthought-cli protocol bell|fr\n";
}

// Applies one option; returns false and fills err on a bad value.
static bool set_option(CliOptions& o, const std::string& key, const std::string& val, std::string& err){
  try {
    if (key=="seed") o.seed = std::stoull(val);
    else if (key=="trials") o.trials = std::stoull(val);
    else if (key=="tolerance") o.tolerance = std::stod(val);
    else if (key=="verbose") o.verbose = (val=="1"||val=="true");
    else if (key=="silent") o.verbose = !(val=="1"||val=="true");
    else if (key=="tables") o.tables = (val=="1"||val=="true");
    else { err = "Unknown option: " + key; return false; }
  } catch (const std::exception&) {
    err = "Bad value for " + key + ": " + val;
    return false;
  }
  if (o.tolerance <= 0.0) { err = "tolerance must be positive"; return false; }
  return true;
}

static std::optional<CliOptions> parse_options(int argc, char** argv, int first, std::string& err){
  CliOptions o;
  std::map<std::string,std::string> overrides;
  for (int i=first;i<argc;i++){
    std::string a=argv[i];
    auto nx=[&](const char* n)->std::optional<std::string>{
      if(i+1>=argc){ err = std::string("Missing value for ")+n; return std::nullopt; }
      return std::string(argv[++i]);
    };
    if (a=="--verbose") overrides["verbose"]="1";
    else if (a=="--tables") overrides["tables"]="1";
    else if (a=="--config"){
      auto path = nx("--config"); if(!path) return std::nullopt;
      std::map<std::string,std::string> kv;
      if(!load_config_kv(*path, kv)){ err = "Cannot read config: " + *path; return std::nullopt; }
      for (const auto& [k,v] : kv) if(!set_option(o, k, v, err)) return std::nullopt;
    }
    else if (a=="--seed"||a=="--trials"||a=="--tolerance"){
      auto v = nx(a.c_str()); if(!v) return std::nullopt;
      overrides[a.substr(2)] = *v;
    }
    else { err = "Unknown arg: " + a; return std::nullopt; }
  }
  // command line wins over the config file
  for (const auto& [k,v] : overrides) if(!set_option(o, k, v, err)) return std::nullopt;
  return o;
}

static int run_bell(const CliOptions& o){
  auto interp = make_copenhagen(o.tolerance);
  auto p = bell_protocol();
  QuantumSystem sys(p.requirements(), interp, o.seed, !o.verbose);
  p.run(sys, !o.verbose);
  std::cout << "Final state:\n" << sys.wavefunction_string() << "\n";
  QuantumTree tree(sys);
  tree.branch_out("Alice_memory");
  for (const auto& b : tree.branches())
    std::cout << "Alice=" << b.readout("Alice_memory") << " Bob=" << b.readout("Bob_memory")
              << " p=" << b.weight() << "\n";
  InferenceOptions io; io.seed = o.seed; io.silent = !o.verbose;
  std::cout << forward_inference(p, interp, "Alice_memory", 1, "Bob_memory", 2, io).to_string() << "\n";
  return 0;
}

static int run_fr(const CliOptions& o){
  auto interp = make_copenhagen(o.tolerance);
  InferenceOptions io; io.seed = o.seed; io.silent = !o.verbose;
  auto tables = derive_fr_tables(frauchiger_renner_protocol(), interp, io);
  if (o.tables || o.verbose){
    std::cout << "Alice:\n" << tables.alice.to_string() << "\n";
    std::cout << "Bob:\n" << tables.bob.to_string() << "\n";
    std::cout << "Bob (consistent):\n" << tables.bob_consistent.to_string() << "\n";
    std::cout << "Ursula:\n" << tables.ursula.to_string() << "\n";
    std::cout << "Ursula (consistent):\n" << tables.ursula_consistent.to_string() << "\n";
  }
  auto r = run_frauchiger_renner(o.trials, o.seed, interp, tables, !o.verbose);
  std::cout << "{\n"
               "  \"trials\": " << r.trials << ",\n"
               "  \"contradictions\": " << r.contradictions << ",\n"
               "  \"frequency\": " << r.frequency << ",\n"
               "  \"exact_probability\": " << r.exact_probability << "\n"
               "}\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) { usage(); return 1; }
  std::string first = argv[1];
  if (first == "--version") { std::cout << QTH_VERSION << "\n"; return 0; }
  if (first == "--build-info") {
    std::cout << "version=" << QTH_VERSION << "\n";
#ifdef QTH_OPENMP
    std::cout << "openmp=1\n";
#else
    std::cout << "openmp=0\n";
#endif
#ifdef QTH_FP32
    std::cout << "precision=fp32\n";
#else
    std::cout << "precision=fp64\n";
#endif
    return 0;
  }
  if (first == "--help" || first == "-h") { usage(); return 0; }

  try {
    if (first == "protocol") {
      if (argc < 3) { usage(); return 2; }
      std::string which = argv[2];
      if (which == "bell") std::cout << bell_protocol().to_string();
      else if (which == "fr") std::cout << frauchiger_renner_protocol().to_string();
      else { std::cerr << "Unknown protocol: " << which << "\n"; return 2; }
      return 0;
    }
    if (first == "bell" || first == "fr") {
      std::string err;
      auto o = parse_options(argc, argv, 2, err);
      if (!o) { std::cerr << err << "\n"; return 2; }
      return first == "bell" ? run_bell(*o) : run_fr(*o);
    }
  } catch (const Error& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 3;
  }
  usage();
  return 1;
}
