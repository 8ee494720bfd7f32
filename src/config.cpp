#include "macrosim/config.hpp"
#include "macrosim/constants.hpp"
#include "macrosim/util.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>

namespace macrosim {

static nlohmann::json read_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) die("cannot open config: " + path);
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::exception& e) {
    die("cannot parse config: " + path + ": " + e.what());
  }
  return j;
}

static const nlohmann::json& read_object(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j.at(key).is_object()) die(std::string("missing/invalid object: ") + key);
  return j.at(key);
}

static f64 read_num(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j.at(key).is_number()) die(std::string("missing/invalid number: ") + key);
  return j.at(key).get<f64>();
}

static i32 read_id(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j.at(key).is_number_integer()) die(std::string("missing/invalid id: ") + key);
  const auto& v = j.at(key);
  const bool fits = v.is_number_unsigned()
      ? v.get<std::uint64_t>() <= (std::uint64_t)std::numeric_limits<i32>::max()
      : (v.get<std::int64_t>() >= std::numeric_limits<i32>::min() && v.get<std::int64_t>() <= std::numeric_limits<i32>::max());
  if (!fits) die(std::string("id out of range: ") + key + "=" + v.dump());
  return v.get<i32>();
}

static const nlohmann::json& read_array(const nlohmann::json& j, const char* key) {
  static const nlohmann::json empty = nlohmann::json::array();
  if (!j.contains(key)) return empty;
  if (!j.at(key).is_array()) die(std::string("invalid array: ") + key);
  return j.at(key);
}

static ConsumptionFirm read_consumption_firm(const nlohmann::json& j) {
  ConsumptionFirm f{};
  f.firm_id = read_id(j, "firm_id");
  f.A = j.value("A", 0.0);
  f.liquidity = j.value("liquidity", 0.0);
  f.deb = j.value("deb", 0.0);
  f.PA = j.value("PA", 0.0);
  f.K = j.value("K", 0.0);
  f.capital_value = j.value("capital_value", 0.0);
  f.P = j.value("P", 0.0);
  f.Y_prev = j.value("Y_prev", 0.0);
  f.Yd = j.value("Yd", 0.0);
  f.Y = j.value("Y", 0.0);
  f.stock = j.value("stock", 0.0);
  f.x = j.value("x", 0.0);
  f.barK = j.value("barK", 0.0);
  f.barYK = j.value("barYK", 0.0);
  f.Leff = j.value("Leff", 0.0);
  f.interest_r = j.value("interest_r", 0.0);
  return f;
}

static CapitalFirm read_capital_firm(const nlohmann::json& j) {
  CapitalFirm f{};
  f.firm_id = read_id(j, "firm_id");
  f.A_k = j.value("A_k", 0.0);
  f.liquidity_k = j.value("liquidity_k", 0.0);
  f.deb_k = j.value("deb_k", 0.0);
  f.PA = j.value("PA", 0.0);
  f.P_k = j.value("P_k", 0.0);
  f.Y_prev_k = j.value("Y_prev_k", 0.0);
  f.Y_kd = j.value("Y_kd", 0.0);
  f.Y_k = j.value("Y_k", 0.0);
  f.stock_k = j.value("stock_k", 0.0);
  f.Leff_k = j.value("Leff_k", 0.0);
  f.interest_r_k = j.value("interest_r_k", 0.0);
  return f;
}

static ModelConfig config_from_json(const nlohmann::json& j) {
  ModelConfig cfg{};

  const auto& params = read_object(j, "params");
  cfg.params.k = read_num(params, "k");
  cfg.params.alpha = read_num(params, "alpha");
  cfg.params.r_f = read_num(params, "r_f");

  const auto& agg = read_object(j, "agg");
  cfg.agg.price_k = read_num(agg, "price_k");
  cfg.agg.wb = read_num(agg, "wb");
  cfg.agg.defaults = agg.value("defaults", 0);
  cfg.agg.defaults_k = agg.value("defaults_k", 0);

  const auto& bank = read_object(j, "bank");
  cfg.bank.profitsB = read_num(bank, "profitsB");
  cfg.bank.loans = read_num(bank, "loans");
  cfg.bank.E = read_num(bank, "E");

  for (const auto& f : read_array(j, "consumption_firms")) cfg.consumption_firms.push_back(read_consumption_firm(f));
  for (const auto& f : read_array(j, "capital_firms")) cfg.capital_firms.push_back(read_capital_firm(f));

  for (const auto& w : read_array(j, "workers")) {
    Worker wk{};
    wk.worker_id = read_id(w, "worker_id");
    wk.Oc = w.contains("Oc") ? read_id(w, "Oc") : UNEMPLOYED;
    wk.w = w.value("w", 0.0);
    cfg.workers.push_back(wk);
  }

  return cfg;
}

static ModelConfig checked_config_from_json(const nlohmann::json& j) {
  try {
    return config_from_json(j);
  } catch (const nlohmann::json::exception& e) {
    die(std::string("invalid config value: ") + e.what());
  }
}

ModelConfig load_config(const std::string& path) {
  return checked_config_from_json(read_json_file(path));
}

ModelConfig parse_config(const std::string& text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    die(std::string("cannot parse config: ") + e.what());
  }
  return checked_config_from_json(j);
}

void validate_config(const ModelConfig& cfg) {
  if (!is_finite(cfg.params.k) || !(cfg.params.k > 0.0)) die("params.k must be > 0");
  if (!is_finite(cfg.params.alpha) || !(cfg.params.alpha > 0.0)) die("params.alpha must be > 0");
  if (!is_finite(cfg.params.r_f)) die("params.r_f has NaN/Inf");

  if (!is_finite(cfg.agg.wb) || !(cfg.agg.wb > 0.0)) die("agg.wb must be > 0");
  if (!is_finite(cfg.agg.price_k) || !(cfg.agg.price_k >= 0.0)) die("agg.price_k must be >= 0");
  if (cfg.agg.defaults < 0 || cfg.agg.defaults_k < 0) die("agg default counters must be >= 0");

  if (!is_finite(cfg.bank.profitsB) || !is_finite(cfg.bank.loans) || !is_finite(cfg.bank.E)) die("bank has NaN/Inf");

  std::set<i32> ids;
  for (const auto& f : cfg.consumption_firms) {
    if (f.firm_id <= UNEMPLOYED) die("consumption firm_id must be > 0");
    if (!ids.insert(f.firm_id).second) die("duplicate firm_id " + std::to_string(f.firm_id));
    if (!is_finite(f.A) || !is_finite(f.liquidity) || !is_finite(f.deb) || !is_finite(f.PA) || !is_finite(f.K) || !is_finite(f.P) || !is_finite(f.Y_prev))
      die("consumption firm " + std::to_string(f.firm_id) + " has NaN/Inf");
    if (f.PA < 0.0 || f.K < 0.0 || f.deb < 0.0 || f.Y_prev < 0.0)
      die("consumption firm " + std::to_string(f.firm_id) + " has negative PA/K/deb/Y_prev");
  }
  for (const auto& f : cfg.capital_firms) {
    if (f.firm_id <= UNEMPLOYED) die("capital firm_id must be > 0");
    if (!ids.insert(f.firm_id).second) die("duplicate firm_id " + std::to_string(f.firm_id));
    if (!is_finite(f.A_k) || !is_finite(f.liquidity_k) || !is_finite(f.deb_k) || !is_finite(f.PA) || !is_finite(f.P_k) || !is_finite(f.Y_prev_k))
      die("capital firm " + std::to_string(f.firm_id) + " has NaN/Inf");
    if (f.PA < 0.0 || f.deb_k < 0.0 || f.Y_prev_k < 0.0)
      die("capital firm " + std::to_string(f.firm_id) + " has negative PA/deb_k/Y_prev_k");
  }

  for (const auto& wk : cfg.workers) {
    if (wk.Oc != UNEMPLOYED && ids.count(wk.Oc) == 0)
      die("worker " + std::to_string(wk.worker_id) + " employed by unknown firm " + std::to_string(wk.Oc));
    if (!is_finite(wk.w) || !(wk.w >= 0.0)) die("worker " + std::to_string(wk.worker_id) + " wage must be >= 0");
    if (wk.Oc == UNEMPLOYED && wk.w != 0.0) die("unemployed worker " + std::to_string(wk.worker_id) + " has a wage");
  }
}

ModelState init_model(const ModelConfig& cfg) {
  ModelState model = make_state(0, 0, 0);
  model.params = cfg.params;
  model.agg = cfg.agg;
  model.bank = cfg.bank;
  model.consumption_firms = cfg.consumption_firms;
  model.capital_firms = cfg.capital_firms;
  model.workers = cfg.workers;
  return model;
}

}
