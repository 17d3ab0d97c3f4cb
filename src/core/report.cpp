#include "agrisim/core/report.h"

#include <algorithm>
#include <sstream>

#include "agrisim/util/strings.h"

namespace agrisim {
namespace {

std::string bool_text(bool b) { return b ? "true" : "false"; }

std::string inventory_summary(const std::map<std::string, int>& inv) {
  std::vector<std::string> parts;
  for (const auto& [id, units] : inv) parts.push_back(id + "=" + std::to_string(units));
  return parts.empty() ? std::string("none") : join(parts, ", ");
}

std::vector<std::string> quick_wins_for(const AppConfig& cfg, const YearReport& r) {
  std::vector<std::string> tips;
  const auto& prod = r.production;
  if (!prod.kegs_sufficient) {
    tips.push_back("Kegs are a bottleneck (fruit or wine left unprocessed). Add kegs or reduce tiles.");
  }
  if (prod.uses_per_cask < kMaxUsesPerVessel) {
    tips.push_back("Casks are underused. Stockpile base wine for Spring 1/Fall 1 or lower cask count.");
  }
  if (prod.totals.preserves_in_jars > 0) {
    tips.push_back("Preserves jars are still running at year end. Add jars or reduce jar input.");
  }
  if (prod.totals.dried_in_dehydrators > 0) {
    tips.push_back("Dehydrators are still running at year end. Add dehydrators or reduce dehydrator input.");
  }
  if (r.animal_profit.raw_animal_revenue > 0) {
    tips.push_back("Raw animal products sold. Add mayo machines/cheese presses/looms to increase value.");
  }
  if (r.animals.raw_truffles > 0 && cfg.oil_makers > 0) {
    tips.push_back("Truffles exceeded oil maker capacity. Add oil makers if you prefer truffle oil.");
  }
  if (cfg.bees.bee_houses > 0 && cfg.bees.flower_plan.empty() && cfg.bees.flower_base_price <= 0) {
    tips.push_back("Bee houses set to wild honey. Plant flowers or set a flower_plan for higher honey value.");
  }
  return tips;
}

json::Value int_map_json(const std::map<std::string, int>& m) {
  json::Object o;
  for (const auto& [k, v] : m) o[k] = v;
  return json::object(std::move(o));
}

} // namespace

std::vector<FruitUseAdvice> fruit_use_advice(const AppConfig& cfg) {
  std::vector<FruitUseAdvice> out;
  for (const auto& [fruit_id, trees] : total_tree_counts(cfg.fruit_trees)) {
    const auto values = per_fruit_processing_values(fruit_price_for(fruit_id, cfg.economy),
                                                    wine_price_for(fruit_id, cfg.economy), cfg.economy);
    std::vector<std::pair<std::string, int>> order(values.begin(), values.end());
    std::stable_sort(order.begin(), order.end(), [](const auto& a, const auto& b) { return a.second > b.second; });

    FruitUseAdvice a;
    a.fruit_id = fruit_id;
    a.trees = trees;
    a.best = order[0].first;
    a.best_value = order[0].second;
    a.next = order[1].first;
    a.next_value = order[1].second;
    a.raw_value = values.at("raw");
    out.push_back(std::move(a));
  }
  return out;
}

YearReport build_year_report(const AppConfig& cfg) {
  YearReport r;
  r.production = simulate_year(build_simulation_inputs(cfg));
  r.crop_profit = compute_profit(r.production.products, cfg.economy, cfg.growth.fertilizer);

  AnimalMachines machines;
  machines.mayo_machines = cfg.mayo_machines;
  machines.cheese_presses = cfg.cheese_presses;
  machines.looms = cfg.looms;
  machines.oil_makers = cfg.oil_makers;
  r.animals = simulate_animals(cfg.animals, cfg.simulation.max_days, machines, cfg.professions.foraging.gatherer,
                               cfg.professions.farming.shepherd);
  r.animal_profit = compute_animal_profit(r.animals, cfg.economy, cfg.professions.foraging.botanist,
                                          cfg.professions.farming.rancher);

  r.bees = simulate_bees(cfg.bees);
  r.honey_revenue = compute_honey_revenue(r.bees, cfg.economy, cfg.bees.flower_base_price);

  r.fruit_advice = fruit_use_advice(cfg);
  r.category_totals = build_category_totals(r.crop_profit, r.animal_profit, r.honey_revenue);

  const int other = r.animal_profit.total_revenue() + r.honey_revenue;
  r.total_revenue = r.crop_profit.total_revenue + other;
  r.total_profit = r.crop_profit.total_profit + other;
  r.quick_wins = quick_wins_for(cfg, r);
  return r;
}

std::string format_text_report(const AppConfig& cfg, const YearReport& r) {
  std::ostringstream ss;
  const auto& prod = r.production;

  ss << "tiles=" << cfg.tiles << " kegs=" << cfg.kegs << " casks=" << cfg.casks
     << " preserves_jars=" << cfg.preserves_jars << " dehydrators=" << cfg.dehydrators
     << " oil_makers=" << cfg.oil_makers << " mayo_machines=" << cfg.mayo_machines
     << " cheese_presses=" << cfg.cheese_presses << " looms=" << cfg.looms
     << " fertilizer=" << fertilizer_name(cfg.growth.fertilizer)
     << " agriculturist=" << bool_text(cfg.growth.agriculturist) << "\n";
  ss << "year_days=" << prod.days_simulated << " start_day_of_year=1 (year-round assumed="
     << bool_text(cfg.simulation.assume_year_round) << ")\n";
  ss << "fertilizer cadence: " << fertilizer_cadence_name(cfg.simulation.fertilizer_cadence) << "\n";
  ss << "cask priority: " << join(crop_priority(selected_crops(cfg)), " -> ") << " (two batch fills per year)\n\n";

  if (!cfg.starting_inventory.fruit.empty() || !cfg.starting_inventory.base_wine.empty()) {
    ss << "starting fruit: " << inventory_summary(cfg.starting_inventory.fruit) << "\n";
    ss << "starting base wine: " << inventory_summary(cfg.starting_inventory.base_wine) << "\n\n";
  }

  for (const auto& p : prod.products) {
    if (p.external) continue;
    const ProfitBreakdown* b = r.crop_profit.find(p.product_id);
    ss << p.product_id << ":\n";
    ss << "  fruit harvested (year): " << p.fruit_harvested << "\n";
    ss << "  base wine produced (year): " << p.base_goods_produced << "\n";
    ss << "  aged wine produced (year): " << p.base_goods_aged << "\n";
    ss << "  base wine sold (year): " << p.base_goods_sold << "\n";
    ss << "  unprocessed fruit (year end): " << p.fruit_unprocessed << "\n";
    ss << "  wine in kegs (year end): " << p.goods_fermenting << "\n";
    ss << "  jelly produced (year): " << p.preserves_produced << "\n";
    ss << "  dried fruit produced (year): " << p.dried_produced << "\n";
    ss << "  jelly in jars (year end): " << p.preserves_in_jars << "\n";
    ss << "  dried fruit in dehydrators (year end): " << p.dried_in_dehydrators << "\n";
    ss << "  seed units used: " << p.seed_units << "\n";
    ss << "  fertilizer units used: " << p.fertilizer_units << "\n";
    if (b) {
      ss << "  fruit revenue: " << b->fruit_revenue << "\n";
      ss << "  base wine revenue: " << b->base_wine_revenue << "\n";
      ss << "  aged wine revenue: " << b->aged_wine_revenue << "\n";
      ss << "  jelly revenue: " << b->jelly_revenue << "\n";
      ss << "  dried fruit revenue: " << b->dried_fruit_revenue << "\n";
      ss << "  seed cost: " << b->seed_cost << "\n";
      ss << "  fertilizer cost: " << b->fertilizer_cost << "\n";
      ss << "  net profit: " << b->net_profit() << "\n";
    }
    ss << "\n";
  }

  if (!cfg.animals.empty()) {
    const auto& a = r.animal_profit;
    ss << "animals:\n";
    ss << "  cheese revenue: " << a.cheese_revenue << "\n";
    ss << "  mayo revenue: " << a.mayo_revenue << "\n";
    ss << "  cloth revenue: " << a.cloth_revenue << "\n";
    ss << "  truffle oil revenue: " << a.truffle_oil_revenue << "\n";
    ss << "  raw truffles revenue: " << a.raw_truffle_revenue << "\n";
    ss << "  raw animal products revenue: " << a.raw_animal_revenue << "\n\n";
  }

  if (cfg.bees.bee_houses > 0) {
    ss << "bees:\n";
    ss << "  honey produced: " << r.bees.honey_total << "\n";
    ss << "  honey revenue: " << r.honey_revenue << "\n\n";
  }

  if (!r.fruit_advice.empty()) {
    ss << "fruit trees:\n";
    const std::pair<const char*, const std::map<std::string, int>*> scopes[] = {
        {"greenhouse", &cfg.fruit_trees.greenhouse},
        {"outdoors", &cfg.fruit_trees.outdoors},
        {"always", &cfg.fruit_trees.always},
    };
    for (const auto& [scope, counts] : scopes) {
      if (!counts->empty()) ss << "  " << scope << ": " << inventory_summary(*counts) << "\n";
    }
    for (const auto& p : prod.products) {
      if (!p.external) continue;
      ss << "  " << p.product_id << ": fruit=" << p.fruit_harvested << " wine=" << p.base_goods_produced
         << " aged=" << p.base_goods_aged << " jelly=" << p.preserves_produced << " dried=" << p.dried_produced
         << " raw=" << p.fruit_unprocessed << "\n";
    }
    ss << "  per-fruit best use (per fruit, using current prices):\n";
    for (const auto& a : r.fruit_advice) {
      ss << "    " << a.fruit_id << " (" << a.trees << " trees): best=" << a.best << " (" << a.best_value
         << "), next=" << a.next << " (" << a.next_value << "), raw=" << a.raw_value << "\n";
    }
    ss << "\n";
  }

  ss << "kegs sufficient for full conversion: " << bool_text(prod.kegs_sufficient) << "\n";
  if (cfg.economy.cask_full_batch_required) {
    ss << "full cask batch met (need " << cfg.casks << " on each batch day): " << bool_text(prod.full_batch_met)
       << "\n";
    if (!prod.full_batch_met && !cfg.economy.casks_with_walkways) {
      ss << "note: set economy.casks_with_walkways to model walkway losses\n";
    }
  }
  ss << "casks used for aging: " << prod.casks_effective << "\n";
  ss << "cask uses per cask (max 2.00): " << format_fixed(prod.uses_per_cask, 2) << "\n";
  ss << "total base wine sold: " << prod.totals.base_goods_sold << "\n";
  ss << "total aged wine produced: " << prod.totals.base_goods_aged << "\n";
  ss << "total jelly produced: " << prod.totals.preserves_produced << "\n";
  ss << "total dried fruit produced: " << prod.totals.dried_produced << "\n";
  ss << "total fruit unprocessed (year end): " << prod.totals.fruit_unprocessed << "\n";
  ss << "total wine in kegs (year end): " << prod.totals.goods_fermenting << "\n";
  ss << "total jelly in jars (year end): " << prod.totals.preserves_in_jars << "\n";
  ss << "total dried fruit in dehydrators (year end): " << prod.totals.dried_in_dehydrators << "\n";
  ss << "total revenue (year): " << r.total_revenue << "\n";
  ss << "total seed cost (year): " << r.crop_profit.total_seed_cost << "\n";
  ss << "total fertilizer cost (year): " << r.crop_profit.total_fertilizer_cost << "\n";
  ss << "TOTAL PROFIT (year): " << r.total_profit << "\n";

  if (!r.quick_wins.empty()) {
    ss << "\nquick wins:\n";
    for (const auto& tip : r.quick_wins) ss << "  - " << tip << "\n";
  }
  return ss.str();
}

json::Value report_to_json(const AppConfig& cfg, const YearReport& r, bool include_trace) {
  const auto& prod = r.production;

  json::Object root;
  root["crop"] = crop_selection_name(cfg.crop);
  root["days"] = prod.days_simulated;
  root["fertilizer"] = fertilizer_name(cfg.growth.fertilizer);
  root["fertilizer_cadence"] = fertilizer_cadence_name(cfg.simulation.fertilizer_cadence);

  json::Array products;
  for (const auto& p : prod.products) {
    json::Object o;
    o["id"] = p.product_id;
    o["external"] = p.external;
    o["fruit_harvested"] = p.fruit_harvested;
    o["fruit_consumed"] = p.fruit_consumed;
    o["fruit_unprocessed"] = p.fruit_unprocessed;
    o["harvests"] = p.harvests;
    o["base_wine_produced"] = p.base_goods_produced;
    o["aged_wine_produced"] = p.base_goods_aged;
    o["base_wine_sold"] = p.base_goods_sold;
    o["wine_in_kegs_end"] = p.goods_fermenting;
    o["jelly_produced"] = p.preserves_produced;
    o["jelly_in_jars_end"] = p.preserves_in_jars;
    o["dried_fruit_produced"] = p.dried_produced;
    o["dried_fruit_in_dehydrators_end"] = p.dried_in_dehydrators;
    o["seed_units_used"] = p.seed_units;
    o["fertilizer_units_used"] = p.fertilizer_units;
    if (const ProfitBreakdown* b = r.crop_profit.find(p.product_id)) {
      json::Object pr;
      pr["fruit_revenue"] = b->fruit_revenue;
      pr["base_wine_revenue"] = b->base_wine_revenue;
      pr["aged_wine_revenue"] = b->aged_wine_revenue;
      pr["jelly_revenue"] = b->jelly_revenue;
      pr["dried_fruit_revenue"] = b->dried_fruit_revenue;
      pr["seed_cost"] = b->seed_cost;
      pr["fertilizer_cost"] = b->fertilizer_cost;
      pr["net_profit"] = b->net_profit();
      o["profit"] = json::object(std::move(pr));
    }
    products.push_back(json::object(std::move(o)));
  }
  root["products"] = json::array(std::move(products));

  json::Object aging;
  aging["casks"] = prod.aging.vessels;
  aging["casks_effective"] = prod.casks_effective;
  aging["full_batch_met"] = prod.full_batch_met;
  aging["uses_per_cask"] = prod.uses_per_cask;
  aging["filled"] = json::array({prod.aging.filled[0], prod.aging.filled[1]});
  root["aging"] = json::object(std::move(aging));
  root["kegs_sufficient"] = prod.kegs_sufficient;

  json::Object animals;
  animals["cheese_revenue"] = r.animal_profit.cheese_revenue;
  animals["mayo_revenue"] = r.animal_profit.mayo_revenue;
  animals["cloth_revenue"] = r.animal_profit.cloth_revenue;
  animals["truffle_oil_revenue"] = r.animal_profit.truffle_oil_revenue;
  animals["raw_truffle_revenue"] = r.animal_profit.raw_truffle_revenue;
  animals["raw_animal_revenue"] = r.animal_profit.raw_animal_revenue;
  animals["total_revenue"] = r.animal_profit.total_revenue();
  root["animals"] = json::object(std::move(animals));

  json::Object bees;
  bees["honey_total"] = r.bees.honey_total;
  bees["honey_revenue"] = r.honey_revenue;
  root["bees"] = json::object(std::move(bees));

  root["categories"] = int_map_json(r.category_totals);

  json::Object totals;
  totals["revenue"] = r.total_revenue;
  totals["seed_cost"] = r.crop_profit.total_seed_cost;
  totals["fertilizer_cost"] = r.crop_profit.total_fertilizer_cost;
  totals["profit"] = r.total_profit;
  totals["fruit_unprocessed"] = prod.totals.fruit_unprocessed;
  totals["aged_wine_produced"] = prod.totals.base_goods_aged;
  totals["base_wine_sold"] = prod.totals.base_goods_sold;
  root["totals"] = json::object(std::move(totals));

  json::Array tips;
  for (const auto& t : r.quick_wins) tips.push_back(t);
  root["quick_wins"] = json::array(std::move(tips));

  if (include_trace) {
    json::Array trace;
    for (const auto& d : prod.trace) {
      json::Object o;
      o["day"] = d.day;
      o["season"] = season_name(d.season);
      o["harvested"] = d.harvested;
      o["external_fruit"] = d.external_fruit;
      o["fruit_consumed"] = d.fruit_consumed;
      o["inventory"] = d.inventory;
      o["kegs_busy"] = d.kegs_busy;
      o["jars_busy"] = d.jars_busy;
      o["dehydrators_busy"] = d.dehydrators_busy;
      o["aged"] = d.aged;
      trace.push_back(json::object(std::move(o)));
    }
    root["trace"] = json::array(std::move(trace));
  }
  return json::object(std::move(root));
}

} // namespace agrisim
