#include "engine/rule_set.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace rule_engine {

void RuleSet::add(ConfiguredRule rule) {
  if (find(rule.id)) {
    throw std::runtime_error("[RuleSet] Duplicate rule ID: " + rule.id);
  }
  rules_.push_back(std::move(rule));
}

const ConfiguredRule *RuleSet::find(const std::string &id) const {
  for (const auto &rule : rules_) {
    if (rule.id == id) {
      return &rule;
    }
  }
  return nullptr;
}

std::vector<const ConfiguredRule *> RuleSet::ordered() const {
  std::vector<const ConfiguredRule *> out;
  out.reserve(rules_.size());
  for (const auto &rule : rules_) {
    if (rule.enabled) {
      out.push_back(&rule);
    }
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const ConfiguredRule *a, const ConfiguredRule *b) {
                     return a->priority > b->priority;
                   });
  return out;
}

RuleSetOutcome RuleSet::evaluate_all(const rule_dsl::Struct &context,
                                     std::size_t workers) const {
  const auto rules = ordered();
  std::vector<EvaluationResult> results(rules.size());

  if (workers <= 1 || rules.size() <= 1) {
    for (std::size_t i = 0; i < rules.size(); ++i) {
      results[i] = evaluate(rules[i]->logic, context);
    }
  } else {
    workers = std::min(workers, rules.size());
    std::atomic<std::size_t> next{0};
    std::vector<std::exception_ptr> errors(workers);

    auto work = [&](std::size_t slot) {
      try {
        for (std::size_t i = next.fetch_add(1); i < rules.size();
             i = next.fetch_add(1)) {
          results[i] = evaluate(rules[i]->logic, context);
        }
      } catch (...) {
        errors[slot] = std::current_exception();
      }
    };

    // The calling thread takes slot 0, so workers - 1 extra threads
    std::vector<std::thread> pool;
    pool.reserve(workers - 1);
    for (std::size_t w = 1; w < workers; ++w) {
      try {
        pool.emplace_back(work, w);
      } catch (const std::system_error &) {
        // Out of threads: the ones already running plus this thread finish
        // the remaining rules
        break;
      }
    }

    work(0);

    for (auto &t : pool) {
      t.join();
    }
    for (const auto &err : errors) {
      if (err) {
        std::rethrow_exception(err);
      }
    }
  }

  RuleSetOutcome out;
  out.outcomes.reserve(rules.size());
  for (std::size_t i = 0; i < rules.size(); ++i) {
    const auto &result = results[i];
    if (result.blocked) {
      out.blocked = true;
    }
    if (result.matched) {
      out.matched_rule_ids.push_back(rules[i]->id);
    }
    out.messages.insert(out.messages.end(), result.messages.begin(),
                        result.messages.end());
    out.outcomes.push_back(
        {rules[i]->id, rules[i]->priority, std::move(results[i])});
  }
  return out;
}

} // namespace rule_engine
