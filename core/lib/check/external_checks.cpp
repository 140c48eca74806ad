// hammer/check/external_checks.cpp - External check protocol implementation
//
#include "hammer/check/external_checks.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

#include "hammer/basic/error.hpp"
#include "hammer/basic/report_json.hpp"
#include "hammer/process/subprocess.hpp"

namespace hammer
{

std::vector<std::string> parse_check_list(std::string_view list)
{
  std::vector<std::string> out;
  while (!list.empty()) {
    const auto sep = list.find(':');
    const std::string_view item = list.substr(0, sep);
    if (!item.empty()) {
      out.emplace_back(item);
    }
    if (sep == std::string_view::npos) {
      break;
    }
    list.remove_prefix(sep + 1);
  }
  return out;
}

std::vector<std::string> registration_order(const CheckConfig & config)
{
  std::vector<std::string> order;
  for (const auto & check : config.checks) {
    if (config.excluded.count(check) == 0) {
      order.push_back(check);
    }
  }
  std::sort(order.begin(), order.end());
  order.erase(std::unique(order.begin(), order.end()), order.end());
  return order;
}

DiagnosticBundle builtin_notices(
  const std::vector<AttributeDescriptor> & attrs, const std::set<std::string> & excluded)
{
  DiagnosticBundle bundle;
  if (excluded.count(k_no_build_output_rule) != 0) {
    return bundle;
  }

  for (const auto & attr : attrs) {
    if (attr.artifact_path) {
      continue;
    }
    bundle.add(
      attr.name, ReportBuilder(k_no_build_output_rule, Severity::Notice)
                   .message(fmt::format(
                     "‘{}’ has not been built yet, checks that inspect build outputs were skipped.",
                     attr.name))
                   .without_link()
                   .build());
  }
  return bundle;
}

// ============================================================================
// ExternalCheckRunner
// ============================================================================

ExternalCheckRunner::ExternalCheckRunner(CheckConfig config, Trace & trace)
: config_(std::move(config)), order_(registration_order(config_)), trace_(trace)
{
}

unsigned ExternalCheckRunner::worker_count(size_t tasks) const
{
  unsigned jobs = config_.jobs;
  if (jobs == 0) {
    jobs = std::max(1u, std::thread::hardware_concurrency());
  }
  return static_cast<unsigned>(std::min<size_t>(jobs, tasks));
}

DiagnosticBundle ExternalCheckRunner::run_check(
  const std::string & check, const std::string & payload,
  const std::unordered_set<std::string> & known) const
{
  const auto executable = find_executable(check, config_.search_dirs);
  if (!executable) {
    throw PluginError(check, payload, "was not found in the check path or PATH");
  }

  ProcessOptions process;
  process.argv = {executable->string()};
  process.input = payload;
  process.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeout);

  trace_.log("running check {} ({})", check, executable->string());

  ProcessResult result;
  try {
    result = run_process(process);
  } catch (const std::system_error & e) {
    throw PluginError(check, payload, fmt::format("could not be started: {}", e.what()));
  }

  if (!result.success()) {
    throw PluginError(check, payload, result.describe_failure());
  }

  if (result.output.find_first_not_of(" \t\r\n") == std::string::npos) {
    trace_.log("check {} reported nothing", check);
    return {};
  }

  Json parsed;
  try {
    parsed = Json::parse(result.output);
  } catch (const Json::parse_error & e) {
    throw PluginError(check, payload, fmt::format("produced invalid JSON: {}", e.what()));
  }

  DiagnosticBundle bundle;
  try {
    bundle = decode_bundle(parsed);
  } catch (const DecodeError & e) {
    throw PluginError(check, payload, fmt::format("produced malformed reports: {}", e.what()));
  }

  for (const auto & entry : bundle) {
    if (known.count(entry.first) == 0) {
      throw PluginError(
        check, payload, fmt::format("reported on unknown attribute '{}'", entry.first));
    }
  }

  trace_.log("check {} reported {} diagnostic(s)", check, bundle.diagnostic_count());
  return bundle;
}

std::vector<CheckRun> ExternalCheckRunner::run(const std::vector<AttributeDescriptor> & attrs) const
{
  if (order_.empty()) {
    return {};
  }

  const std::string payload = to_json(attrs).dump();

  std::unordered_set<std::string> known;
  for (const auto & a : attrs) {
    known.insert(a.name);
  }

  const size_t n = order_.size();
  std::vector<std::optional<DiagnosticBundle>> results(n);
  std::vector<std::exception_ptr> errors(n);
  std::atomic<size_t> next{0};
  std::atomic<bool> failed{false};

  // Workers pull checks by index; each result lands in its registration slot
  const auto worker = [&]() {
    for (;;) {
      const size_t i = next.fetch_add(1);
      if (i >= n || failed.load()) {
        return;
      }
      try {
        results[i] = run_check(order_[i], payload, known);
      } catch (...) {
        errors[i] = std::current_exception();
        failed.store(true);
      }
    }
  };

  const unsigned workers = worker_count(n);
  trace_.log("running {} check(s) with {} worker(s)", n, workers);

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (unsigned w = 0; w < workers; ++w) {
    threads.emplace_back(worker);
  }
  for (auto & t : threads) {
    t.join();
  }

  for (const auto & error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }

  std::vector<CheckRun> runs;
  runs.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    runs.push_back(CheckRun{order_[i], std::move(*results[i])});
  }
  return runs;
}

}  // namespace hammer
