// swarmctl - command-line front end for the swarm memory core.
//
//   swarmctl [--config <path>] <command> [options]
//
// Every command prints one JSON document on stdout. A failure prints the
// StandardError wire shape and exits with 2; a usage error exits with 1.

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "swarm/config.hpp"
#include "swarm/errors.hpp"
#include "swarm/health_monitor.hpp"
#include "swarm/jsonlite.hpp"
#include "swarm/memory_service.hpp"
#include "swarm/observability.hpp"
#include "swarm/registry.hpp"
#include "swarm/retrieval.hpp"
#include "swarm/router.hpp"
#include "swarm/store.hpp"
#include "swarm/transport.hpp"
#include "swarm/version.hpp"

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitError = 2;

const char* kUsage =
    "usage: swarmctl [--config <path>] <command> [options]\n"
    "  put      --content <text> [--id <id>] [--owner <o>] [--theme <t>]... [--emotion <name>=<v>]...\n"
    "  get      --id <id> [--no-reference]\n"
    "  delete   --id <id>\n"
    "  page     [--page <n>] [--page-size <n>] [--sort <key>]\n"
    "  search   [--query <q>] [--theme <t>]... [--emotion <name> --min <v> --max <v>]\n"
    "           [--owner <o>] [--after <ms>] [--before <ms>] [--page <n>] [--page-size <n>]\n"
    "  backup | backups | restore --backup <id> | prune --older-than-ms <ms>\n"
    "  config | stats | version\n"
    "  simulate [--workers <n>] [--requests <n>] [--partition <instance-id>]...\n";

struct Args {
  std::string                                     cmd;
  std::map<std::string, std::vector<std::string>> opts;
  std::vector<std::string>                        flags;

  std::string get(const std::string& name, const std::string& def = "") const {
    auto it = opts.find(name);
    return it == opts.end() || it->second.empty() ? def : it->second.back();
  }
  std::vector<std::string> all(const std::string& name) const {
    auto it = opts.find(name);
    return it == opts.end() ? std::vector<std::string>{} : it->second;
  }
  bool has(const std::string& name) const {
    for (const auto& f : flags) {
      if (f == name) return true;
    }
    return opts.count(name) != 0;
  }
};

// Options take a value unless listed as a bare flag.
Args parse_args(int argc, char** argv) {
  static const char* kBareFlags[] = {"--no-reference"};
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s.rfind("--", 0) != 0) {
      if (a.cmd.empty()) a.cmd = s;
      continue;
    }
    bool bare = false;
    for (const char* f : kBareFlags) bare = bare || s == f;
    if (bare || i + 1 >= argc) {
      a.flags.push_back(s);
    } else {
      a.opts[s].push_back(argv[++i]);
    }
  }
  return a;
}

int fail(const swarm::StandardError& e) {
  std::cout << e.to_json() << "\n";
  return kExitError;
}

int usage_error(const std::string& msg) {
  std::cerr << "swarmctl: " << msg << "\n" << kUsage;
  return kExitUsage;
}

std::optional<uint64_t> parse_u64(const std::string& s) {
  if (s.empty() || s.size() > 19) return std::nullopt;
  uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + static_cast<uint64_t>(c - '0');
  }
  return v;
}

std::optional<double> parse_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (!end || *end != '\0') return std::nullopt;
  return v;
}

swarm::Result<uint64_t> numeric(const Args& a, const std::string& name, uint64_t def) {
  const std::string raw = a.get(name);
  if (raw.empty()) return def;
  auto v = parse_u64(raw);
  if (!v) {
    return swarm::make_error(swarm::ErrorKind::invalid_input, name + " must be a non-negative integer",
                             "", {{"option", name}, {"value", raw}});
  }
  return *v;
}

swarm::Result<uint32_t> paging(const Args& a, const std::string& name, uint32_t def) {
  auto v = numeric(a, name, def);
  if (!v) return v.error();
  if (v.value() > UINT32_MAX) {
    return swarm::make_error(swarm::ErrorKind::invalid_input, name + " is out of range", "",
                             {{"option", name}});
  }
  return static_cast<uint32_t>(v.value());
}

int print_page(const swarm::Result<swarm::Page>& page) {
  if (!page) return fail(page.error());
  std::cout << page.value().to_json() << "\n";
  return 0;
}

// ---------------------------------------------------------------------------
// simulate - an in-process swarm of memory workers behind the router
// ---------------------------------------------------------------------------
int run_simulation(const swarm::SwarmConfig& cfg, const Args& args) {
  using namespace swarm;
  auto workers = numeric(args, "--workers", 3);
  if (!workers) return fail(workers.error());
  auto requests = numeric(args, "--requests", 20);
  if (!requests) return fail(requests.error());
  if (workers.value() == 0) return usage_error("--workers must be at least 1");

  auto clock = system_clock();
  auto store = MemoryStore::open(cfg, clock);
  if (!store) return fail(store.error());
  auto engine    = std::make_shared<RetrievalEngine>(store.value(), cfg, clock);
  auto registry  = std::make_shared<ServiceRegistry>(cfg, clock);
  auto transport = std::make_shared<InProcessTransport>();

  for (uint64_t i = 1; i <= workers.value(); ++i) {
    ServiceInstance inst;
    inst.id           = "memory-" + std::to_string(i);
    inst.role         = "memory";
    inst.address      = "inproc://" + inst.id;
    inst.capabilities = {"put", "get", "page", "search", "delete"};
    auto service = std::make_shared<MemoryService>(engine, inst.id);
    transport->bind(inst.address, make_memory_handler(service), make_memory_probe(service));
    if (Status st = registry->register_instance(inst)) return fail(*st);
    if (Status st = registry->heartbeat(inst.id, HealthState::healthy)) return fail(*st);
  }
  for (const auto& id : args.all("--partition")) {
    auto inst = registry->find(id);
    if (!inst) {
      return fail(make_error(ErrorKind::resource_not_found, "no such simulated instance", "",
                             {{"id", id}}));
    }
    transport->set_reachable(inst->address, false);
  }

  RequestRouter router(registry, transport);
  HealthMonitor monitor(registry, transport);
  monitor.add_maintenance([engine] { engine->purge_expired(); });

  std::map<std::string, uint64_t> served;
  std::map<std::string, uint64_t> failures;
  uint64_t total_attempts = 0;
  for (uint64_t n = 0; n < requests.value(); ++n) {
    jsonlite::Object req;
    if (n % 2 == 0) {
      jsonlite::Object record;
      record["content"] = "simulated memory " + std::to_string(n);
      record["themes"]  = jsonlite::Array{jsonlite::Value("simulation")};
      req["op"]     = "put";
      req["record"] = std::move(record);
    } else {
      req["op"]        = "search";
      req["query"]     = "simulated";
      req["page_size"] = 5;
    }
    auto res = router.route("memory", jsonlite::to_json(req));
    if (res) {
      ++served[res.value().instance_id];
      total_attempts += res.value().attempts;
    } else {
      ++failures[to_string(res.error().kind)];
    }
    // Probe and sweep between requests.
    if (n % 5 == 4) monitor.run_once();
  }

  std::ostringstream o;
  o << "{\"workers\":" << workers.value() << ",\"requests\":" << requests.value()
    << ",\"attempts\":" << total_attempts << ",\"served_by\":{";
  bool first = true;
  for (const auto& [id, count] : served) {
    o << (first ? "" : ",") << "\"" << jsonlite::escape(id) << "\":" << count;
    first = false;
  }
  o << "},\"failures\":{";
  first = true;
  for (const auto& [kind, count] : failures) {
    o << (first ? "" : ",") << "\"" << kind << "\":" << count;
    first = false;
  }
  o << "},\"circuits\":" << router.circuits_to_json() << ",\"registry\":" << registry->to_json()
    << ",\"caches\":" << engine->stats_to_json() << "}";
  std::cout << o.str() << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  using namespace swarm;
  const Args args = parse_args(argc, argv);
  if (args.cmd.empty() || args.cmd == "help") {
    std::cerr << kUsage;
    return args.cmd.empty() ? kExitUsage : 0;
  }

  if (args.cmd == "version") {
    std::cout << version::manifest_to_json(version::current_manifest()) << "\n";
    return 0;
  }

  auto loaded = load_config(args.get("--config"));
  if (!loaded) return fail(loaded.error());
  const SwarmConfig cfg = loaded.value();

  if (args.cmd == "config") {
    std::cout << cfg.to_json() << "\n";
    return 0;
  }
  if (args.cmd == "simulate") return run_simulation(cfg, args);

  auto opened = MemoryStore::open(cfg);
  if (!opened) return fail(opened.error());
  std::shared_ptr<MemoryStore> store = opened.value();
  RetrievalEngine engine(store, cfg);
  const std::string cid = new_correlation_id();

  if (args.cmd == "put") {
    MemoryRecord rec;
    rec.id      = args.get("--id");
    rec.content = args.get("--content");
    rec.owner   = args.get("--owner");
    for (const auto& t : args.all("--theme")) rec.themes.insert(t);
    for (const auto& e : args.all("--emotion")) {
      const size_t eq = e.find('=');
      auto v = eq == std::string::npos ? std::nullopt : parse_double(e.substr(eq + 1));
      if (!v) return usage_error("--emotion expects <name>=<number>, got '" + e + "'");
      rec.emotions[e.substr(0, eq)] = *v;
    }
    auto id = engine.put(std::move(rec), cid);
    if (!id) return fail(id.error());
    std::cout << "{\"correlationId\":\"" << cid << "\",\"id\":\"" << jsonlite::escape(id.value())
              << "\"}\n";
    return 0;
  }

  if (args.cmd == "get") {
    if (args.get("--id").empty()) return usage_error("get needs --id");
    auto view = engine.get(args.get("--id"), !args.has("--no-reference"), cid);
    if (!view) return fail(view.error());
    std::cout << view.value().to_json() << "\n";
    return 0;
  }

  if (args.cmd == "delete") {
    if (args.get("--id").empty()) return usage_error("delete needs --id");
    if (Status st = engine.remove(args.get("--id"), cid)) return fail(*st);
    std::cout << "{\"deleted\":\"" << jsonlite::escape(args.get("--id")) << "\"}\n";
    return 0;
  }

  if (args.cmd == "page" || args.cmd == "search") {
    auto page = paging(args, "--page", 1);
    if (!page) return fail(page.error());
    auto size = paging(args, "--page-size", 20);
    if (!size) return fail(size.error());

    if (args.cmd == "page") {
      auto sort = sort_key_from_string(args.get("--sort", "created_desc"));
      if (!sort) return usage_error("unknown sort key '" + args.get("--sort") + "'");
      return print_page(engine.get_page(page.value(), size.value(), *sort, cid));
    }

    SearchFilters filters;
    for (const auto& t : args.all("--theme")) filters.themes.insert(t);
    filters.owner   = args.get("--owner");
    filters.emotion = args.get("--emotion");
    for (const auto& [flag, field] : {std::make_pair("--min", &filters.emotion_min),
                                      std::make_pair("--max", &filters.emotion_max)}) {
      if (args.get(flag).empty()) continue;
      auto v = parse_double(args.get(flag));
      if (!v) return usage_error(std::string(flag) + " expects a number");
      *field = *v;
    }
    auto after = numeric(args, "--after", 0);
    if (!after) return fail(after.error());
    auto before = numeric(args, "--before", 0);
    if (!before) return fail(before.error());
    filters.created_after_unix_ms  = after.value();
    filters.created_before_unix_ms = before.value();
    return print_page(engine.search(args.get("--query"), filters, page.value(), size.value(), cid));
  }

  if (args.cmd == "backup") {
    auto info = store->backup(cid);
    if (!info) return fail(info.error());
    std::cout << info.value().to_json() << "\n";
    return 0;
  }

  if (args.cmd == "backups") {
    std::cout << "[";
    bool first = true;
    for (const auto& b : store->list_backups()) {
      std::cout << (first ? "" : ",") << b.to_json();
      first = false;
    }
    std::cout << "]\n";
    return 0;
  }

  if (args.cmd == "restore") {
    if (args.get("--backup").empty()) return usage_error("restore needs --backup");
    auto n = store->restore(args.get("--backup"), cid);
    if (!n) return fail(n.error());
    std::cout << "{\"backup\":\"" << jsonlite::escape(args.get("--backup"))
              << "\",\"restored\":" << n.value() << "}\n";
    return 0;
  }

  if (args.cmd == "prune") {
    auto age = numeric(args, "--older-than-ms", 0);
    if (!age) return fail(age.error());
    if (args.get("--older-than-ms").empty()) return usage_error("prune needs --older-than-ms");
    auto removed = store->prune_older_than(age.value(), cid);
    if (!removed) return fail(removed.error());
    std::cout << "{\"removed\":[";
    for (size_t i = 0; i < removed.value().size(); ++i) {
      std::cout << (i ? "," : "") << "\"" << jsonlite::escape(removed.value()[i]) << "\"";
    }
    std::cout << "]}\n";
    return 0;
  }

  if (args.cmd == "stats") {
    std::cout << "{\"caches\":" << engine.stats_to_json()
              << ",\"records\":" << store->list_ids().size()
              << ",\"backups\":" << store->list_backups().size()
              << ",\"process\":" << global_swarm_stats().to_json() << "}\n";
    return 0;
  }

  return usage_error("unknown command '" + args.cmd + "'");
}
