#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/address/address_parser.hpp"
#include "core/api/browser_api.hpp"
#include "core/catalog/example_catalog.hpp"
#include "core/config/launch_options.hpp"
#include "core/history/history_resolver.hpp"
#include "core/history/local_history_store.hpp"
#include "core/model/app_meta.hpp"
#include "core/navigation/navigation_session.hpp"
#include "core/navigation/resolve_worker.hpp"
#include "core/navigation/startup_handoff.hpp"
#include "core/site/site_map.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"
#include "core/util/log.hpp"

namespace {

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "permaweb-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

// identifier -> number of published versions; content roots are "<id>@<version>".
class ScriptedHistoryStore final : public permaweb::IHistoryStore {
public:
  permaweb::BoundsResult lookup_bounds(std::string_view identifier) override {
    std::lock_guard lock(mutex_);
    if (offline_) {
      return permaweb::BoundsResult::failure(permaweb::ResolveError::Unavailable, "offline");
    }
    const auto it = histories_.find(std::string{identifier});
    if (it == histories_.end()) {
      return permaweb::BoundsResult::failure(permaweb::ResolveError::NotFound, "unknown");
    }
    return permaweb::BoundsResult::success({.min_version = 1, .max_version = it->second});
  }

  permaweb::SnapshotResult fetch_snapshot(std::string_view identifier, std::uint32_t version) override {
    std::lock_guard lock(mutex_);
    ++fetches_;
    if (offline_) {
      return permaweb::SnapshotResult::failure(permaweb::ResolveError::Unavailable, "offline");
    }
    return permaweb::SnapshotResult::success(
        {.version = version, .content_root = std::string{identifier} + "@" + std::to_string(version)});
  }

  void set_versions(const std::string& identifier, std::uint32_t count) {
    std::lock_guard lock(mutex_);
    histories_[identifier] = count;
  }

  void set_offline(bool offline) {
    std::lock_guard lock(mutex_);
    offline_ = offline;
  }

  int fetches() const {
    std::lock_guard lock(mutex_);
    return fetches_;
  }

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::uint32_t> histories_;
  bool offline_ = false;
  int fetches_ = 0;
};

// Holds every lookup until release() so tests can control completion timing.
class GatedHistoryStore final : public permaweb::IHistoryStore {
public:
  permaweb::BoundsResult lookup_bounds(std::string_view identifier) override {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]() { return released_; });
    return inner_.lookup_bounds(identifier);
  }

  permaweb::SnapshotResult fetch_snapshot(std::string_view identifier, std::uint32_t version) override {
    return inner_.fetch_snapshot(identifier, version);
  }

  void release() {
    {
      std::lock_guard lock(mutex_);
      released_ = true;
    }
    cv_.notify_all();
  }

  ScriptedHistoryStore& inner() { return inner_; }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool released_ = false;
  ScriptedHistoryStore inner_;
};

class RecordingViewer final : public permaweb::IContentViewer {
public:
  void display(std::string_view content_root, std::string_view canonical_address) override {
    displays.emplace_back(std::string{content_root}, std::string{canonical_address});
  }

  std::vector<std::pair<std::string, std::string>> displays;
};

permaweb::ResolveTicket require_ticket(const std::optional<permaweb::ResolveTicket>& ticket) {
  assert(ticket.has_value());
  return *ticket;
}

void run_ticket(permaweb::NavigationSession& session, permaweb::HistoryResolver& resolver,
                const permaweb::ResolveTicket& ticket) {
  session.resolve_complete(ticket.request_id, resolver.resolve(ticket.identifier, ticket.requested_version));
}

template <typename Predicate>
bool wait_until(permaweb::BrowserApi& api, Predicate done) {
  for (int i = 0; i < 100; ++i) {
    api.wait_and_tick(50);
    if (done()) {
      return true;
    }
  }
  return false;
}

void test_address_parser() {
  auto parsed = permaweb::parse_address("awx://abc");
  assert(parsed.ok);
  assert(parsed.address.scheme == "awx");
  assert(parsed.address.identifier == "abc");
  assert(!parsed.address.requested_version.has_value());
  assert(parsed.address.resource_path == "/");

  parsed = permaweb::parse_address("abc");
  assert(parsed.ok);
  assert(parsed.address.identifier == "abc");

  parsed = permaweb::parse_address("  AWX://abc/docs/page.html?v=3#top ");
  assert(parsed.ok);
  assert(parsed.address.scheme == "awx");
  assert(parsed.address.identifier == "abc");
  assert(parsed.address.requested_version == 3U);
  assert(parsed.address.resource_path == "/docs/page.html");

  assert(!permaweb::parse_address("awx://abc?v=0").address.requested_version.has_value());
  assert(permaweb::parse_address("awx://abc?v=0").ok);
  assert(permaweb::parse_address("awx://abc?v=").ok);
  assert(permaweb::parse_address("awx://abc?lang=en&v=2&v=5").address.requested_version == 5U);
  assert(permaweb::parse_address("awx://abc?lang=en").ok);

  parsed = permaweb::parse_address("awx://abc?v=-1");
  assert(!parsed.ok);
  assert(parsed.error == permaweb::ParseError::InvalidVersion);
  assert(permaweb::parse_address("awx://abc?v=two").error == permaweb::ParseError::InvalidVersion);
  assert(permaweb::parse_address("awx://abc?v=4294967296").error == permaweb::ParseError::InvalidVersion);
  assert(permaweb::parse_address("awx://abc?v=4294967295").address.requested_version == 4294967295U);

  assert(permaweb::parse_address("").error == permaweb::ParseError::EmptyIdentifier);
  assert(permaweb::parse_address("   ").error == permaweb::ParseError::EmptyIdentifier);
  assert(permaweb::parse_address("awx://").error == permaweb::ParseError::EmptyIdentifier);
  assert(permaweb::parse_address("awx:///index.html").error == permaweb::ParseError::EmptyIdentifier);
  assert(permaweb::parse_address("awx://?v=2").error == permaweb::ParseError::EmptyIdentifier);

  parsed = permaweb::parse_address("https://abc");
  assert(!parsed.ok);
  assert(parsed.error == permaweb::ParseError::UnsupportedScheme);
}

void test_format_and_canonical_address() {
  const auto parsed = permaweb::parse_address("awx://abc/blog/post.html?v=2");
  assert(parsed.ok);
  assert(permaweb::format_address(parsed.address) == "awx://abc/blog/post.html?v=2");

  const auto reparsed = permaweb::parse_address(permaweb::format_address(parsed.address));
  assert(reparsed.ok);
  assert(reparsed.address == parsed.address);

  const auto latest = permaweb::parse_address("abc");
  assert(permaweb::format_address(latest.address) == "awx://abc/");
  assert(permaweb::canonical_address(latest.address, 5) == "awx://abc/?v=5");
  assert(permaweb::canonical_address(parsed.address, 1) == "awx://abc/blog/post.html?v=1");
}

void test_resolver_scenario() {
  ScriptedHistoryStore store;
  store.set_versions("abc", 5);
  permaweb::HistoryResolver resolver(store);

  auto resolved = resolver.resolve("abc", std::nullopt);
  assert(resolved.ok);
  assert(resolved.snapshot.version == 5);
  assert(resolved.bounds.max_version == 5);
  assert(resolved.snapshot.content_root == "abc@5");

  resolved = resolver.resolve("abc", 2);
  assert(resolved.ok);
  assert(resolved.snapshot.version == 2);

  resolved = resolver.resolve("abc", 9);
  assert(resolved.ok);
  assert(resolved.snapshot.version == 5);

  for (std::uint32_t requested = 1; requested <= 5; ++requested) {
    assert(resolver.resolve("abc", requested).snapshot.version == requested);
  }
}

void test_resolver_errors() {
  ScriptedHistoryStore store;
  store.set_versions("abc", 5);
  store.set_versions("empty", 0);
  permaweb::HistoryResolver resolver(store);

  auto resolved = resolver.resolve("unknown-id", std::nullopt);
  assert(!resolved.ok);
  assert(resolved.error == permaweb::ResolveError::NotFound);

  resolved = resolver.resolve("abc", 0);
  assert(!resolved.ok);
  assert(resolved.error == permaweb::ResolveError::InvalidVersion);

  resolved = resolver.resolve("empty", std::nullopt);
  assert(!resolved.ok);
  assert(resolved.error == permaweb::ResolveError::NotFound);

  assert(resolver.resolve("", std::nullopt).error == permaweb::ResolveError::NotFound);

  store.set_offline(true);
  resolved = resolver.resolve("abc", std::nullopt);
  assert(!resolved.ok);
  assert(resolved.error == permaweb::ResolveError::Unavailable);
  assert(permaweb::is_retryable(resolved.error));
  assert(!permaweb::is_retryable(permaweb::ResolveError::NotFound));

  store.set_offline(false);
  assert(resolver.resolve("abc", std::nullopt).ok);
}

void test_resolver_cache_tracks_latest() {
  ScriptedHistoryStore store;
  store.set_versions("abc", 5);
  permaweb::HistoryResolver resolver(store);

  const auto first = resolver.resolve("abc", 3);
  const auto second = resolver.resolve("abc", 3);
  assert(first.snapshot == second.snapshot);
  assert(store.fetches() == 1);
  assert(resolver.fetch_count() == 1);
  assert(resolver.cached_snapshots() == 1);

  store.set_versions("abc", 6);
  const auto latest = resolver.resolve("abc", std::nullopt);
  assert(latest.snapshot.version == 6);
  assert(latest.bounds.max_version == 6);
  assert(store.fetches() == 2);

  resolver.clear_cache();
  assert(resolver.cached_snapshots() == 0);
  assert(resolver.resolve("abc", 3).snapshot == first.snapshot);
  assert(store.fetches() == 3);
}

void test_resolver_cache_evicts_oldest() {
  ScriptedHistoryStore store;
  store.set_versions("abc", 5);
  permaweb::HistoryResolver resolver(store, 2);

  for (std::uint32_t version = 1; version <= 3; ++version) {
    assert(resolver.resolve("abc", version).ok);
  }
  assert(resolver.cached_snapshots() == 2);
  assert(store.fetches() == 3);

  assert(resolver.resolve("abc", 3).ok);
  assert(store.fetches() == 3);
  assert(resolver.resolve("abc", 1).snapshot.content_root == "abc@1");
  assert(store.fetches() == 4);
  assert(resolver.cached_snapshots() == 2);
}

void test_session_navigation_lifecycle() {
  ScriptedHistoryStore store;
  store.set_versions("abc", 5);
  permaweb::HistoryResolver resolver(store);
  RecordingViewer viewer;
  permaweb::NavigationSession session(viewer);

  assert(session.state() == permaweb::NavigationState::Idle);
  assert(!session.view_state().version_enabled);

  const auto ticket = require_ticket(session.navigate("awx://abc", 0));
  assert(ticket.request_id == 1);
  assert(ticket.identifier == "abc");
  assert(!ticket.requested_version.has_value());
  assert(session.state() == permaweb::NavigationState::Resolving);
  assert(session.status().request_id == 1);
  assert(viewer.displays.empty());

  run_ticket(session, resolver, ticket);
  assert(session.state() == permaweb::NavigationState::Loaded);
  assert(session.resolved_version() == 5);
  assert(session.max_version() == 5);
  assert(viewer.displays.size() == 1);
  assert(viewer.displays.front().first == "abc@5");
  assert(viewer.displays.front().second == "awx://abc/?v=5");
  assert(session.address_text() == "awx://abc/?v=5");

  auto view = session.view_state();
  assert(!view.version_enabled);

  session.viewer_reported_loaded();
  assert(session.state() == permaweb::NavigationState::Loaded);
  view = session.view_state();
  assert(view.version_enabled);
  assert(view.version_value == 5);
  assert(view.version_max == 5);

  const auto older = require_ticket(session.version_field_submitted(2));
  assert(older.request_id == 2);
  assert(older.requested_version == 2U);
  assert(!session.view_state().version_enabled);
  run_ticket(session, resolver, older);
  assert(session.resolved_version() == 2);
  assert(viewer.displays.back().second == "awx://abc/?v=2");
}

void test_session_url_version_wins() {
  RecordingViewer viewer;
  permaweb::NavigationSession session(viewer);

  auto ticket = require_ticket(session.navigate("awx://abc?v=2", 4));
  assert(ticket.requested_version == 2U);

  ticket = require_ticket(session.navigate("abc", 3));
  assert(ticket.requested_version == 3U);
  assert(session.requested_version() == 3);

  ticket = require_ticket(session.navigate("awx://abc?v=0", 3));
  assert(ticket.requested_version == 3U);
}

void test_session_parse_failure() {
  RecordingViewer viewer;
  permaweb::NavigationSession session(viewer);

  assert(!session.navigate("awx://abc?v=x", 0).has_value());
  assert(session.state() == permaweb::NavigationState::Failed);
  assert(session.status().failure.source == permaweb::FailureSource::Parse);
  assert(session.status().failure.parse_error == permaweb::ParseError::InvalidVersion);
  assert(session.request_id() == 0);
  assert(session.address_text() == "awx://abc?v=x");

  const auto pending = require_ticket(session.navigate("abc", 0));
  assert(pending.request_id == 1);
  assert(session.address_text() != "awx://abc?v=x");
  assert(!session.navigate("ftp://abc", 0).has_value());
  assert(session.request_id() == 1);
  assert(session.status().failure.parse_error == permaweb::ParseError::UnsupportedScheme);
  assert(session.address_text() == "ftp://abc");
  assert(session.view_state().address_text == "ftp://abc");

  // The user moved on; the pending answer no longer describes what is on screen.
  const auto snapshot = permaweb::Snapshot{.version = 1, .content_root = "abc@1"};
  assert(!session.resolve_complete(pending.request_id, permaweb::ResolveResult::success(snapshot, {1, 1})));
  assert(viewer.displays.empty());
  assert(session.state() == permaweb::NavigationState::Failed);
}

void test_stale_completion_dropped_in_either_order() {
  ScriptedHistoryStore store;
  store.set_versions("abc", 5);
  store.set_versions("xyz", 3);
  permaweb::HistoryResolver resolver(store);

  {
    RecordingViewer viewer;
    permaweb::NavigationSession session(viewer);
    const auto first = require_ticket(session.navigate("awx://abc", 2));
    const auto second = require_ticket(session.navigate("awx://xyz", 0));

    const auto first_result = resolver.resolve(first.identifier, first.requested_version);
    const auto second_result = resolver.resolve(second.identifier, second.requested_version);

    assert(session.resolve_complete(second.request_id, second_result));
    assert(!session.resolve_complete(first.request_id, first_result));
    assert(viewer.displays.size() == 1);
    assert(viewer.displays.front().first == "xyz@3");
    assert(session.resolved_version() == 3);
    assert(session.stale_drop_count() == 1);
  }

  {
    RecordingViewer viewer;
    permaweb::NavigationSession session(viewer);
    const auto first = require_ticket(session.navigate("awx://abc", 2));
    const auto second = require_ticket(session.navigate("awx://xyz", 0));

    assert(!session.resolve_complete(first.request_id, resolver.resolve(first.identifier, first.requested_version)));
    assert(session.state() == permaweb::NavigationState::Resolving);
    assert(viewer.displays.empty());
    assert(session.resolve_complete(second.request_id,
                                    resolver.resolve(second.identifier, second.requested_version)));
    assert(viewer.displays.size() == 1);
    assert(viewer.displays.front().first == "xyz@3");
  }
}

void test_failure_keeps_viewer_and_repeats() {
  ScriptedHistoryStore store;
  store.set_versions("abc", 5);
  permaweb::HistoryResolver resolver(store);
  RecordingViewer viewer;
  permaweb::NavigationSession session(viewer);

  run_ticket(session, resolver, require_ticket(session.navigate("abc", 0)));
  session.viewer_reported_loaded();
  assert(viewer.displays.size() == 1);

  for (int attempt = 0; attempt < 2; ++attempt) {
    run_ticket(session, resolver, require_ticket(session.navigate("unknown-id", 0)));
    assert(session.state() == permaweb::NavigationState::Failed);
    assert(session.status().failure.source == permaweb::FailureSource::Resolve);
    assert(session.status().failure.resolve_error == permaweb::ResolveError::NotFound);
  }
  assert(viewer.displays.size() == 1);
  assert(!session.view_state().version_enabled);

  session.viewer_reported_loaded();
  assert(!session.viewer_ready());

  store.set_offline(true);
  run_ticket(session, resolver, require_ticket(session.navigate("abc", 0)));
  assert(session.status().failure.resolve_error == permaweb::ResolveError::Unavailable);
  assert(session.view_state().status_text.find("Try again") != std::string::npos);

  store.set_offline(false);
  const auto retry = require_ticket(session.navigate("abc", 0));
  assert(retry.request_id == session.request_id());
  run_ticket(session, resolver, retry);
  assert(session.state() == permaweb::NavigationState::Loaded);
  assert(viewer.displays.size() == 2);
}

void test_version_field_and_clamp() {
  ScriptedHistoryStore store;
  store.set_versions("abc", 5);
  permaweb::HistoryResolver resolver(store);
  RecordingViewer viewer;
  permaweb::NavigationSession session(viewer);

  assert(!session.version_field_submitted(3).has_value());
  assert(session.state() == permaweb::NavigationState::Idle);
  assert(session.request_id() == 0);
  assert(session.clamp_version_input(9) == 9);

  run_ticket(session, resolver, require_ticket(session.navigate("awx://abc/docs/?v=4", 0)));
  assert(session.resolved_version() == 4);
  assert(session.clamp_version_input(9) == 5);
  assert(session.clamp_version_input(3) == 3);
  assert(session.clamp_version_input(0) == 0);

  const auto ticket = require_ticket(session.version_field_submitted(0));
  assert(!ticket.requested_version.has_value());
  assert(session.address()->resource_path == "/docs/");
  run_ticket(session, resolver, ticket);
  assert(session.resolved_version() == 5);
  assert(viewer.displays.back().second == "awx://abc/docs/?v=5");
}

void test_startup_handoff_runs_once() {
  RecordingViewer viewer;
  {
    permaweb::NavigationSession session(viewer);
    permaweb::StartupHandoff handoff(session);
    const auto ticket = require_ticket(handoff.take_initial(std::string{"awx://abc"}, 2U));
    assert(ticket.request_id == 1);
    assert(ticket.requested_version == 2U);
    assert(handoff.consumed());
    assert(!handoff.take_initial(std::string{"awx://xyz"}, std::nullopt).has_value());
    assert(session.request_id() == 1);
    assert(session.address()->identifier == "abc");
  }
  {
    permaweb::NavigationSession session(viewer);
    permaweb::StartupHandoff handoff(session);
    assert(!handoff.take_initial(std::nullopt, 3U).has_value());
    assert(handoff.consumed());
    assert(session.state() == permaweb::NavigationState::Idle);
    assert(!handoff.take_initial(std::string{"awx://abc"}, std::nullopt).has_value());
    assert(session.request_id() == 0);
  }
}

void test_resolve_worker_delivers_completions() {
  ScriptedHistoryStore store;
  store.set_versions("abc", 5);
  store.set_versions("xyz", 2);
  permaweb::HistoryResolver resolver(store);
  RecordingViewer viewer;
  permaweb::NavigationSession session(viewer);
  permaweb::ResolveWorker worker(resolver, 2, 0);

  worker.submit(require_ticket(session.navigate("awx://abc", 0)));
  worker.submit(require_ticket(session.navigate("awx://xyz", 0)));

  std::vector<permaweb::ResolveCompletion> completions;
  for (int i = 0; i < 100 && completions.size() < 2; ++i) {
    static_cast<void>(worker.wait_for_completion(50));
    for (auto& completion : worker.drain()) {
      completions.push_back(std::move(completion));
    }
  }
  assert(completions.size() == 2);
  assert(worker.in_flight() == 0);

  std::size_t applied = 0;
  for (const auto& completion : completions) {
    if (session.resolve_complete(completion.request_id, completion.result)) {
      ++applied;
    }
  }
  assert(applied == 1);
  assert(viewer.displays.size() == 1);
  assert(viewer.displays.front().first == "xyz@2");
}

void test_resolve_worker_timeout() {
  GatedHistoryStore store;
  store.inner().set_versions("abc", 5);
  permaweb::HistoryResolver resolver(store);
  RecordingViewer viewer;
  permaweb::NavigationSession session(viewer);
  permaweb::ResolveWorker worker(resolver, 1, 20);

  worker.submit(require_ticket(session.navigate("abc", 0)));
  std::this_thread::sleep_for(std::chrono::milliseconds(60));

  auto completions = worker.drain();
  assert(completions.size() == 1);
  assert(!completions.front().result.ok);
  assert(completions.front().result.error == permaweb::ResolveError::Unavailable);
  assert(session.resolve_complete(completions.front().request_id, completions.front().result));
  assert(session.status().failure.resolve_error == permaweb::ResolveError::Unavailable);

  store.release();
  assert(worker.wait_for_completion(2000));
  completions = worker.drain();
  assert(completions.size() == 1);
  assert(completions.front().result.ok);
  assert(!session.resolve_complete(completions.front().request_id, completions.front().result));
  assert(viewer.displays.empty());
}

void test_site_map_lookup() {
  const std::string index_hash = permaweb::util::content_hash_hex("index");
  const std::string docs_hash = permaweb::util::content_hash_hex("docs");
  const std::string page_hash = permaweb::util::content_hash_hex("page");

  permaweb::SiteMap map;
  assert(map.add_resource("/index.html", index_hash).ok);
  assert(map.add_resource("/docs/index.htm", docs_hash).ok);
  assert(map.add_resource("/docs/my page.html", page_hash).ok);
  assert(!map.add_resource("index.html", index_hash).ok);
  assert(!map.add_resource("/docs/", index_hash).ok);
  assert(!map.add_resource("/x.html", "not-a-hash").ok);
  assert(map.size() == 3);

  assert(map.lookup("/") == index_hash);
  assert(map.lookup("/index.html") == index_hash);
  assert(map.lookup("/docs") == docs_hash);
  assert(map.lookup("/docs/") == docs_hash);
  assert(map.lookup("/docs/my%20page.html") == page_hash);
  assert(!map.lookup("/missing.html").has_value());
  assert(!map.lookup("relative").has_value());

  const auto parsed = permaweb::SiteMap::parse(map.serialize());
  assert(parsed.has_value());
  assert(parsed->size() == 3);
  assert(parsed->lookup("/docs/") == docs_hash);
  assert(parsed->serialize() == map.serialize());
  assert(!permaweb::SiteMap::parse("index.html=abc").has_value());
}

void test_local_store_publish_and_reload() {
  const auto dir = temp_dir("local-store");
  std::string identifier;
  std::string root_v1;
  {
    permaweb::LocalHistoryStore store;
    assert(store.open(dir.string()).ok);
    assert(store.lookup_bounds("missing").error == permaweb::ResolveError::NotFound);

    const permaweb::Result created = store.create_history();
    assert(created.ok);
    identifier = created.data;
    assert(permaweb::util::is_digest_hex(identifier));
    assert(store.lookup_bounds(identifier).ok);
    assert(store.lookup_bounds(identifier).bounds.max_version == 0);

    permaweb::Result published = store.publish_site(identifier, {{.path = "/index.html", .content = "<p>one</p>"}});
    assert(published.ok);
    assert(published.data == "1");
    published = store.publish_site(identifier, {{.path = "/index.html", .content = "<p>two</p>"},
                                                {.path = "/about/index.htm", .content = "about"}});
    assert(published.data == "2");
    assert(!store.publish_site(identifier, {}).ok);
    assert(!store.append_version(identifier, "bogus").ok);

    const auto snapshot = store.fetch_snapshot(identifier, 1);
    assert(snapshot.ok);
    root_v1 = snapshot.snapshot.content_root;
    assert(store.fetch_snapshot(identifier, 3).error == permaweb::ResolveError::InvalidVersion);
  }

  permaweb::LocalHistoryStore reopened;
  assert(reopened.open(dir.string()).ok);
  const auto bounds = reopened.lookup_bounds(identifier);
  assert(bounds.ok);
  assert(bounds.bounds.min_version == 1);
  assert(bounds.bounds.max_version == 2);
  assert(reopened.fetch_snapshot(identifier, 1).snapshot.content_root == root_v1);

  const permaweb::Result map_blob = reopened.read_blob(root_v1);
  assert(map_blob.ok);
  const auto site_map = permaweb::SiteMap::parse(map_blob.data);
  assert(site_map.has_value());
  const auto page = site_map->lookup("/");
  assert(page.has_value());
  assert(reopened.read_blob(*page).data == "<p>one</p>");

  {
    std::ofstream tamper(dir / "blobs" / *page, std::ios::out | std::ios::trunc);
    tamper << "<p>changed</p>";
  }
  assert(!reopened.read_blob(*page).ok);

  {
    std::ofstream junk(dir / "histories.dat", std::ios::out | std::ios::app);
    junk << "garbage line\n" << identifier << "\t7\t" << root_v1 << "\t0\n";
  }
  permaweb::LocalHistoryStore tolerant;
  assert(tolerant.open(dir.string()).ok);
  assert(tolerant.lookup_bounds(identifier).bounds.max_version == 2);

  tolerant.set_offline(true);
  assert(tolerant.lookup_bounds(identifier).error == permaweb::ResolveError::Unavailable);
  assert(!tolerant.read_blob(root_v1).ok);

  permaweb::LocalHistoryStore closed;
  assert(closed.lookup_bounds(identifier).error == permaweb::ResolveError::Unavailable);
  assert(!closed.create_history().ok);
}

void test_local_store_reports_unreadable_blob_dir() {
  const auto dir = temp_dir("local-store-loop");
  permaweb::LocalHistoryStore store;
  assert(store.open(dir.string()).ok);
  const permaweb::Result created = store.create_history();
  assert(created.ok);

  // A self-referencing link makes every lookup under blobs/ fail with ELOOP.
  std::filesystem::remove_all(dir / "blobs");
  std::filesystem::create_symlink("blobs", dir / "blobs");

  const permaweb::Result blob = store.store_blob("payload");
  assert(!blob.ok);
  assert(!blob.message.empty());
  assert(!store.publish_site(created.data, {{.path = "/index.html", .content = "x"}}).ok);
  assert(store.lookup_bounds(created.data).bounds.max_version == 0);
}

void test_launch_options() {
  auto parsed = permaweb::parse_launch_options(std::vector<std::string>{
      "awx://abc?v=2", "--website-version", "3", "--local", "--timeout", "5", "--data-dir", "d", "--log-level",
      "DEBUG"});
  assert(parsed.ok);
  assert(parsed.options.url == "awx://abc?v=2");
  assert(parsed.options.website_version == 3U);
  assert(parsed.options.local_network);
  assert(parsed.options.timeout_seconds == 5);
  assert(parsed.options.data_dir == "d");
  assert(parsed.options.log_level == "debug");

  const auto init = permaweb::to_init_config(parsed.options);
  assert(init.app_data_dir == "d");
  assert(init.local_network);
  assert(init.resolve_timeout_ms == 5000);

  parsed = permaweb::parse_launch_options(std::vector<std::string>{"-v", "7", "--timeout=9"});
  assert(parsed.ok);
  assert(!parsed.options.url.has_value());
  assert(parsed.options.website_version == 7U);
  assert(parsed.options.timeout_seconds == 9);
  assert(!parsed.options.local_network);

  assert(!permaweb::parse_launch_options(std::vector<std::string>{"--timeout", "soon"}).ok);
  assert(!permaweb::parse_launch_options(std::vector<std::string>{"--timeout", "18446744073709552"}).ok);
  assert(!permaweb::parse_launch_options(std::vector<std::string>{"--timeout", "9223372036854776"}).ok);

  parsed = permaweb::parse_launch_options(std::vector<std::string>{"--timeout", "9223372036854775"});
  assert(parsed.ok);
  assert(permaweb::to_init_config(parsed.options).resolve_timeout_ms == 9223372036854775000LL);

  permaweb::LaunchOptions huge;
  huge.timeout_seconds = std::numeric_limits<std::uint64_t>::max();
  assert(permaweb::to_init_config(huge).resolve_timeout_ms > 0);
  assert(!permaweb::parse_launch_options(std::vector<std::string>{"--website-version"}).ok);
  assert(!permaweb::parse_launch_options(std::vector<std::string>{"-v", "-1"}).ok);
  assert(!permaweb::parse_launch_options(std::vector<std::string>{"abc", "xyz"}).ok);
  assert(!permaweb::parse_launch_options(std::vector<std::string>{"--bogus"}).ok);
  assert(!permaweb::parse_launch_options(std::vector<std::string>{"--log-level", "loud"}).ok);
  assert(permaweb::parse_launch_options(std::vector<std::string>{"--help"}).options.show_help);
  assert(!permaweb::launch_usage().empty());
}

void test_config_file_with_flag_override() {
  const auto dir = temp_dir("config");
  const auto path = dir / "permaweb.conf";
  {
    std::ofstream out(path);
    out << "# permaweb settings\n";
    out << "url = awx://fromfile?v=2\n";
    out << "local=true\n";
    out << "timeout=7\n";
    out << "example = Docs | awx://abc/docs?v=2\n";
    out << "\n";
    out << "data_dir=" << (dir / "data").string() << '\n';
  }

  auto parsed = permaweb::parse_launch_options(std::vector<std::string>{"--config", path.string(), "--timeout=9"});
  assert(parsed.ok);
  assert(parsed.options.url == "awx://fromfile?v=2");
  assert(parsed.options.local_network);
  assert(parsed.options.timeout_seconds == 9);
  assert(parsed.options.data_dir == (dir / "data").string());
  assert(parsed.options.config_path == path.string());
  assert(parsed.options.examples.size() == 1);
  assert(parsed.options.examples.front().title == "Docs");
  assert(parsed.options.examples.front().address == "awx://abc/docs?v=2");
  assert(permaweb::to_init_config(parsed.options).examples.size() == 1);

  parsed = permaweb::parse_launch_options(std::vector<std::string>{"awx://fromargs", "--config", path.string()});
  assert(parsed.ok);
  assert(parsed.options.url == "awx://fromargs");
  assert(parsed.options.timeout_seconds == 7);

  {
    std::ofstream out(dir / "bad.conf");
    out << "timeout=7\nnot a setting\n";
  }
  parsed = permaweb::parse_launch_options(std::vector<std::string>{"--config", (dir / "bad.conf").string()});
  assert(!parsed.ok);
  assert(parsed.message.find(":2:") != std::string::npos);

  assert(!permaweb::parse_launch_options(std::vector<std::string>{"--config", (dir / "absent.conf").string()}).ok);
  assert(!permaweb::parse_launch_options(std::vector<std::string>{"--config"}).ok);

  permaweb::LaunchOptions options;
  assert(!permaweb::apply_setting("colour", "red", options).ok);
  assert(permaweb::apply_setting("local", "off", options).ok);
  assert(!options.local_network);
  assert(!permaweb::apply_setting("example", "No address", options).ok);
  assert(!permaweb::apply_setting("example", " | awx://abc", options).ok);
  assert(!permaweb::apply_setting("example", "Bad | http://abc", options).ok);
  assert(options.examples.empty());
}

void test_example_catalog() {
  const auto local = permaweb::example_sites(true);
  const auto remote = permaweb::example_sites(false);
  assert(!local.empty());
  assert(remote.empty());
  for (const auto& site : local) {
    assert(!site.title.empty());
    assert(permaweb::parse_address(site.address).ok);
  }
  const std::string welcome_id = permaweb::local_welcome_identifier();
  assert(permaweb::util::is_digest_hex(welcome_id));
  assert(welcome_id == permaweb::util::well_known_identifier(permaweb::kLocalWelcomeSiteName));
  assert(welcome_id != permaweb::util::well_known_identifier(permaweb::kLocalHistoryTypeName));
  assert(permaweb::parse_address(local.front().address).address.identifier == welcome_id);
}

void test_browser_api_local_network() {
  const auto dir = temp_dir("browser-api");
  RecordingViewer viewer;
  permaweb::BrowserApi api;

  assert(!api.navigate("abc", 0).ok);
  assert(api.tick() == 0);

  const permaweb::Result init = api.init({.app_data_dir = dir.string(),
                                          .local_network = true,
                                          .resolve_timeout_ms = 0,
                                          .resolve_threads = 2,
                                          .seed_local_network = true,
                                          .examples = {{.title = "Mine", .address = "awx://abc"}}},
                                         viewer);
  assert(init.ok);
  assert(!api.init({.app_data_dir = dir.string()}, viewer).ok);
  assert(api.status_report().network_compatible);
  assert(api.network_compatible());
  const auto examples = api.examples();
  assert(examples.size() == permaweb::example_sites(true).size() + 1);
  assert(examples.back().title == "Mine");

  const std::string welcome = "awx://" + permaweb::local_welcome_identifier();
  assert(api.take_initial(welcome, std::nullopt).ok);
  assert(wait_until(api, [&]() { return api.navigation_status().state != permaweb::NavigationState::Resolving; }));
  assert(api.navigation_status().state == permaweb::NavigationState::Loaded);
  assert(viewer.displays.size() == 1);
  assert(viewer.displays.back().second == welcome + "/?v=2");

  permaweb::Result page = api.load_resource(viewer.displays.back().first, "/");
  assert(page.ok);
  assert(page.data.find("version 2") != std::string::npos);
  assert(api.load_resource(viewer.displays.back().first, "/changes.html").ok);
  assert(!api.load_resource(viewer.displays.back().first, "/nothing.html").ok);

  assert(!api.view_state().version_enabled);
  api.viewer_loaded();
  assert(api.view_state().version_enabled);
  assert(api.view_state().version_max == 2);
  assert(api.clamp_version_input(10) == 2);

  assert(api.take_initial(welcome, 1U).ok);
  assert(api.navigation_status().request_id == 1);

  assert(api.submit_version(1).ok);
  assert(wait_until(api, [&]() { return api.navigation_status().state == permaweb::NavigationState::Loaded; }));
  assert(viewer.displays.back().second == welcome + "/?v=1");
  page = api.load_resource(viewer.displays.back().first, "/");
  assert(page.data.find("version 1") != std::string::npos);

  const permaweb::Result bad = api.navigate("awx://abc?v=latest", 0);
  assert(!bad.ok);
  assert(api.navigation_status().failure.source == permaweb::FailureSource::Parse);

  const permaweb::Result created = api.create_history();
  assert(created.ok);
  assert(api.publish_site(created.data, {{.path = "/index.html", .content = "mine"}}).ok);
  assert(api.navigate(created.data + "?v=4", 0).ok);
  assert(wait_until(api, [&]() { return api.navigation_status().state == permaweb::NavigationState::Loaded; }));
  assert(api.load_resource(viewer.displays.back().first, "/").data == "mine");

  api.set_store_offline(true);
  assert(api.navigate(welcome, 0).ok);
  assert(wait_until(api, [&]() { return api.navigation_status().state == permaweb::NavigationState::Failed; }));
  assert(api.navigation_status().failure.resolve_error == permaweb::ResolveError::Unavailable);
  api.set_store_offline(false);

  const auto report = api.status_report();
  assert(report.local_network);
  assert(report.network_compatible);
  assert(report.histories >= 3);
  assert(report.resolves_in_flight == 0);

  RecordingViewer public_viewer;
  permaweb::BrowserApi public_api;
  assert(public_api.init({.app_data_dir = temp_dir("browser-api-public").string()}, public_viewer).ok);
  assert(!public_api.status_report().network_compatible);
  assert(!public_api.network_compatible());
  assert(public_api.examples().empty());
}

}  // namespace

int main() {
  permaweb::util::init_logging("warn");
  assert(permaweb::util::ensure_sodium().ok);

  test_address_parser();
  test_format_and_canonical_address();
  test_resolver_scenario();
  test_resolver_errors();
  test_resolver_cache_tracks_latest();
  test_resolver_cache_evicts_oldest();
  test_session_navigation_lifecycle();
  test_session_url_version_wins();
  test_session_parse_failure();
  test_stale_completion_dropped_in_either_order();
  test_failure_keeps_viewer_and_repeats();
  test_version_field_and_clamp();
  test_startup_handoff_runs_once();
  test_resolve_worker_delivers_completions();
  test_resolve_worker_timeout();
  test_site_map_lookup();
  test_local_store_publish_and_reload();
  test_local_store_reports_unreadable_blob_dir();
  test_launch_options();
  test_config_file_with_flag_override();
  test_example_catalog();
  test_browser_api_local_network();

  std::cout << "permaweb_core_tests passed\n";
  return 0;
}
