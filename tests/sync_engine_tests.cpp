#include "sync_engine.hpp"
#include "sync_protocol.hpp"
#include "test_runner_utils.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace wingsync::test;

namespace {

FileSnapshot snap(const std::string& path,
                  const std::string& hash,
                  int64_t last_modified,
                  int64_t synced_at = 0) {
  FileSnapshot s;
  s.path = path;
  auto slash = path.rfind('/');
  s.name = slash == std::string::npos ? path : path.substr(slash + 1);
  s.size = hash.size();
  s.hash = hash;
  s.last_modified = last_modified;
  s.synced_at = synced_at;
  s.config_id = "cfg";
  return s;
}

bool has_path(const std::vector<FileSnapshot>& files, const std::string& path) {
  return std::any_of(files.begin(), files.end(), [&](const FileSnapshot& f){ return f.path == path; });
}

const FileSnapshot* find_path(const std::vector<FileSnapshot>& files, const std::string& path) {
  auto it = std::find_if(files.begin(), files.end(), [&](const FileSnapshot& f){ return f.path == path; });
  return it == files.end() ? nullptr : &*it;
}

bool test_compare_buckets(TestContext&) {
  std::vector<FileSnapshot> local = {
    snap("only-local.txt", "h1", 100),
    snap("same.txt", "h2", 100),
    snap("newer-local.txt", "h3", 300, 250),
    snap("newer-remote.txt", "h4", 100, 150),
  };
  std::vector<FileSnapshot> remote = {
    snap("only-remote.txt", "h5", 100),
    snap("same.txt", "h2", 200),
    snap("newer-local.txt", "h3-old", 200, 250),
    snap("newer-remote.txt", "h4-new", 400, 150),
  };
  auto diff = compare_snapshots(local, remote);
  WINGSYNC_CHECK(diff.local_only.size() == 1 && diff.local_only[0].path == "only-local.txt");
  WINGSYNC_CHECK(diff.remote_only.size() == 1 && diff.remote_only[0].path == "only-remote.txt");
  WINGSYNC_CHECK(diff.unchanged.size() == 1 && diff.unchanged[0].path == "same.txt");
  WINGSYNC_CHECK(diff.conflicts.empty());
  WINGSYNC_CHECK(diff.modified.size() == 2);
  auto* local_side = find_path(diff.modified, "newer-local.txt");
  auto* remote_side = find_path(diff.modified, "newer-remote.txt");
  WINGSYNC_CHECK(local_side && local_side->hash == "h3");
  WINGSYNC_CHECK(remote_side && remote_side->hash == "h4-new");
  return true;
}

bool test_every_path_in_one_bucket(TestContext&) {
  std::vector<FileSnapshot> local = {snap("a", "1", 10), snap("b", "2", 10), snap("c", "3", 10, 5)};
  std::vector<FileSnapshot> remote = {snap("b", "2", 10), snap("c", "4", 20, 5), snap("d", "5", 10)};
  auto diff = compare_snapshots(local, remote);
  std::size_t total = diff.local_only.size() + diff.remote_only.size() + diff.modified.size() +
                      diff.unchanged.size() + diff.conflicts.size();
  WINGSYNC_CHECK(total == 4);
  WINGSYNC_CHECK(diff.conflicts.size() == 1 && diff.conflicts[0].path == "c");
  return true;
}

bool test_conflict_needs_both_sides_changed(TestContext&) {
  // Remote edited after the last sync, local untouched: plain modification.
  auto diff = compare_snapshots({snap("f", "old", 100, 100)}, {snap("f", "new", 200, 100)});
  WINGSYNC_CHECK(diff.conflicts.empty());
  WINGSYNC_CHECK(diff.modified.size() == 1 && diff.modified[0].hash == "new");

  // Both edited after the last sync.
  diff = compare_snapshots({snap("f", "mine", 150, 100)}, {snap("f", "theirs", 200, 100)});
  WINGSYNC_CHECK(diff.conflicts.size() == 1);
  WINGSYNC_CHECK(diff.conflicts[0].local.hash == "mine");
  WINGSYNC_CHECK(diff.conflicts[0].remote.hash == "theirs");
  WINGSYNC_CHECK(!diff.conflicts[0].resolution.has_value());

  // Never synced on either side counts as changed.
  diff = compare_snapshots({snap("f", "x", 100)}, {snap("f", "y", 100)});
  WINGSYNC_CHECK(diff.conflicts.size() == 1);
  return true;
}

bool test_equal_timestamps_prefer_local(TestContext&) {
  auto diff = compare_snapshots({snap("f", "local", 100, 200)}, {snap("f", "remote", 100, 50)});
  WINGSYNC_CHECK(diff.modified.size() == 1);
  WINGSYNC_CHECK(diff.modified[0].hash == "local");
  return true;
}

bool test_plan_by_direction(TestContext&) {
  SyncDiff diff;
  diff.local_only = {snap("lo", "1", 1)};
  diff.remote_only = {snap("ro", "2", 1)};
  diff.modified = {snap("mod", "3", 1)};
  diff.conflicts = {ConflictFile{"c", snap("c", "4", 1), snap("c", "5", 2), std::nullopt}};

  auto both = calculate_sync_plan(diff, SyncDirection::Bidirectional);
  WINGSYNC_CHECK(both.upload.size() == 2 && has_path(both.upload, "lo") && has_path(both.upload, "mod"));
  WINGSYNC_CHECK(both.download.size() == 1 && has_path(both.download, "ro"));
  WINGSYNC_CHECK(both.remove.empty());
  WINGSYNC_CHECK(both.conflicts.size() == 1);

  auto up = calculate_sync_plan(diff, SyncDirection::UploadOnly);
  WINGSYNC_CHECK(up.upload.size() == 2 && up.download.empty());
  WINGSYNC_CHECK(up.conflicts.size() == 1);

  auto down = calculate_sync_plan(diff, SyncDirection::DownloadOnly);
  WINGSYNC_CHECK(down.upload.empty());
  WINGSYNC_CHECK(down.download.size() == 2 && has_path(down.download, "ro") && has_path(down.download, "mod"));
  WINGSYNC_CHECK(down.conflicts.size() == 1);

  WINGSYNC_CHECK(calculate_sync_plan(SyncDiff{}, SyncDirection::Bidirectional).empty());
  return true;
}

bool test_apply_resolutions(TestContext&) {
  const int64_t now = 1760788800000;  // 2025-10-18T12:00:00Z
  std::vector<ConflictFile> conflicts = {
    ConflictFile{"keep-local.txt", snap("keep-local.txt", "l1", 10), snap("keep-local.txt", "r1", 20), std::nullopt},
    ConflictFile{"take-remote.txt", snap("take-remote.txt", "l2", 10), snap("take-remote.txt", "r2", 20), std::nullopt},
    ConflictFile{"dir/both.txt", snap("dir/both.txt", "l3", 10), snap("dir/both.txt", "r3", 20), std::nullopt},
    ConflictFile{"manual.txt", snap("manual.txt", "l4", 10), snap("manual.txt", "r4", 20), std::nullopt},
    ConflictFile{"unchosen.txt", snap("unchosen.txt", "l5", 10), snap("unchosen.txt", "r5", 20), std::nullopt},
  };
  std::vector<ResolutionChoice> choices = {
    {"keep-local.txt", ResolutionAction::Local},
    {"take-remote.txt", ResolutionAction::Remote},
    {"dir/both.txt", ResolutionAction::Both},
    {"manual.txt", ResolutionAction::Manual},
  };
  auto plan = apply_conflict_resolutions(conflicts, choices, now);

  WINGSYNC_CHECK(plan.upload.size() == 2);
  WINGSYNC_CHECK(has_path(plan.upload, "keep-local.txt"));
  auto* copy = find_path(plan.upload, "dir/both (local-2025-10-18T12-00-00).txt");
  WINGSYNC_CHECK(copy != nullptr);
  WINGSYNC_CHECK(copy->hash == "l3");
  WINGSYNC_CHECK(copy->name == "both (local-2025-10-18T12-00-00).txt");

  WINGSYNC_CHECK(plan.download.size() == 2);
  WINGSYNC_CHECK(has_path(plan.download, "take-remote.txt"));
  auto* remote_copy = find_path(plan.download, "dir/both.txt");
  WINGSYNC_CHECK(remote_copy && remote_copy->hash == "r3");

  WINGSYNC_CHECK(plan.conflicts.size() == 2);
  WINGSYNC_CHECK(plan.conflicts[0].path == "manual.txt");
  WINGSYNC_CHECK(plan.conflicts[1].path == "unchosen.txt");
  return true;
}

bool test_conflict_copy_path(TestContext&) {
  const int64_t now = 0;
  WINGSYNC_CHECK(conflict_copy_path("notes.txt", "local", now) == "notes (local-1970-01-01T00-00-00).txt");
  WINGSYNC_CHECK(conflict_copy_path("Makefile", "local", now) == "Makefile (local-1970-01-01T00-00-00)");
  WINGSYNC_CHECK(conflict_copy_path(".bashrc", "remote", now) == ".bashrc (remote-1970-01-01T00-00-00)");
  WINGSYNC_CHECK(conflict_copy_path("a.b/c", "local", now) == "a.b/c (local-1970-01-01T00-00-00)");
  return true;
}

bool test_policy_choices(TestContext&) {
  std::vector<ConflictFile> conflicts = {
    ConflictFile{"older-remote", snap("older-remote", "l", 200), snap("older-remote", "r", 100), std::nullopt},
    ConflictFile{"newer-remote", snap("newer-remote", "l", 100), snap("newer-remote", "r", 200), std::nullopt},
    ConflictFile{"tie", snap("tie", "l", 100), snap("tie", "r", 100), std::nullopt},
  };

  auto lww = resolutions_for_policy(conflicts, ConflictResolution::LastWriteWins);
  WINGSYNC_CHECK(lww.size() == 3);
  WINGSYNC_CHECK(lww[0].action == ResolutionAction::Local);
  WINGSYNC_CHECK(lww[1].action == ResolutionAction::Remote);
  WINGSYNC_CHECK(lww[2].action == ResolutionAction::Local);

  auto local = resolutions_for_policy(conflicts, ConflictResolution::LocalWins);
  WINGSYNC_CHECK(std::all_of(local.begin(), local.end(), [](const ResolutionChoice& c){ return c.action == ResolutionAction::Local; }));
  auto remote = resolutions_for_policy(conflicts, ConflictResolution::RemoteWins);
  WINGSYNC_CHECK(std::all_of(remote.begin(), remote.end(), [](const ResolutionChoice& c){ return c.action == ResolutionAction::Remote; }));
  WINGSYNC_CHECK(resolutions_for_policy(conflicts, ConflictResolution::Manual).empty());
  return true;
}

bool test_merge_snapshots(TestContext&) {
  std::vector<FileSnapshot> local = {snap("a", "la", 100), snap("b", "lb", 300), snap("tie", "lt", 50)};
  std::vector<FileSnapshot> remote = {snap("a", "ra", 200), snap("b", "rb", 100), snap("c", "rc", 10), snap("tie", "rt", 50)};
  auto merged = merge_snapshots(local, remote);
  WINGSYNC_CHECK(merged.size() == 4);
  WINGSYNC_CHECK(find_path(merged, "a")->hash == "ra");
  WINGSYNC_CHECK(find_path(merged, "b")->hash == "lb");
  WINGSYNC_CHECK(find_path(merged, "c")->hash == "rc");
  WINGSYNC_CHECK(find_path(merged, "tie")->hash == "lt");
  return true;
}

bool test_worked_scenarios(TestContext&) {
  auto diff = compare_snapshots({snap("a.txt", "hash1", 10, 5)}, {snap("a.txt", "hash2", 8, 3)});
  WINGSYNC_CHECK(diff.conflicts.size() == 1 && diff.conflicts[0].path == "a.txt");
  WINGSYNC_CHECK(diff.modified.empty());

  diff = compare_snapshots({snap("b.txt", "hash1", 10, 9)}, {snap("b.txt", "hash2", 8, 3)});
  WINGSYNC_CHECK(diff.conflicts.empty());
  WINGSYNC_CHECK(diff.modified.size() == 1 && diff.modified[0].hash == "hash1");

  diff = compare_snapshots({snap("b.txt", "hash1", 10, 10)}, {snap("b.txt", "hash2", 12, 3)});
  WINGSYNC_CHECK(diff.modified.size() == 1 && diff.modified[0].hash == "hash2");
  return true;
}

bool test_conflict_is_symmetric(TestContext&) {
  const std::vector<std::pair<FileSnapshot, FileSnapshot>> pairs = {
    {snap("a.txt", "hash1", 10, 5), snap("a.txt", "hash2", 8, 3)},
    {snap("tie.txt", "x", 40, 1), snap("tie.txt", "y", 40, 39)},
    {snap("dir/z.bin", "p", 1000, 0), snap("dir/z.bin", "q", 7, 0)},
  };
  for(const auto& [left, right] : pairs) {
    auto forward = compare_snapshots({left}, {right});
    auto swapped = compare_snapshots({right}, {left});
    WINGSYNC_CHECK(forward.conflicts.size() == 1 && forward.conflicts[0].path == left.path);
    WINGSYNC_CHECK(swapped.conflicts.size() == 1 && swapped.conflicts[0].path == left.path);
    WINGSYNC_CHECK(swapped.conflicts[0].local == right && swapped.conflicts[0].remote == left);
  }
  return true;
}

bool test_merge_is_idempotent(TestContext&) {
  std::vector<FileSnapshot> a = {snap("a", "la", 100), snap("b", "lb", 300), snap("tie", "lt", 50), snap("x/y", "ly", 5)};
  std::vector<FileSnapshot> b = {snap("a", "ra", 200), snap("b", "rb", 100), snap("c", "rc", 10), snap("tie", "rt", 50)};
  auto once = merge_snapshots(a, b);
  WINGSYNC_CHECK(merge_snapshots(once, once) == once);
  WINGSYNC_CHECK(merge_snapshots(a, a) == a);
  WINGSYNC_CHECK(merge_snapshots(once, b) == once);
  return true;
}

bool test_sync_message_codec(TestContext&) {
  std::string error;
  nlohmann::json request = {
    {"type", "sync-request"},
    {"syncId", "run-1"},
    {"configId", "cfg-1"},
  };
  auto parsed = parse_sync_message(request, error);
  WINGSYNC_CHECK(parsed.has_value());
  WINGSYNC_CHECK(std::holds_alternative<SyncRequestMessage>(*parsed));
  WINGSYNC_CHECK(std::get<SyncRequestMessage>(*parsed).sync_id == "run-1");
  WINGSYNC_CHECK(std::string(message_type(*parsed)) == "sync-request");
  WINGSYNC_CHECK(serialize_sync_message(*parsed).value("configId", std::string()) == "cfg-1");

  WINGSYNC_CHECK(is_sync_message_type("sync-metadata"));
  WINGSYNC_CHECK(!is_sync_message_type("transfer-chunk"));

  auto bad = parse_sync_message(nlohmann::json{{"type", "sync-bogus"}, {"syncId", "x"}}, error);
  WINGSYNC_CHECK(!bad.has_value());
  WINGSYNC_CHECK(!error.empty());
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"compare_buckets", test_compare_buckets},
    {"every_path_in_one_bucket", test_every_path_in_one_bucket},
    {"conflict_needs_both_sides_changed", test_conflict_needs_both_sides_changed},
    {"equal_timestamps_prefer_local", test_equal_timestamps_prefer_local},
    {"plan_by_direction", test_plan_by_direction},
    {"apply_resolutions", test_apply_resolutions},
    {"conflict_copy_path", test_conflict_copy_path},
    {"policy_choices", test_policy_choices},
    {"merge_snapshots", test_merge_snapshots},
    {"worked_scenarios", test_worked_scenarios},
    {"conflict_is_symmetric", test_conflict_is_symmetric},
    {"merge_is_idempotent", test_merge_is_idempotent},
    {"sync_message_codec", test_sync_message_codec},
  };
  return run_test_suite("sync engine", tests, argc, argv);
}
