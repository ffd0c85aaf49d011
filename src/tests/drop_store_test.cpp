#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>
#include "store/drop_store.hpp"
#include "test_utils.hpp"

using namespace dr::store;
using ::testing::_;
using ::testing::Throw;

namespace fs = std::filesystem;

class MockTransfer : public Transfer {
public:
  MOCK_METHOD(void, rename_entry, (const fs::path& from, const fs::path& to), (override));
};

class DropStoreTest : public ::testing::Test {
protected:
  fs::path test_dir;
  fs::path store_root;
  fs::path work_dir;
  std::unique_ptr<DropStore> store;

  void SetUp() override {
    disable_test_logging();
    test_dir = make_test_dir("drop_store_test");
    store_root = test_dir / "store";
    work_dir = test_dir / "home" / "u";
    fs::create_directories(work_dir);

    StoreConfig config;
    config.root = store_root;
    store = std::make_unique<DropStore>(config);
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    if (fs::exists(test_dir)) {
      fs::remove_all(test_dir);
    }
  }

  // Creates a file in the working tree and returns the path the store will record
  fs::path make_file(const std::string& relative, const std::string& content) {
    const fs::path path = work_dir / relative;
    write_file(path, content);
    return resolve_original_path(path);
  }

  std::vector<std::string> store_names() const {
    std::vector<std::string> names;
    for (const auto& entry : store->list_entries()) {
      names.push_back(entry.store_name);
    }
    return names;
  }

  template <typename Operation>
  static ErrorKind error_kind_of(Operation operation) {
    try {
      operation();
    } catch (const StoreError& e) {
      return e.kind();
    }
    ADD_FAILURE() << "Operation should have thrown StoreError";
    return ErrorKind::IOError;
  }
};

TEST_F(DropStoreTest, CreatesStoreWithOwnerOnlyPermissions) {
  ASSERT_TRUE(fs::is_directory(store_root));
  EXPECT_EQ(fs::status(store_root).permissions() & fs::perms::mask, fs::perms::owner_all);
  EXPECT_TRUE(store->list_entries().empty());
}

TEST_F(DropStoreTest, StorePathThatIsAFileIsRejected) {
  write_file(test_dir / "not_a_dir", "x");
  StoreConfig config;
  config.root = test_dir / "not_a_dir";

  EXPECT_EQ(error_kind_of([&] { DropStore bad(config); }), ErrorKind::IOError);
}

TEST_F(DropStoreTest, DropAndRecoverReportScenario) {
  const fs::path report = make_file("report.txt", "quarterly numbers");

  const DroppedEntry dropped = store->drop_file(report, 1700000000);
  EXPECT_FALSE(fs::exists(report));
  EXPECT_TRUE(dropped.recognized);
  EXPECT_EQ(dropped.timestamp, 1700000000);
  EXPECT_EQ(dropped.original_path, report);
  EXPECT_EQ(dropped.size, 17u);

  const auto entries = store->list_entries();
  ASSERT_EQ(entries.size(), 1u);
  EncodedName expected;
  expected.timestamp = 1700000000;
  expected.original_path = report;
  EXPECT_EQ(entries[0].store_name, encode_entry_name(expected));
  EXPECT_EQ(entries[0].original_path, report);

  const DroppedEntry recovered = store->recover_file(report.string());
  EXPECT_EQ(recovered.original_path, report);
  EXPECT_EQ(read_file(report), "quarterly numbers");
  EXPECT_TRUE(store->list_entries().empty());
}

TEST_F(DropStoreTest, DropUsesCurrentTime) {
  const fs::path file = make_file("now.txt", "x");
  const std::int64_t before = current_timestamp();

  const DroppedEntry dropped = store->drop_file(file);

  EXPECT_GE(dropped.timestamp, before);
  EXPECT_LE(dropped.timestamp, current_timestamp());
}

TEST_F(DropStoreTest, DropMissingFileIsNotFound) {
  EXPECT_EQ(error_kind_of([&] { store->drop_file(work_dir / "missing.txt"); }), ErrorKind::NotFound);
  EXPECT_TRUE(store->list_entries().empty());
}

TEST_F(DropStoreTest, RecoverNeverOverwrites) {
  const fs::path file = make_file("notes.txt", "old notes");
  store->drop_file(file, 100);
  write_file(file, "new notes");

  EXPECT_EQ(error_kind_of([&] { store->recover_file(file.string()); }), ErrorKind::Conflict);

  EXPECT_EQ(read_file(file), "new notes");
  const auto entries = store->list_entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(read_file(entries[0].store_path), "old notes");
}

TEST_F(DropStoreTest, ListIsOrderedAndRepeatable) {
  store->drop_file(make_file("c.txt", "c"), 300);
  store->drop_file(make_file("a.txt", "a"), 100);
  store->drop_file(make_file("b.txt", "b"), 200);

  const auto entries = store->list_entries();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].timestamp, 100);
  EXPECT_EQ(entries[1].timestamp, 200);
  EXPECT_EQ(entries[2].timestamp, 300);
  EXPECT_EQ(entries[0].original_path.filename(), fs::path("a.txt"));

  EXPECT_EQ(store_names(), store_names());
  EXPECT_EQ(store->list_entries().size(), 3u);
}

TEST_F(DropStoreTest, DeleteRemovesOnlyTargetedEntry) {
  const fs::path first = make_file("first.txt", "1");
  const fs::path second = make_file("second.txt", "2");
  store->drop_file(first, 10);
  store->drop_file(second, 20);

  const auto deleted = store->delete_file(first.string());
  ASSERT_EQ(deleted.size(), 1u);
  EXPECT_EQ(deleted[0].original_path, first);
  EXPECT_FALSE(fs::exists(deleted[0].store_path));

  const auto entries = store->list_entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].original_path, second);
  EXPECT_FALSE(fs::exists(first));
}

TEST_F(DropStoreTest, SameSecondDropsGetDistinctNames) {
  const fs::path file = make_file("twice.txt", "first");
  const DroppedEntry first = store->drop_file(file, 5);
  write_file(file, "second");
  const DroppedEntry second = store->drop_file(file, 5);

  EXPECT_EQ(first.sequence, 0u);
  EXPECT_EQ(second.sequence, 1u);
  EXPECT_NE(first.store_name, second.store_name);
  EXPECT_EQ(store->list_entries().size(), 2u);
}

TEST_F(DropStoreTest, AmbiguousRecoverListsCandidates) {
  const fs::path file = make_file("draft.txt", "version one");
  store->drop_file(file, 100);
  write_file(file, "version two");
  store->drop_file(file, 200);

  try {
    store->recover_file(file.string());
    FAIL() << "Two entries for one path should be ambiguous";
  } catch (const AmbiguousMatchError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Ambiguous);
    ASSERT_EQ(e.candidates().size(), 2u);
    EXPECT_EQ(e.candidates()[0].timestamp, 100);
    EXPECT_EQ(e.candidates()[1].timestamp, 200);
  }
  EXPECT_FALSE(fs::exists(file));

  const DroppedEntry recovered = store->recover_file(file.string(), Selection::Latest);
  EXPECT_EQ(recovered.timestamp, 200);
  EXPECT_EQ(read_file(file), "version two");

  const auto remaining = store->list_entries();
  ASSERT_EQ(remaining.size(), 1u);
  EXPECT_EQ(remaining[0].timestamp, 100);
}

TEST_F(DropStoreTest, DeleteSelections) {
  const fs::path file = make_file("log.txt", "x");
  for (std::int64_t timestamp : {1, 2, 3}) {
    write_file(file, "x");
    store->drop_file(file, timestamp);
  }

  EXPECT_EQ(error_kind_of([&] { store->delete_file(file.string()); }), ErrorKind::Ambiguous);

  const auto latest = store->delete_file(file.string(), Selection::Latest);
  ASSERT_EQ(latest.size(), 1u);
  EXPECT_EQ(latest[0].timestamp, 3);

  EXPECT_EQ(store->delete_file(file.string(), Selection::All).size(), 2u);
  EXPECT_TRUE(store->list_entries().empty());
}

TEST_F(DropStoreTest, MatchesExactStoreNameAndFragments) {
  const fs::path report = make_file("report.txt", "r");
  const fs::path summary = make_file("summary.txt", "s");
  const DroppedEntry report_entry = store->drop_file(report, 7);
  store->drop_file(summary, 8);

  const auto by_name = store->find_matches(report_entry.store_name);
  ASSERT_EQ(by_name.size(), 1u);
  EXPECT_EQ(by_name[0].original_path, report);

  const auto by_fragment = store->find_matches("report");
  ASSERT_EQ(by_fragment.size(), 1u);
  EXPECT_EQ(by_fragment[0].original_path, report);

  // Path fragments match the decoded path, not only the escaped name
  EXPECT_EQ(store->find_matches("u/summary").size(), 1u);
  EXPECT_EQ(store->find_matches(".txt").size(), 2u);
  EXPECT_TRUE(store->find_matches("").empty());
  EXPECT_TRUE(store->find_matches("nothing-like-this").empty());

  store->delete_file("report");
  EXPECT_EQ(store->list_entries().size(), 1u);
}

TEST_F(DropStoreTest, RecoverUnknownIsNotFound) {
  EXPECT_EQ(error_kind_of([&] { store->recover_file((work_dir / "never.txt").string()); }),
            ErrorKind::NotFound);
  EXPECT_EQ(error_kind_of([&] { store->delete_file("never"); }), ErrorKind::NotFound);
}

TEST_F(DropStoreTest, RecoverRejectsSelectAll) {
  store->drop_file(make_file("one.txt", "1"), 1);
  EXPECT_THROW(store->recover_file("one", Selection::All), std::invalid_argument);
}

TEST_F(DropStoreTest, UnrecognizedEntriesAreReportedNotFatal) {
  write_file(store_root / "stray.txt", "foreign");
  store->drop_file(make_file("kept.txt", "k"), 50);

  const auto entries = store->list_entries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_TRUE(entries[0].recognized);
  EXPECT_FALSE(entries[1].recognized);
  EXPECT_EQ(entries[1].store_name, "stray.txt");
  EXPECT_TRUE(entries[1].original_path.empty());

  EXPECT_EQ(error_kind_of([&] { store->recover_file("stray.txt"); }), ErrorKind::Unrecognized);

  const auto deleted = store->delete_file("stray.txt");
  ASSERT_EQ(deleted.size(), 1u);
  EXPECT_FALSE(fs::exists(store_root / "stray.txt"));
  EXPECT_EQ(store->list_entries().size(), 1u);
}

TEST_F(DropStoreTest, DirectoryTreesDropAndRecover) {
  const fs::path project = resolve_original_path(work_dir / "project");
  write_file(project / "main.cpp", "int main() {}");
  write_file(project / "docs" / "readme.md", "# readme");

  const DroppedEntry dropped = store->drop_file(project, 900);
  EXPECT_TRUE(dropped.is_directory);
  EXPECT_EQ(dropped.size, 13u + 8u);
  EXPECT_FALSE(fs::exists(project));

  store->recover_file(project.string());
  EXPECT_EQ(read_file(project / "main.cpp"), "int main() {}");
  EXPECT_EQ(read_file(project / "docs" / "readme.md"), "# readme");
}

TEST_F(DropStoreTest, SymlinksAreDroppedAsLinks) {
  const fs::path link = work_dir / "dangling";
  fs::create_symlink("does-not-exist", link);

  store->drop_file(link, 1);
  EXPECT_FALSE(fs::exists(fs::symlink_status(link)));

  store->recover_file(resolve_original_path(link).string());
  ASSERT_TRUE(fs::is_symlink(fs::symlink_status(link)));
  EXPECT_EQ(fs::read_symlink(link), fs::path("does-not-exist"));
}

TEST_F(DropStoreTest, RecoverRecreatesMissingParents) {
  const fs::path file = make_file("deep/nested/file.txt", "deep");
  store->drop_file(file, 1);
  fs::remove_all(work_dir / "deep");

  store->recover_file(file.string());
  EXPECT_EQ(read_file(file), "deep");
}

TEST_F(DropStoreTest, RefusesToDropTheStore) {
  EXPECT_EQ(error_kind_of([&] { store->drop_file(store_root); }), ErrorKind::PermissionDenied);
  EXPECT_EQ(error_kind_of([&] { store->drop_file(test_dir); }), ErrorKind::PermissionDenied);

  write_file(store_root / "inside.txt", "x");
  EXPECT_EQ(error_kind_of([&] { store->drop_file(store_root / "inside.txt"); }),
            ErrorKind::PermissionDenied);
  EXPECT_TRUE(fs::is_directory(store_root));
}

TEST_F(DropStoreTest, CrossDeviceDropAndRecoverPreserveData) {
  auto transfer = std::make_unique<MockTransfer>();
  EXPECT_CALL(*transfer, rename_entry(_, _))
    .Times(2)
    .WillRepeatedly(Throw(fs::filesystem_error("rename",
                                               std::make_error_code(std::errc::cross_device_link))));

  StoreConfig config;
  config.root = test_dir / "other_store";
  DropStore cross_store(config, std::move(transfer));

  const fs::path file = make_file("moved.bin", std::string(50000, 'm'));
  const DroppedEntry dropped = cross_store.drop_file(file, 42);
  EXPECT_FALSE(fs::exists(file));
  EXPECT_EQ(read_file(dropped.store_path), std::string(50000, 'm'));

  cross_store.recover_file(file.string());
  EXPECT_EQ(read_file(file), std::string(50000, 'm'));
  EXPECT_TRUE(cross_store.list_entries().empty());
}
