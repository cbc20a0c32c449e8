#include <gtest/gtest.h>
#include <algorithm>
#include "fs_fixture.hpp"
#include "cleanup/temp_purger.hpp"

using namespace cachesweep::cleanup;

class TempPurgerTest : public TempDirTest {};

TEST_F(TempPurgerTest, EmptiesRootButKeepsIt) {
    auto tmp = test_root_ / "tmp";
    WriteFile(tmp / "loose.log", 100);
    WriteFile(tmp / "scoped_dir123" / "a" / "b" / "deep.bin", 300);
    WriteFile(tmp / "scoped_dir123" / "top.bin", 200);
    fs::create_directories(tmp / "empty_dir");

    TempPurger purger;
    auto result = purger.Purge({tmp});

    EXPECT_TRUE(fs::is_directory(tmp));
    EXPECT_TRUE(fs::is_empty(tmp));
    EXPECT_EQ(result.items_attempted, 3u);
    EXPECT_EQ(result.items_succeeded, 3u);
    EXPECT_EQ(result.bytes_freed, 600u);
}

TEST_F(TempPurgerTest, PrefixFilterLimitsEntries) {
    auto tmp = test_root_ / "tmp";
    WriteFile(tmp / "chrome_profile1" / "f", 10);
    WriteFile(tmp / "scoped_dir9" / "f", 10);
    WriteFile(tmp / "ssh-agent.sock", 1);

    TempPurger purger({"chrome_", "scoped_dir"});
    EXPECT_TRUE(purger.Selects("chrome_x"));
    EXPECT_FALSE(purger.Selects("ssh-agent.sock"));

    auto result = purger.Purge({tmp});
    EXPECT_EQ(result.items_attempted, 2u);
    EXPECT_FALSE(fs::exists(tmp / "chrome_profile1"));
    EXPECT_FALSE(fs::exists(tmp / "scoped_dir9"));
    EXPECT_TRUE(fs::exists(tmp / "ssh-agent.sock"));
}

TEST_F(TempPurgerTest, MissingAndDuplicateRootsAreSkipped) {
    auto tmp = test_root_ / "tmp";
    WriteFile(tmp / "x", 5);

    TempPurger purger;
    auto result = purger.Purge({tmp, test_root_ / "absent", tmp / "." });
    EXPECT_EQ(result.items_attempted, 1u);
    EXPECT_EQ(result.bytes_freed, 5u);
}

TEST_F(TempPurgerTest, LockedFileFailsOnlyItsEntry) {
    auto tmp = test_root_ / "tmp";
    WriteFile(tmp / "busy" / "locked.dat", 70);
    WriteFile(tmp / "busy" / "free.dat", 30);
    WriteFile(tmp / "other" / "f", 11);

    const fs::path locked = tmp / "busy" / "locked.dat";
    TempPurger purger({}, [&](const fs::path& p, std::error_code& ec) {
        if (p == locked) {
            ec = std::make_error_code(std::errc::text_file_busy);
            return false;
        }
        return fs::remove(p, ec);
    });

    auto result = purger.Purge({tmp});
    EXPECT_EQ(result.items_attempted, 2u);
    EXPECT_EQ(result.items_succeeded, 1u);
    // free.dat and other/f were unlinked even though "busy" survived
    EXPECT_EQ(result.bytes_freed, 41u);
    EXPECT_TRUE(fs::exists(locked));
    EXPECT_FALSE(fs::exists(tmp / "busy" / "free.dat"));
    EXPECT_FALSE(fs::exists(tmp / "other"));

    auto busy = std::find_if(result.items.begin(), result.items.end(),
                             [](const PurgeItemResult& i) { return i.relative_path == "busy"; });
    ASSERT_NE(busy, result.items.end());
    EXPECT_EQ(busy->status, ItemStatus::FAILED);
    EXPECT_NE(busy->reason.find("locked.dat"), std::string::npos);
}

TEST_F(TempPurgerTest, SymlinkEntryIsUnlinkedNotFollowed) {
    auto tmp = test_root_ / "tmp";
    auto keep = test_root_ / "keep";
    WriteFile(keep / "precious", 10);
    fs::create_directories(tmp);
    fs::create_directory_symlink(keep, tmp / "link");

    TempPurger purger;
    auto result = purger.Purge({tmp});
    EXPECT_EQ(result.items_succeeded, 1u);
    EXPECT_TRUE(fs::exists(keep / "precious"));
}
