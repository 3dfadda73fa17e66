#include <gtest/gtest.h>
#include "storage/LocalDiskProvider.hpp"
#include "storage/Error.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace unistore::storage;

class LocalDiskProviderTest : public ::testing::Test {
protected:
    fs::path root;
    std::unique_ptr<LocalDiskProvider> provider;

    void SetUp() override {
        root = fs::temp_directory_path() / ("unistore_local_" + std::to_string(::getpid()) + "_" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        fs::create_directories(root);
        provider = std::make_unique<LocalDiskProvider>(root);
    }

    void TearDown() override { fs::remove_all(root); }

    std::string add(const std::string& path, const std::string& content, const bool overwrite = false) const {
        std::istringstream in(content);
        return provider->add(path, in, overwrite);
    }

    std::string readAll(const std::string& path) const {
        std::ostringstream out;
        provider->read(path, out);
        return out.str();
    }

    static ErrorKind kindOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const StorageError& e) {
            return e.kind();
        }
        throw std::logic_error("expected a StorageError");
    }
};

TEST_F(LocalDiskProviderTest, AddCreatesParentsAndReturnsPath) {
    const auto locator = add("a/b/c.txt", "hello");
    EXPECT_EQ(locator, "a/b/c.txt");
    EXPECT_TRUE(fs::is_regular_file(root / "a/b/c.txt"));
    EXPECT_TRUE(fs::is_directory(root / "a/b"));
    EXPECT_EQ(readAll("a/b/c.txt"), "hello");
}

TEST_F(LocalDiskProviderTest, AddWithoutOverwriteRejectsExisting) {
    add("f.txt", "one");
    EXPECT_EQ(kindOf([&] { add("f.txt", "two"); }), ErrorKind::AlreadyExists);
    EXPECT_EQ(readAll("f.txt"), "one");
}

TEST_F(LocalDiskProviderTest, AddWithOverwriteReplacesContent) {
    add("f.txt", "original content that is longer");
    add("f.txt", "Overwrite Content", true);
    EXPECT_EQ(readAll("f.txt"), "Overwrite Content");
}

TEST_F(LocalDiskProviderTest, AddOntoDirectoryIsAlreadyExists) {
    fs::create_directories(root / "dir");
    EXPECT_EQ(kindOf([&] { add("dir", "x", true); }), ErrorKind::AlreadyExists);
}

TEST_F(LocalDiskProviderTest, EmptyContentIsAllowed) {
    add("empty.bin", "");
    EXPECT_TRUE(provider->exists("empty.bin"));
    EXPECT_EQ(readAll("empty.bin"), "");
}

TEST_F(LocalDiskProviderTest, ExistsOnlyForFiles) {
    add("d/file.txt", "x");
    EXPECT_TRUE(provider->exists("d/file.txt"));
    EXPECT_FALSE(provider->exists("d"));
    EXPECT_FALSE(provider->exists("d/missing.txt"));
    EXPECT_FALSE(provider->exists("d/file.txt/below"));
}

TEST_F(LocalDiskProviderTest, ListFoldersThenFiles) {
    add("top/z.txt", "z");
    add("top/sub/inner.txt", "i");
    add("top/a.txt", "a");

    const auto items = provider->list("top");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_TRUE(items[0]->isFolder());
    EXPECT_EQ(items[0]->name, "sub");
    EXPECT_FALSE(items[1]->isFolder());
    EXPECT_FALSE(items[2]->isFolder());
}

TEST_F(LocalDiskProviderTest, ListMissingOrFileIsNotFound) {
    add("file.txt", "x");
    EXPECT_EQ(kindOf([&] { (void)provider->list("nope"); }), ErrorKind::NotFound);
    EXPECT_EQ(kindOf([&] { (void)provider->list("file.txt"); }), ErrorKind::NotFound);
}

TEST_F(LocalDiskProviderTest, RemoveFileAndDirectoryRecursively) {
    add("keep.txt", "k");
    add("tree/a/b.txt", "b");
    add("tree/c.txt", "c");

    provider->remove("keep.txt");
    EXPECT_FALSE(fs::exists(root / "keep.txt"));

    provider->remove("tree");
    EXPECT_FALSE(fs::exists(root / "tree"));
}

TEST_F(LocalDiskProviderTest, RemoveMissingIsNotFound) {
    EXPECT_EQ(kindOf([&] { provider->remove("ghost.txt"); }), ErrorKind::NotFound);
}

TEST_F(LocalDiskProviderTest, ReadMissingIsNotFoundWithCallerPath) {
    try {
        (void)provider->read("missing/file.txt");
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
        EXPECT_EQ(e.path(), "missing/file.txt");
    }
}

TEST_F(LocalDiskProviderTest, BlankPathIsInvalidArgument) {
    EXPECT_EQ(kindOf([&] { (void)provider->exists(""); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kindOf([&] { add("   ", "x"); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kindOf([&] { provider->remove(""); }), ErrorKind::InvalidArgument);
}

TEST_F(LocalDiskProviderTest, DotDotCannotLeaveRoot) {
    const auto outside = root.parent_path() / (root.filename().string() + "_outside.txt");
    const auto escape = "../" + outside.filename().string();

    EXPECT_EQ(kindOf([&] { add(escape, "x", true); }), ErrorKind::InvalidArgument);
    EXPECT_FALSE(fs::exists(outside));

    EXPECT_EQ(kindOf([&] { add("a/../../" + outside.filename().string(), "x"); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kindOf([&] { provider->remove(".."); }), ErrorKind::InvalidArgument);
    EXPECT_TRUE(fs::is_directory(root));
    EXPECT_EQ(kindOf([&] { (void)provider->exists("../" + outside.filename().string()); }), ErrorKind::InvalidArgument);
}

TEST_F(LocalDiskProviderTest, DotSegmentsInsideRootAreResolved) {
    add("a/../b/./c.txt", "c");
    EXPECT_TRUE(fs::is_regular_file(root / "b/c.txt"));
    EXPECT_TRUE(provider->exists("b/c.txt"));
    EXPECT_EQ(provider->resolvePath("/b/c.txt").string(), (root.lexically_normal() / "b/c.txt").string());
}

TEST_F(LocalDiskProviderTest, ReadStreamIsOwnedByCaller) {
    add("s.txt", "stream me");
    auto in = provider->read("s.txt");
    ASSERT_TRUE(in);
    std::string word;
    *in >> word;
    EXPECT_EQ(word, "stream");
}

TEST(LocalDiskProviderNoRootTest, PathsAreUsedAsIs) {
    const LocalDiskProvider provider;
    const auto file = fs::temp_directory_path() / ("unistore_noroot_" + std::to_string(::getpid()) + ".txt");
    std::istringstream in("abc");
    EXPECT_EQ(provider.add(file.string(), in), file.string());
    EXPECT_TRUE(provider.exists(file.string()));
    provider.remove(file.string());
    EXPECT_FALSE(fs::exists(file));
}
